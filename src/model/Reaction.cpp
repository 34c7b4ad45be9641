/// @file Reaction.cpp
/// @brief Implementation of the reaction model

#include "stoichiometrica/model/Reaction.hpp"
#include "stoichiometrica/analysis/ReactionTypeClassifier.hpp"
#include "stoichiometrica/context/ClassificationResult.hpp"
#include "stoichiometrica/molecule/Molecule.hpp"
#include "stoichiometrica/solver/NullSpaceBalancer.hpp"
#include "stoichiometrica/solver/RationalApproximation.hpp"
#include "stoichiometrica/util/Diagnostics.hpp"
#include "stoichiometrica/util/Exceptions.hpp"
#include "stoichiometrica/util/Tolerances.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Stoichiometrica {

namespace {

const char* kArrow = "\xE2\x86\x92";      // →
const char* kEmptySide = "\xE2\x88\x85";  // ∅

// Largest fixed-point coefficient that llround can represent
constexpr double kMaxFixedPoint = 9.0e18;

std::string joinComponents(const std::vector<ReactionComponent>& components,
                           const std::string& separator) {
    std::string result;
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += components[i].toString();
    }
    return result;
}

std::string formatNumber(double value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

} // namespace

std::string ReactionComponent::toString() const {
    std::ostringstream os;
    if (coefficient != 1.0) {
        os << std::setprecision(3) << coefficient << " ";
    }
    os << molecule->label();
    Constants::Phase p = effectivePhase();
    if (p != Constants::Phase::None) {
        os << "(" << Constants::getPhaseName(p) << ")";
    }
    return os.str();
}

Reaction::Reaction(const std::string& name) : name_(name) {}

// ============================================================================
// Population
// ============================================================================

void Reaction::checkCoefficient(double coefficient) {
    if (!(coefficient > 0.0) || !std::isfinite(coefficient)) {
        throw ValidationError(ErrorCode::kNonPositiveCoefficient, formatNumber(coefficient));
    }
}

Reaction& Reaction::addReactant(std::shared_ptr<const IMoleculeComposition> molecule,
                                double coefficient,
                                Constants::Phase phase,
                                bool isCatalyst) {
    if (!molecule) {
        throw ValidationError(ErrorCode::kEmptyFormula, "null molecule");
    }
    checkCoefficient(coefficient);

    ReactionComponent component;
    component.molecule = std::move(molecule);
    component.coefficient = coefficient;
    component.phase = phase;
    component.isCatalyst = isCatalyst;
    reactants_.push_back(std::move(component));
    invalidate();
    return *this;
}

Reaction& Reaction::addReactant(const std::string& formula,
                                double coefficient,
                                Constants::Phase phase,
                                bool isCatalyst) {
    return addReactant(Molecule::fromFormula(formula), coefficient, phase, isCatalyst);
}

Reaction& Reaction::addProduct(std::shared_ptr<const IMoleculeComposition> molecule,
                               double coefficient,
                               Constants::Phase phase) {
    if (!molecule) {
        throw ValidationError(ErrorCode::kEmptyFormula, "null molecule");
    }
    checkCoefficient(coefficient);

    ReactionComponent component;
    component.molecule = std::move(molecule);
    component.coefficient = coefficient;
    component.phase = phase;
    products_.push_back(std::move(component));
    invalidate();
    return *this;
}

Reaction& Reaction::addProduct(const std::string& formula,
                               double coefficient,
                               Constants::Phase phase) {
    return addProduct(Molecule::fromFormula(formula), coefficient, phase);
}

Reaction& Reaction::addCatalyst(const std::string& formula, Constants::Phase phase) {
    return addReactant(formula, 1.0, phase, true);
}

// ============================================================================
// Components
// ============================================================================

std::vector<ReactionComponent> Reaction::getReactants(bool includeCatalysts) const {
    if (includeCatalysts) {
        return reactants_;
    }
    std::vector<ReactionComponent> result;
    for (const auto& r : reactants_) {
        if (!r.isCatalyst) {
            result.push_back(r);
        }
    }
    return result;
}

std::vector<ReactionComponent> Reaction::getCatalysts() const {
    std::vector<ReactionComponent> result;
    for (const auto& r : reactants_) {
        if (r.isCatalyst) {
            result.push_back(r);
        }
    }
    return result;
}

std::size_t Reaction::numReactants() const {
    std::size_t n = 0;
    for (const auto& r : reactants_) {
        if (!r.isCatalyst) {
            ++n;
        }
    }
    return n;
}

void Reaction::setCoefficients(const std::vector<double>& reactantCoefficients,
                               const std::vector<double>& productCoefficients) {
    if (reactantCoefficients.size() != numReactants() ||
        productCoefficients.size() != products_.size()) {
        throw ValidationError(ErrorCode::kNonPositiveCoefficient,
                              "coefficient count does not match component count");
    }
    for (double c : reactantCoefficients) {
        checkCoefficient(c);
    }
    for (double c : productCoefficients) {
        checkCoefficient(c);
    }

    std::size_t k = 0;
    for (auto& r : reactants_) {
        if (!r.isCatalyst) {
            r.coefficient = reactantCoefficients[k++];
        }
    }
    for (std::size_t i = 0; i < products_.size(); ++i) {
        products_[i].coefficient = productCoefficients[i];
    }
    invalidate();
}

Reaction& Reaction::setPhases(const std::vector<Constants::Phase>& reactantPhases,
                              const std::vector<Constants::Phase>& productPhases) {
    if (!reactantPhases.empty() && reactantPhases.size() != reactants_.size()) {
        throw ValidationError(ErrorCode::kPhaseCountMismatch,
                              "expected " + std::to_string(reactants_.size()) + " reactant phases");
    }
    if (!productPhases.empty() && productPhases.size() != products_.size()) {
        throw ValidationError(ErrorCode::kPhaseCountMismatch,
                              "expected " + std::to_string(products_.size()) + " product phases");
    }

    for (std::size_t i = 0; i < reactantPhases.size(); ++i) {
        reactants_[i].phase = reactantPhases[i];
    }
    for (std::size_t i = 0; i < productPhases.size(); ++i) {
        products_[i].phase = productPhases[i];
    }
    invalidate();
    return *this;
}

Reaction& Reaction::setAllPhases(Constants::Phase reactantPhase, Constants::Phase productPhase) {
    for (auto& r : reactants_) {
        r.phase = reactantPhase;
    }
    for (auto& p : products_) {
        p.phase = productPhase;
    }
    invalidate();
    return *this;
}

// ============================================================================
// Balance
// ============================================================================

const std::map<std::string, double>& Reaction::getElementBalance() const {
    if (elementBalanceValid_ && elementBalanceRevision_ == revision_) {
        return elementBalance_;
    }

    elementBalance_.clear();
    for (const auto& r : reactants_) {
        if (r.isCatalyst) {
            continue;
        }
        for (const auto& entry : r.molecule->elements()) {
            elementBalance_[entry.first] -= entry.second * r.coefficient;
        }
    }
    for (const auto& p : products_) {
        for (const auto& entry : p.molecule->elements()) {
            elementBalance_[entry.first] += entry.second * p.coefficient;
        }
    }

    elementBalanceRevision_ = revision_;
    elementBalanceValid_ = true;
    return elementBalance_;
}

std::map<std::string, double> Reaction::getUnbalancedElements(double tolerance) const {
    std::map<std::string, double> unbalanced;
    for (const auto& entry : getElementBalance()) {
        if (std::abs(entry.second) > tolerance) {
            unbalanced.insert(entry);
        }
    }
    return unbalanced;
}

double Reaction::getChargeBalance() const {
    double net = 0.0;
    for (const auto& r : reactants_) {
        if (!r.isCatalyst) {
            net -= r.molecule->charge() * r.coefficient;
        }
    }
    for (const auto& p : products_) {
        net += p.molecule->charge() * p.coefficient;
    }
    return net;
}

bool Reaction::isBalanced(double tolerance) const {
    for (const auto& entry : getElementBalance()) {
        if (std::abs(entry.second) > tolerance) {
            return false;
        }
    }
    return true;
}

double Reaction::getReactantMass() const {
    double mass = 0.0;
    for (const auto& r : reactants_) {
        if (!r.isCatalyst) {
            mass += r.molecule->molecularWeight() * r.coefficient;
        }
    }
    return mass;
}

double Reaction::getProductMass() const {
    double mass = 0.0;
    for (const auto& p : products_) {
        mass += p.molecule->molecularWeight() * p.coefficient;
    }
    return mass;
}

double Reaction::getMolecularWeightBalance() const {
    return getProductMass() - getReactantMass();
}

bool Reaction::balance() {
    NullSpaceBalancer balancer;
    return balance(balancer);
}

bool Reaction::balance(const IBalancer& balancer) {
    if (numReactants() == 0) {
        throw BalancingError(ErrorCode::kNoReactants, "");
    }
    if (products_.empty()) {
        throw BalancingError(ErrorCode::kNoProducts, "");
    }

    Tolerances tol;
    if (isBalanced(tol[kTolElementBalance]) &&
        std::abs(getChargeBalance()) <= tol[kTolElementBalance]) {
        // Keep the caller's ratios, only tidy them
        normalizeCoefficients();
        return true;
    }

    BalanceSolution solution = balancer.solve(*this);

    std::vector<double> reactantCoefficients(solution.reactantCoefficients.begin(),
                                             solution.reactantCoefficients.end());
    std::vector<double> productCoefficients(solution.productCoefficients.begin(),
                                            solution.productCoefficients.end());
    setCoefficients(reactantCoefficients, productCoefficients);

    return isBalanced(tol[kTolElementBalance]);
}

// ============================================================================
// Transformations
// ============================================================================

Reaction Reaction::reverse() const {
    Reaction reversed;
    if (!name_.empty()) {
        reversed.name_ = "Reverse of " + name_;
    }
    reversed.temperature_ = temperature_;
    reversed.pressure_ = pressure_;
    reversed.conditions_ = conditions_;

    for (const auto& p : products_) {
        reversed.reactants_.push_back(p);
    }
    for (const auto& r : reactants_) {
        if (r.isCatalyst) {
            reversed.reactants_.push_back(r);
        } else {
            reversed.products_.push_back(r);
        }
    }
    return reversed;
}

void Reaction::scaleCoefficients(double factor) {
    if (!(factor > 0.0) || !std::isfinite(factor)) {
        throw ValidationError(ErrorCode::kInvalidScaleFactor, formatNumber(factor));
    }
    for (auto& r : reactants_) {
        if (!r.isCatalyst) {
            r.coefficient *= factor;
        }
    }
    for (auto& p : products_) {
        p.coefficient *= factor;
    }
    invalidate();
}

void Reaction::normalizeCoefficients() {
    Tolerances tol;
    const double scale = tol[kTolNormalizeScale];

    std::vector<long long> scaled;
    auto toFixedPoint = [&scaled, scale](const ReactionComponent& c) {
        if (c.coefficient * scale > kMaxFixedPoint) {
            throw BalancingError(ErrorCode::kCoefficientOverflow,
                                 c.molecule->label() + " coefficient " + formatNumber(c.coefficient));
        }
        scaled.push_back(std::llround(c.coefficient * scale));
    };
    for (const auto& r : reactants_) {
        if (!r.isCatalyst) {
            toFixedPoint(r);
        }
    }
    for (const auto& p : products_) {
        toFixedPoint(p);
    }
    if (scaled.empty()) {
        return;
    }

    long long divisor = 0;
    for (long long v : scaled) {
        if (v <= 0) {
            if (Diagnostics::warningsEnabled()) {
                std::cerr << "[Reaction] coefficient below fixed-point resolution, "
                          << "normalization skipped\n";
            }
            return;
        }
        divisor = RationalApproximation::gcd(divisor, v);
    }

    std::size_t k = 0;
    for (auto& r : reactants_) {
        if (!r.isCatalyst) {
            r.coefficient = static_cast<double>(scaled[k++] / divisor);
        }
    }
    for (auto& p : products_) {
        p.coefficient = static_cast<double>(scaled[k++] / divisor);
    }
    invalidate();
}

// ============================================================================
// Classification
// ============================================================================

ClassificationResult Reaction::classification() const {
    if (!classification_ || classificationRevision_ != revision_) {
        static const ReactionTypeClassifier classifier;
        classification_ = std::make_shared<const ClassificationResult>(classifier.classify(*this));
        classificationRevision_ = revision_;
    }
    return *classification_;
}

std::string Reaction::type() const {
    return classification().primaryType;
}

// ============================================================================
// Metadata and conversion
// ============================================================================

void Reaction::setCondition(const std::string& key, const std::string& value) {
    for (auto& entry : conditions_) {
        if (entry.first == key) {
            entry.second = value;
            invalidate();
            return;
        }
    }
    conditions_.emplace_back(key, value);
    invalidate();
}

std::string Reaction::toString() const {
    if (empty()) {
        return "Empty reaction";
    }

    std::string reactantStr = joinComponents(getReactants(false), " + ");
    std::string productStr = joinComponents(products_, " + ");
    if (reactantStr.empty()) {
        reactantStr = kEmptySide;
    }
    if (productStr.empty()) {
        productStr = kEmptySide;
    }

    std::string equation = reactantStr + " " + kArrow + " " + productStr;

    std::vector<ReactionComponent> catalysts = getCatalysts();
    if (!catalysts.empty()) {
        equation += " [catalyst: " + joinComponents(catalysts, ", ") + "]";
    }

    std::vector<std::string> conditions;
    if (temperature_ != 0.0) {
        conditions.push_back("T=" + formatNumber(temperature_) + "K");
    }
    if (pressure_ != 0.0) {
        conditions.push_back("P=" + formatNumber(pressure_) + "atm");
    }
    for (const auto& entry : conditions_) {
        conditions.push_back(entry.first + "=" + entry.second);
    }
    if (!conditions.empty()) {
        equation += " [";
        for (std::size_t i = 0; i < conditions.size(); ++i) {
            if (i > 0) {
                equation += ", ";
            }
            equation += conditions[i];
        }
        equation += "]";
    }

    return equation;
}

ReactionRecord Reaction::toRecord() const {
    ReactionRecord record;
    record.name = name_;
    record.temperature = temperature_;
    record.pressure = pressure_;
    record.conditions = conditions_;
    record.balanced = isBalanced();

    for (const auto& r : reactants_) {
        ComponentRecord c;
        c.formula = r.molecule->sourceFormula();
        c.coefficient = r.coefficient;
        c.phase = Constants::getPhaseName(r.effectivePhase());
        c.isCatalyst = r.isCatalyst;
        record.reactants.push_back(c);
    }
    for (const auto& p : products_) {
        ComponentRecord c;
        c.formula = p.molecule->sourceFormula();
        c.coefficient = p.coefficient;
        c.phase = Constants::getPhaseName(p.effectivePhase());
        record.products.push_back(c);
    }
    return record;
}

Reaction Reaction::fromRecord(const ReactionRecord& record) {
    Reaction reaction(record.name);
    reaction.temperature_ = record.temperature;
    reaction.pressure_ = record.pressure;
    reaction.conditions_ = record.conditions;

    auto phaseOf = [](const std::string& name) {
        std::pair<Constants::Phase, bool> parsed = Constants::parsePhaseName(name);
        if (!parsed.second) {
            throw ValidationError(ErrorCode::kUnknownPhase, name);
        }
        return parsed.first;
    };

    for (const auto& c : record.reactants) {
        reaction.addReactant(c.formula, c.coefficient, phaseOf(c.phase), c.isCatalyst);
    }
    for (const auto& c : record.products) {
        if (c.isCatalyst) {
            throw ValidationError(ErrorCode::kInvalidRecord, "catalyst listed as product: " + c.formula);
        }
        reaction.addProduct(c.formula, c.coefficient, phaseOf(c.phase));
    }
    return reaction;
}

std::ostream& operator<<(std::ostream& os, const Reaction& reaction) {
    os << reaction.toString();
    return os;
}

} // namespace Stoichiometrica
