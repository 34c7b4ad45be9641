#include "stoichiometrica/analysis/StoichiometryCalculator.hpp"
#include "stoichiometrica/model/Reaction.hpp"
#include "stoichiometrica/util/ErrorCodes.hpp"
#include <cmath>
#include <limits>

namespace Stoichiometrica {
namespace StoichiometryCalculator {

std::pair<double, int> calculateAtomEconomy(const Reaction& reaction) {
    const std::vector<ReactionComponent>& products = reaction.getProducts();
    if (products.empty()) {
        return {0.0, ErrorCode::kNoProducts};
    }

    double total = reaction.getProductMass();
    if (total <= 0.0) {
        return {0.0, ErrorCode::kZeroMolecularWeight};
    }

    const ReactionComponent& desired = products.front();
    return {100.0 * desired.coefficient * desired.molecule->molecularWeight() / total,
            ErrorCode::kSuccess};
}

std::pair<double, int> calculateMassBalanceError(const Reaction& reaction) {
    double reactantMass = reaction.getReactantMass();
    if (reactantMass <= 0.0) {
        return {0.0, ErrorCode::kZeroMolecularWeight};
    }
    return {100.0 * std::abs(reaction.getProductMass() - reactantMass) / reactantMass,
            ErrorCode::kSuccess};
}

std::pair<std::string, int> findLimitingReactant(const Reaction& reaction,
                                                 const SpeciesAmounts& amounts) {
    std::string limiting;
    double smallest = std::numeric_limits<double>::infinity();

    for (const auto& r : reaction.getReactants(false)) {
        const std::string label = r.molecule->label();
        auto it = amounts.find(label);
        if (it == amounts.end()) {
            return {label, ErrorCode::kMissingAmount};
        }
        double extent = it->second / r.coefficient;
        if (extent < smallest) {
            smallest = extent;
            limiting = label;
        }
    }

    if (limiting.empty()) {
        return {"", ErrorCode::kNoLimitingReactant};
    }
    return {limiting, ErrorCode::kSuccess};
}

std::pair<SpeciesAmounts, int> calculateTheoreticalYield(const Reaction& reaction,
                                                         const std::string& limitingReactant,
                                                         const SpeciesAmounts& amounts) {
    SpeciesAmounts yields;
    if (!reaction.isBalanced()) {
        return {yields, ErrorCode::kReactionNotBalanced};
    }

    double limitingCoefficient = 0.0;
    for (const auto& r : reaction.getReactants(false)) {
        if (r.molecule->label() == limitingReactant) {
            limitingCoefficient = r.coefficient;
            break;
        }
    }
    if (limitingCoefficient <= 0.0) {
        return {yields, ErrorCode::kSpeciesNotFound};
    }

    auto amount = amounts.find(limitingReactant);
    if (amount == amounts.end()) {
        return {yields, ErrorCode::kMissingAmount};
    }

    for (const auto& p : reaction.getProducts()) {
        yields[p.molecule->label()] += amount->second * p.coefficient / limitingCoefficient;
    }
    return {yields, ErrorCode::kSuccess};
}

std::pair<SpeciesAmounts, int> calculateTheoreticalYield(const Reaction& reaction,
                                                         const SpeciesAmounts& amounts) {
    std::pair<std::string, int> limiting = findLimitingReactant(reaction, amounts);
    if (limiting.second != ErrorCode::kSuccess) {
        return {SpeciesAmounts(), limiting.second};
    }
    return calculateTheoreticalYield(reaction, limiting.first, amounts);
}

std::pair<double, int> calculateReactionQuotient(const Reaction& reaction,
                                                 const SpeciesAmounts& concentrations) {
    if (!reaction.isBalanced()) {
        return {0.0, ErrorCode::kReactionNotBalanced};
    }

    double numerator = 1.0;
    for (const auto& p : reaction.getProducts()) {
        auto it = concentrations.find(p.molecule->label());
        if (it == concentrations.end()) {
            return {0.0, ErrorCode::kMissingConcentration};
        }
        numerator *= std::pow(it->second, p.coefficient);
    }

    double denominator = 1.0;
    for (const auto& r : reaction.getReactants(false)) {
        auto it = concentrations.find(r.molecule->label());
        if (it == concentrations.end()) {
            return {0.0, ErrorCode::kMissingConcentration};
        }
        denominator *= std::pow(it->second, r.coefficient);
    }

    if (denominator == 0.0) {
        return {std::numeric_limits<double>::infinity(), ErrorCode::kSuccess};
    }
    return {numerator / denominator, ErrorCode::kSuccess};
}

} // namespace StoichiometryCalculator
} // namespace Stoichiometrica
