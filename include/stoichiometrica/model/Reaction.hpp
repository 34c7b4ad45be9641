/// @file Reaction.hpp
/// @brief Chemical reaction model
/// @details Holds ordered reactant and product components plus optional
/// conditions, computes element/charge/mass balance, balances itself
/// through an IBalancer and exposes a cached type classification.
///
/// Usage:
/// @code
///   Reaction r;
///   r.addReactant("CH4").addReactant("O2").addProduct("CO2").addProduct("H2O");
///   r.balance();        // CH4 + 2 O2 -> CO2 + 2 H2O
///   r.type();           // "combustion"
/// @endcode
///
/// Every mutation increments revision(); cached balance and classification
/// data are tagged with the revision they were computed at. Concurrent const
/// calls on one instance are not synchronized.

#pragma once

#include "stoichiometrica/context/ReactionComponent.hpp"
#include "stoichiometrica/context/ReactionRecord.hpp"
#include "stoichiometrica/interfaces/IMoleculeComposition.hpp"
#include "stoichiometrica/util/Constants.hpp"
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Stoichiometrica {

class IBalancer;
struct ClassificationResult;

class Reaction {
public:
    Reaction() = default;
    explicit Reaction(const std::string& name);

    // ========================================================================
    // Population
    // ========================================================================

    /// @brief Add a reactant
    /// @param molecule Species composition
    /// @param coefficient Stoichiometric coefficient (> 0)
    /// @param phase Phase override, Phase::None keeps the molecule's phase
    /// @param isCatalyst Catalysts are rendered but excluded from balances
    /// @throws ValidationError if coefficient <= 0 or molecule is null
    Reaction& addReactant(std::shared_ptr<const IMoleculeComposition> molecule,
                          double coefficient = 1.0,
                          Constants::Phase phase = Constants::Phase::None,
                          bool isCatalyst = false);

    /// @brief Add a reactant parsed from a formula string
    Reaction& addReactant(const std::string& formula,
                          double coefficient = 1.0,
                          Constants::Phase phase = Constants::Phase::None,
                          bool isCatalyst = false);

    Reaction& addProduct(std::shared_ptr<const IMoleculeComposition> molecule,
                         double coefficient = 1.0,
                         Constants::Phase phase = Constants::Phase::None);

    Reaction& addProduct(const std::string& formula,
                         double coefficient = 1.0,
                         Constants::Phase phase = Constants::Phase::None);

    /// @brief Shorthand for addReactant(formula, 1, phase, true)
    Reaction& addCatalyst(const std::string& formula,
                          Constants::Phase phase = Constants::Phase::None);

    // ========================================================================
    // Components
    // ========================================================================

    std::vector<ReactionComponent> getReactants(bool includeCatalysts = true) const;
    const std::vector<ReactionComponent>& getProducts() const { return products_; }
    std::vector<ReactionComponent> getCatalysts() const;

    /// @brief Non-catalyst reactant count
    std::size_t numReactants() const;
    std::size_t numProducts() const { return products_.size(); }
    bool empty() const { return reactants_.empty() && products_.empty(); }

    /// @brief Set coefficients of non-catalyst reactants and of products
    /// @throws ValidationError on size mismatch or non-positive values
    void setCoefficients(const std::vector<double>& reactantCoefficients,
                         const std::vector<double>& productCoefficients);

    /// @brief Set a phase per component; an empty list leaves that side alone
    /// @details reactantPhases covers all reactants, catalysts included
    /// @throws ValidationError if a non-empty list has the wrong length
    Reaction& setPhases(const std::vector<Constants::Phase>& reactantPhases,
                        const std::vector<Constants::Phase>& productPhases);

    /// @brief Apply one phase to every reactant and one to every product
    Reaction& setAllPhases(Constants::Phase reactantPhase, Constants::Phase productPhase);

    // ========================================================================
    // Balance
    // ========================================================================

    /// @brief Net atoms per element, products minus reactants, catalysts excluded
    const std::map<std::string, double>& getElementBalance() const;

    /// @brief Elements whose net count exceeds tolerance
    std::map<std::string, double> getUnbalancedElements(double tolerance = 1.0e-6) const;

    /// @brief Net charge, products minus reactants
    double getChargeBalance() const;

    /// @brief All element balances within tolerance of zero
    bool isBalanced(double tolerance = 1.0e-6) const;

    /// @brief Product mass minus reactant mass [g per reaction unit]
    double getMolecularWeightBalance() const;

    double getReactantMass() const;
    double getProductMass() const;

    /// @brief Balance in place with the null-space balancer
    /// @return true when coefficients conserve every element
    /// @throws BalancingError if the equation cannot be balanced
    bool balance();

    /// @brief Balance in place with a given strategy
    bool balance(const IBalancer& balancer);

    // ========================================================================
    // Transformations
    // ========================================================================

    /// @brief Reverse reaction; catalysts stay on the reactant side
    Reaction reverse() const;

    /// @brief Multiply non-catalyst coefficients by factor
    /// @throws ValidationError if factor <= 0
    void scaleCoefficients(double factor);

    /// @brief Reduce coefficients to coprime integers
    /// @throws BalancingError if a coefficient is too large for fixed point
    void normalizeCoefficients();

    // ========================================================================
    // Classification
    // ========================================================================

    /// @brief Primary reaction type, never throws
    std::string type() const;

    /// @brief Full classification, cached until the next mutation
    ClassificationResult classification() const;

    // ========================================================================
    // Metadata and conversion
    // ========================================================================

    const std::string& getName() const { return name_; }
    void setName(const std::string& name) { name_ = name; invalidate(); }

    double getTemperature() const { return temperature_; }
    void setTemperature(double temperature) { temperature_ = temperature; invalidate(); }

    double getPressure() const { return pressure_; }
    void setPressure(double pressure) { pressure_ = pressure; invalidate(); }

    const std::vector<std::pair<std::string, std::string>>& getConditions() const { return conditions_; }

    /// @brief Set or replace a named condition, keeping insertion order
    void setCondition(const std::string& key, const std::string& value);

    /// @brief Mutation counter
    unsigned long revision() const { return revision_; }

    /// @brief Render "A + B → C [catalyst: X] [T=298.15K, P=1atm, k=v]"
    std::string toString() const;

    ReactionRecord toRecord() const;

    /// @throws ValidationError for unknown phases or unparseable formulas
    static Reaction fromRecord(const ReactionRecord& record);

private:
    void invalidate() { ++revision_; }
    static void checkCoefficient(double coefficient);

    std::vector<ReactionComponent> reactants_;
    std::vector<ReactionComponent> products_;

    std::string name_;
    double temperature_ = 0.0;
    double pressure_ = 0.0;
    std::vector<std::pair<std::string, std::string>> conditions_;

    unsigned long revision_ = 0;

    mutable std::map<std::string, double> elementBalance_;
    mutable unsigned long elementBalanceRevision_ = 0;
    mutable bool elementBalanceValid_ = false;

    mutable std::shared_ptr<const ClassificationResult> classification_;
    mutable unsigned long classificationRevision_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Reaction& reaction);

} // namespace Stoichiometrica
