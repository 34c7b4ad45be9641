/// @file StandardRules.hpp
/// @brief Built-in reaction-type rules and shared pattern tests
/// @details All rules look at non-catalyst participants only.

#pragma once

#include "stoichiometrica/analysis/FunctionalGroupAnalyzer.hpp"
#include "stoichiometrica/context/ReactionComponent.hpp"
#include "stoichiometrica/data/ReferenceData.hpp"
#include "stoichiometrica/interfaces/IReactionRule.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Stoichiometrica {

class IMoleculeComposition;

namespace ReactionPatterns {

/// @brief A + BC -> AC + B by element-set overlap
bool isSingleReplacement(const std::vector<ReactionComponent>& reactants,
                         const std::vector<ReactionComponent>& products);

/// @brief AB + CD -> AD + CB: every reactant shares an element with every product
bool isDoubleReplacement(const std::vector<ReactionComponent>& reactants,
                         const std::vector<ReactionComponent>& products);

/// @brief Neutral species with this Hill formula is present
bool hasNeutralSpecies(const std::vector<ReactionComponent>& components,
                       const std::string& hillFormula);

/// @brief A species with the same composition and charge is present
bool hasComposition(const std::vector<ReactionComponent>& components,
                    const IMoleculeComposition& molecule);

} // namespace ReactionPatterns

/// @brief Common base holding name and confidence
class ReactionRule : public IReactionRule {
public:
    ReactionRule(const std::string& name, double confidence)
        : name_(name), confidence_(confidence) {}

    const char* getRuleName() const override { return name_.c_str(); }
    double getConfidence() const override { return confidence_; }

protected:
    std::string name_;
    double confidence_;
};

/// @brief Hydrocarbon + O2 -> CO2 + H2O
class CombustionRule : public ReactionRule {
public:
    CombustionRule();
    bool matches(const Reaction& reaction) const override;
};

/// @brief Known acid + known base -> ... + H2O
class AcidBaseRule : public ReactionRule {
public:
    /// @throws ValidationError if an acid or base formula in data cannot be parsed
    explicit AcidBaseRule(const ReferenceData& data);
    bool matches(const Reaction& reaction) const override;

private:
    std::vector<std::shared_ptr<const IMoleculeComposition>> acids_;
    std::vector<std::shared_ptr<const IMoleculeComposition>> bases_;
};

/// @brief Aqueous reactants -> solid product
class PrecipitationRule : public ReactionRule {
public:
    PrecipitationRule();
    bool matches(const Reaction& reaction) const override;
};

/// @brief Ester + H2O -> acid + alcohol, by functional-group mechanism
class HydrolysisRule : public ReactionRule {
public:
    explicit HydrolysisRule(const ReferenceData& data);
    bool matches(const Reaction& reaction) const override;

private:
    FunctionalGroupAnalyzer groups_;
};

class SingleReplacementRule : public ReactionRule {
public:
    SingleReplacementRule();
    bool matches(const Reaction& reaction) const override;
};

class DoubleReplacementRule : public ReactionRule {
public:
    DoubleReplacementRule();
    bool matches(const Reaction& reaction) const override;
};

/// @brief Several reactants -> one product
class SynthesisRule : public ReactionRule {
public:
    SynthesisRule();
    bool matches(const Reaction& reaction) const override;
};

/// @brief One reactant -> several products
class DecompositionRule : public ReactionRule {
public:
    DecompositionRule();
    bool matches(const Reaction& reaction) const override;
};

/// @brief One species -> one species of identical composition
class IsomerizationRule : public ReactionRule {
public:
    IsomerizationRule();
    bool matches(const Reaction& reaction) const override;
};

/// @brief Rule from a callable, for custom types
class LambdaRule : public ReactionRule {
public:
    using Predicate = std::function<bool(const Reaction&)>;

    LambdaRule(const std::string& name, double confidence, Predicate predicate)
        : ReactionRule(name, confidence), predicate_(std::move(predicate)) {}

    bool matches(const Reaction& reaction) const override { return predicate_(reaction); }

private:
    Predicate predicate_;
};

} // namespace Stoichiometrica
