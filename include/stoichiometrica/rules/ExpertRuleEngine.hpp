/// @file ExpertRuleEngine.hpp
/// @brief Ordered registry of reaction-type rules
/// @details Every registered rule is evaluated independently against a
/// reaction; several rules may match. A rule that throws is recorded as
/// failed and treated as not matching.

#pragma once

#include "stoichiometrica/context/AnalysisResults.hpp"
#include "stoichiometrica/data/ReferenceData.hpp"
#include "stoichiometrica/interfaces/IReactionRule.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Stoichiometrica {

class Reaction;

class ExpertRuleEngine {
public:
    /// @brief Constructor - registers the standard rules
    explicit ExpertRuleEngine(const ReferenceData& data = ReferenceData::standard());

    ~ExpertRuleEngine() = default;

    /// @brief Append a rule (engine takes ownership)
    void registerRule(std::unique_ptr<IReactionRule> rule);

    /// @brief Remove every rule, including the standard ones
    void clearRules() { rules_.clear(); }

    std::size_t numRules() const { return rules_.size(); }

    /// @brief Rule names in evaluation order
    std::vector<std::string> getRuleNames() const;

    /// @brief Evaluate every rule in registration order
    std::vector<RuleEvaluation> evaluate(const Reaction& reaction) const;

    /// @brief Matched evaluations only
    std::vector<RuleEvaluation> getMatches(const Reaction& reaction) const;

private:
    /// Register the built-in rules (called by constructor)
    void registerStandardRules();

    const ReferenceData& data_;
    std::vector<std::unique_ptr<IReactionRule>> rules_;
};

} // namespace Stoichiometrica
