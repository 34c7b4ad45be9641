/// @file IReactionRule.hpp
/// @brief Interface for reaction-type rules of the expert system
/// @details A rule is a named predicate over a Reaction with a confidence
/// weight. The rule name is the reaction type it votes for.

#pragma once

namespace Stoichiometrica {

class Reaction;

/// @brief Abstract interface for classification rules
class IReactionRule {
public:
    virtual ~IReactionRule() = default;

    /// @brief Evaluate the rule
    /// @param reaction Reaction under classification (catalysts to be ignored)
    /// @return true if the reaction has this rule's pattern
    /// @note May throw; the engine records the failure and treats it as no match
    virtual bool matches(const Reaction& reaction) const = 0;

    /// @brief Reaction type this rule votes for
    virtual const char* getRuleName() const = 0;

    /// @brief Confidence in [0, 1] when the rule matches
    virtual double getConfidence() const = 0;
};

} // namespace Stoichiometrica
