/// @file ReactionTypeClassifier.hpp
/// @brief Merges rule matches, electron transfer and the count cascade
/// @details Scoring:
/// 1. every matched rule scores its type (maximum per type);
/// 2. redox raises the redox score to the redox confidence and halves
///    synthesis and decomposition, which are structural descriptions of
///    what is really an electron transfer;
/// 3. the coarse type of the (reactants, products) count cascade is raised
///    to the coarse baseline;
/// 4. scores are clamped to [0, 1] and the argmax wins, ties resolved by
///    Constants::kTypePriority.
///
/// classify() never throws. A failing stage is logged and skipped, so the
/// worst outcome is the coarse type or "unknown".

#pragma once

#include "stoichiometrica/analysis/ElectronTransferAnalyzer.hpp"
#include "stoichiometrica/analysis/FunctionalGroupAnalyzer.hpp"
#include "stoichiometrica/analysis/ReactionFingerprinter.hpp"
#include "stoichiometrica/context/ClassificationResult.hpp"
#include "stoichiometrica/data/ReferenceData.hpp"
#include "stoichiometrica/rules/ExpertRuleEngine.hpp"
#include <map>
#include <string>

namespace Stoichiometrica {

class Reaction;

class ReactionTypeClassifier {
public:
    explicit ReactionTypeClassifier(const ReferenceData& data = ReferenceData::standard());

    /// @brief Full classification with per-stage diagnostics
    ClassificationResult classify(const Reaction& reaction) const;

    /// @brief Count cascade over non-catalyst participants
    /// @return isomerization, decomposition, synthesis, single_replacement,
    /// double_replacement or unknown
    static std::string coarseType(const Reaction& reaction);

    /// @brief Highest score, ties by type priority; "unknown" when empty
    static std::string selectPrimaryType(const std::map<std::string, double>& scores);

    /// @brief Rule registry, for adding custom rules
    ExpertRuleEngine& ruleEngine() { return rules_; }
    const ExpertRuleEngine& ruleEngine() const { return rules_; }

private:
    ExpertRuleEngine rules_;
    ElectronTransferAnalyzer electronTransfer_;
    FunctionalGroupAnalyzer functionalGroups_;
    ReactionFingerprinter fingerprinter_;
};

} // namespace Stoichiometrica
