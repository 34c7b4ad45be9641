/// @file ClassificationResult.hpp
/// @brief Merged reaction-type classification with its diagnostics

#pragma once

#include "stoichiometrica/context/AnalysisResults.hpp"
#include "stoichiometrica/context/ReactionFingerprint.hpp"
#include <map>
#include <string>
#include <vector>

namespace Stoichiometrica {

struct ClassificationResult {
    std::map<std::string, double> confidenceScores;  ///< Type -> [0, 1]
    std::string primaryType = "unknown";
    std::string coarseType = "unknown";              ///< Count-cascade fallback

    ElectronTransferResult electronTransfer;
    FunctionalGroupResult functionalGroups;
    std::vector<RuleEvaluation> ruleEvaluations;
    ReactionFingerprint fingerprint;

    /// @brief Confidence of one type, 0 if not scored
    double getConfidence(const std::string& type) const {
        auto it = confidenceScores.find(type);
        return (it != confidenceScores.end()) ? it->second : 0.0;
    }
};

} // namespace Stoichiometrica
