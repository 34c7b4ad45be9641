/// @file AnalysisResults.hpp
/// @brief Result records of the individual reaction analyzers

#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Stoichiometrica {

/// Element symbol -> oxidation number
using OxidationStates = std::map<std::string, double>;

/// @brief Outcome of the electron-transfer analysis
struct ElectronTransferResult {
    OxidationStates reactantStates;                  ///< Side averages
    OxidationStates productStates;
    std::map<std::string, double> oxidationChanges;  ///< Element -> product minus reactant
    std::map<std::string, int> chargeChanges;        ///< Monatomic ion charge changes
    bool isRedox = false;
    bool fromIonicCharges = false;                   ///< Decided by the ionic-charge path
    std::string oxidizingAgent;                      ///< Empty when none
    std::string reducingAgent;
};

/// @brief Functional groups on both sides and what they turned into
struct FunctionalGroupResult {
    std::map<std::string, double> reactantGroups;    ///< Group -> coefficient-weighted count
    std::map<std::string, double> productGroups;
    std::vector<std::pair<std::string, std::string>> transformations;
    std::string mechanism = "unknown";
};

enum class RuleOutcome {
    Matched,
    NotMatched,
    Failed
};

/// @brief One rule applied to one reaction
struct RuleEvaluation {
    std::string type;
    double confidence = 0.0;
    RuleOutcome outcome = RuleOutcome::NotMatched;
    std::string message;  ///< Exception text when outcome is Failed
};

} // namespace Stoichiometrica
