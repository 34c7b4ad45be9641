#pragma once

#include <string>
#include <utility>

namespace Stoichiometrica {
namespace Constants {

// System limits
constexpr int kNumElementsPT = 118;               // Periodic table elements
constexpr int kNumTolerances = 8;                 // Number of tolerance values
constexpr long long kMaxDenominator = 10000;      // Rational reconstruction bound
constexpr long long kMaxCoefficient = 1000000000; // Largest integer coefficient accepted

// Confidence weights for the standard rule set
constexpr double kConfidenceCombustion = 0.95;
constexpr double kConfidenceAcidBase = 0.90;
constexpr double kConfidencePrecipitation = 0.85;
constexpr double kConfidenceHydrolysis = 0.85;
constexpr double kConfidenceSingleReplacement = 0.80;
constexpr double kConfidenceDoubleReplacement = 0.80;
constexpr double kConfidenceSynthesis = 0.90;
constexpr double kConfidenceDecomposition = 0.90;
constexpr double kConfidenceIsomerization = 0.95;

// Classifier blending
constexpr double kRedoxConfidence = 0.95;
constexpr double kRedoxStructuralPenalty = 0.5;
constexpr double kCoarseTypeBaseline = 0.8;

// Label used for the charge row of the stoichiometric matrix
constexpr const char* kChargeRowLabel = "e-";

// Physical phase of a species
enum class Phase {
    None = 0,
    Solid,
    Liquid,
    Gas,
    Aqueous
};

// Phase suffixes as written in equations, e.g. "NaCl(aq)"
constexpr const char* kPhaseNames[] = {
    "",
    "s",
    "l",
    "g",
    "aq"
};

constexpr int kNumPhases = 5;

inline const char* getPhaseName(Phase phase) {
    return kPhaseNames[static_cast<int>(phase)];
}

// Look up a phase by suffix; second is false for unknown names
inline std::pair<Phase, bool> parsePhaseName(const std::string& name) {
    for (int i = 0; i < kNumPhases; ++i) {
        if (name == kPhaseNames[i]) {
            return {static_cast<Phase>(i), true};
        }
    }
    return {Phase::None, false};
}

// Reaction type identifiers
namespace ReactionType {
constexpr const char* kCombustion = "combustion";
constexpr const char* kAcidBase = "acid_base";
constexpr const char* kHydrolysis = "hydrolysis";
constexpr const char* kPrecipitation = "precipitation";
constexpr const char* kRedox = "redox";
constexpr const char* kSingleReplacement = "single_replacement";
constexpr const char* kDoubleReplacement = "double_replacement";
constexpr const char* kIsomerization = "isomerization";
constexpr const char* kSynthesis = "synthesis";
constexpr const char* kDecomposition = "decomposition";
constexpr const char* kUnknown = "unknown";
} // namespace ReactionType

// Tie-break order for equal confidence scores (first wins)
constexpr const char* kTypePriority[] = {
    ReactionType::kCombustion,
    ReactionType::kAcidBase,
    ReactionType::kHydrolysis,
    ReactionType::kPrecipitation,
    ReactionType::kRedox,
    ReactionType::kSingleReplacement,
    ReactionType::kDoubleReplacement,
    ReactionType::kIsomerization,
    ReactionType::kSynthesis,
    ReactionType::kDecomposition,
    ReactionType::kUnknown
};

constexpr int kNumReactionTypes = 11;

} // namespace Constants
} // namespace Stoichiometrica
