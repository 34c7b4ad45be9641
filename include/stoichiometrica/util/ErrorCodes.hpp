#pragma once

namespace Stoichiometrica {
namespace ErrorCode {

// Success
constexpr int kSuccess = 0;

// Input validation errors (1-9)
constexpr int kNonPositiveCoefficient = 1;
constexpr int kEmptyFormula = 2;
constexpr int kMalformedFormula = 3;
constexpr int kUnknownElement = 4;
constexpr int kMalformedEquation = 5;
constexpr int kUnknownPhase = 6;
constexpr int kInvalidScaleFactor = 7;
constexpr int kInvalidRecord = 8;
constexpr int kPhaseCountMismatch = 9;

// Balancing errors (10-19)
constexpr int kNoReactants = 10;
constexpr int kNoProducts = 11;
constexpr int kElementNotConserved = 12;
constexpr int kNoNullSpace = 13;
constexpr int kDegenerateNullSpace = 14;
constexpr int kCoefficientOverflow = 15;
constexpr int kVerificationFailed = 16;

// Stoichiometry errors (20-29)
constexpr int kReactionNotBalanced = 20;
constexpr int kNoLimitingReactant = 21;
constexpr int kMissingAmount = 22;
constexpr int kZeroMolecularWeight = 23;
constexpr int kMissingConcentration = 24;
constexpr int kSpeciesNotFound = 25;

// Classification errors (30-39), never thrown to callers
constexpr int kRuleEvaluationFailed = 30;
constexpr int kClassificationFailed = 31;

// Get error message string
inline const char* getMessage(int code) {
    switch (code) {
        case kSuccess: return "Success";
        case kNonPositiveCoefficient: return "Coefficient must be positive";
        case kEmptyFormula: return "Empty formula";
        case kMalformedFormula: return "Malformed formula";
        case kUnknownElement: return "Unknown element symbol";
        case kMalformedEquation: return "Malformed equation";
        case kUnknownPhase: return "Unknown phase";
        case kInvalidScaleFactor: return "Scale factor must be positive";
        case kInvalidRecord: return "Invalid reaction record";
        case kPhaseCountMismatch: return "Phase list does not match component count";
        case kNoReactants: return "Reaction has no reactants";
        case kNoProducts: return "Reaction has no products";
        case kElementNotConserved: return "Element appears on only one side";
        case kNoNullSpace: return "Stoichiometric matrix has no null space";
        case kDegenerateNullSpace: return "Null space vector has mixed signs";
        case kCoefficientOverflow: return "Balancing coefficients out of range";
        case kVerificationFailed: return "Balanced coefficients do not conserve atoms";
        case kReactionNotBalanced: return "Reaction is not balanced";
        case kNoLimitingReactant: return "No limiting reactant could be determined";
        case kMissingAmount: return "Missing reactant amount";
        case kZeroMolecularWeight: return "Molecular weight is zero";
        case kMissingConcentration: return "Missing species concentration";
        case kSpeciesNotFound: return "Species not found in reaction";
        case kRuleEvaluationFailed: return "Rule evaluation failed";
        case kClassificationFailed: return "Classification failed";
        default: return "Unknown error";
    }
}

} // namespace ErrorCode
} // namespace Stoichiometrica
