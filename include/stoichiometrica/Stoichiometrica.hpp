#pragma once

#include "stoichiometrica/analysis/StoichiometryCalculator.hpp"
#include "stoichiometrica/context/BalanceReport.hpp"
#include "stoichiometrica/context/ClassificationResult.hpp"
#include "stoichiometrica/model/Reaction.hpp"
#include "stoichiometrica/util/Constants.hpp"
#include "stoichiometrica/util/ErrorCodes.hpp"
#include "stoichiometrica/util/Exceptions.hpp"
#include "stoichiometrica/util/Tolerances.hpp"

#include <string>
#include <vector>

namespace Stoichiometrica {

// ============================================================================
// Equation Functions
// ============================================================================

/// Parse an equation string ("2H2 + O2 -> 2H2O", "Fe^2+ + Ce^4+ → Fe^3+ + Ce^3+")
/// @throws ValidationError on malformed input
Reaction parseEquation(const std::string& equation);

/// Balanced copy of a reaction; the argument is left untouched
/// @throws BalancingError if no conserving coefficients exist
Reaction balanceReaction(const Reaction& reaction);

/// Parse, balance and render
/// @throws ValidationError, BalancingError
std::string balanceEquationString(const std::string& equation);

// ============================================================================
// Diagnostics
// ============================================================================

/// Element, charge and mass balance of the current coefficients
BalanceReport verifyBalance(const Reaction& reaction, double tolerance = 1.0e-6);

/// Hints for balancing by hand: unbalanced elements, most complex species,
/// element order from fewest to most species containing it
std::vector<std::string> suggestBalancingSteps(const Reaction& reaction);

/// Full type classification (never throws)
ClassificationResult analyzeReaction(const Reaction& reaction);

/// Print equation, balance and classification to stdout
void printResults(const Reaction& reaction);

// ============================================================================
// Utility Functions
// ============================================================================

/// Diagnostics level for std::cerr output (Diagnostics::kSilent, kWarnings, kDebug)
void setVerbosity(int level);

/// Get error message for error code
const char* getErrorMessage(int errorCode);

} // namespace Stoichiometrica
