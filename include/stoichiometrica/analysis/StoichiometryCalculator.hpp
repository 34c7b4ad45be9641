/// @file StoichiometryCalculator.hpp
/// @brief Quantitative helpers over a (balanced) reaction
/// @details Species are identified by IMoleculeComposition::label()
/// ("H2O", "Fe^3+"). Catalysts never take part. Results are returned as
/// (value, info) pairs where info is ErrorCode::kSuccess or the reason the
/// value could not be computed.

#pragma once

#include <map>
#include <string>
#include <utility>

namespace Stoichiometrica {

class Reaction;

namespace StoichiometryCalculator {

/// Species label -> moles (or mol/L for concentrations)
using SpeciesAmounts = std::map<std::string, double>;

/// Atom economy of the first product [%]
/// @return (percent, info); info=kNoProducts or kZeroMolecularWeight on failure
std::pair<double, int> calculateAtomEconomy(const Reaction& reaction);

/// |product mass - reactant mass| / reactant mass [%]
/// @return (percent, info); info=kZeroMolecularWeight when there is no reactant mass
std::pair<double, int> calculateMassBalanceError(const Reaction& reaction);

/// Reactant with the smallest amount / coefficient
/// @param amounts Reactant amounts [mol]
/// @return (label, info); info=kMissingAmount or kNoLimitingReactant on failure
std::pair<std::string, int> findLimitingReactant(const Reaction& reaction,
                                                 const SpeciesAmounts& amounts);

/// Product moles formed when the limiting reactant is consumed
/// @param limitingReactant Label of the limiting reactant
/// @param amounts Reactant amounts [mol]
/// @return (product label -> moles, info); info=kReactionNotBalanced,
/// kSpeciesNotFound or kMissingAmount on failure
std::pair<SpeciesAmounts, int> calculateTheoreticalYield(const Reaction& reaction,
                                                         const std::string& limitingReactant,
                                                         const SpeciesAmounts& amounts);

/// Theoretical yield with the limiting reactant determined from amounts
std::pair<SpeciesAmounts, int> calculateTheoreticalYield(const Reaction& reaction,
                                                         const SpeciesAmounts& amounts);

/// Q = prod [products]^coef / prod [reactants]^coef
/// @param concentrations Species concentrations [mol/L]
/// @return (Q, info); info=kReactionNotBalanced or kMissingConcentration on failure.
/// A zero reactant concentration gives +infinity.
std::pair<double, int> calculateReactionQuotient(const Reaction& reaction,
                                                 const SpeciesAmounts& concentrations);

} // namespace StoichiometryCalculator
} // namespace Stoichiometrica
