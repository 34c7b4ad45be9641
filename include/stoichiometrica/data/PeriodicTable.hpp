/// @file PeriodicTable.hpp
/// @brief Element symbols and standard atomic weights

#pragma once

#include <string>

namespace Stoichiometrica {
namespace PeriodicTable {

/// @brief Get atomic number from element symbol
/// @param symbol Element symbol, case sensitive ("Fe", not "FE")
/// @return Atomic number (1-118), or -1 if not found
int getAtomicNumber(const std::string& symbol);

/// @brief Get element symbol from atomic number
/// @param atomicNumber Atomic number (1-118)
/// @return Element symbol, empty string if out of range
std::string getElementSymbol(int atomicNumber);

/// @brief Check whether a symbol names a real element
bool isElement(const std::string& symbol);

/// @brief Standard atomic weight [g/mol]
/// @param symbol Element symbol
/// @return Atomic weight, 0.0 if the symbol is unknown
double getAtomicWeight(const std::string& symbol);

} // namespace PeriodicTable
} // namespace Stoichiometrica
