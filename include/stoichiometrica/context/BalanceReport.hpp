/// @file BalanceReport.hpp
/// @brief Element and mass balance summary of a reaction

#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace Stoichiometrica {

struct BalanceReport {
    bool isBalanced = false;
    std::map<std::string, double> elementBalance;       ///< Products minus reactants
    std::map<std::string, double> balancedElements;
    std::map<std::string, double> unbalancedElements;
    double massBalance = 0.0;                           ///< Product minus reactant mass [g]
    bool massBalanced = false;
    double totalReactantMass = 0.0;
    double totalProductMass = 0.0;
    double chargeBalance = 0.0;
    std::size_t numReactants = 0;                       ///< Catalysts excluded
    std::size_t numProducts = 0;
    std::size_t numCatalysts = 0;
};

} // namespace Stoichiometrica
