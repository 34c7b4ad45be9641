/// @file ReactionRecord.hpp
/// @brief Plain-data snapshot of a Reaction for storage layers

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace Stoichiometrica {

struct ComponentRecord {
    std::string formula;       ///< As written, parseable by FormulaParser
    double coefficient = 1.0;
    std::string phase;         ///< "", "s", "l", "g" or "aq"
    bool isCatalyst = false;
};

struct ReactionRecord {
    std::string name;
    std::vector<ComponentRecord> reactants;
    std::vector<ComponentRecord> products;
    double temperature = 0.0;  ///< [K], 0 when unspecified
    double pressure = 0.0;     ///< [atm], 0 when unspecified
    std::vector<std::pair<std::string, std::string>> conditions;
    bool balanced = false;
};

} // namespace Stoichiometrica
