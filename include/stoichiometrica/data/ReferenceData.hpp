/// @file ReferenceData.hpp
/// @brief Chemical lookup tables used by the analyzers and rules
/// @details Electronegativities, common oxidation states, hydride-forming
/// metals, known acids and bases, functional-group patterns and the
/// transformation-to-mechanism table. The analyzers hold a const reference
/// to one instance; standard() is the process-wide default, and tests build
/// modified copies from makeStandard().

#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Stoichiometrica {

/// @brief Substring pattern for a functional group
struct FunctionalGroupPattern {
    std::string name;
    std::vector<std::string> anyOf;    ///< Formula must contain one of these
    std::vector<std::string> noneOf;   ///< ... and none of these
    std::string forbiddenPrefix;       ///< ... and must not start with this
    bool matchElements = false;        ///< anyOf are element symbols, not substrings
};

/// @brief Named mechanism recognised from group transformations
struct MechanismRule {
    std::string name;
    std::vector<std::pair<std::string, std::string>> transformations;
    bool requireAll = false;           ///< All pairs (true) or any pair (false)
};

struct ReferenceData {
    std::map<std::string, double> electronegativity;          ///< Pauling scale
    std::map<std::string, std::vector<int>> oxidationStates;  ///< Common states, ascending
    std::vector<std::string> hydrideMetals;
    std::vector<std::string> acids;    ///< Formulas, including "H^+"
    std::vector<std::string> bases;    ///< Formulas, including "OH^-"
    std::vector<FunctionalGroupPattern> functionalGroups;
    std::vector<MechanismRule> mechanisms;  ///< Checked in order

    /// @brief Electronegativity lookup
    /// @return (value, found)
    std::pair<double, bool> getElectronegativity(const std::string& symbol) const;

    /// @brief Most negative common oxidation state
    /// @return (state, found)
    std::pair<int, bool> getMinOxidationState(const std::string& symbol) const;

    bool isHydrideMetal(const std::string& symbol) const;

    /// @brief Build a fresh copy of the built-in tables
    static ReferenceData makeStandard();

    /// @brief Shared, immutable built-in tables
    static const ReferenceData& standard();
};

} // namespace Stoichiometrica
