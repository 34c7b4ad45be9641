/// @file ReactionFingerprint.hpp
/// @brief Comparable snapshot of a reaction's element, phase and charge deltas

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace Stoichiometrica {

struct ReactionFingerprint {
    std::map<std::string, double> reactantElements;   ///< Coefficient-weighted atom totals
    std::map<std::string, double> productElements;
    std::map<std::string, double> elementBalance;     ///< Products minus reactants
    std::map<std::string, std::string> reactantPhases;  ///< Formula -> phase name
    std::map<std::string, std::string> productPhases;
    std::map<std::string, std::pair<std::string, std::string>> phaseChanges;
    bool hasChargeTransfer = false;
    std::size_t reactantCount = 0;
    std::size_t productCount = 0;

    bool operator==(const ReactionFingerprint& other) const {
        return reactantElements == other.reactantElements &&
               productElements == other.productElements &&
               elementBalance == other.elementBalance &&
               reactantPhases == other.reactantPhases &&
               productPhases == other.productPhases &&
               phaseChanges == other.phaseChanges &&
               hasChargeTransfer == other.hasChargeTransfer &&
               reactantCount == other.reactantCount &&
               productCount == other.productCount;
    }

    bool operator!=(const ReactionFingerprint& other) const { return !(*this == other); }
};

} // namespace Stoichiometrica
