/// @file FunctionalGroupAnalyzer.hpp
/// @brief String-pattern functional group detection
/// @details Patterns from ReferenceData are matched against each
/// component's formula as written, weighted by coefficient. A group that
/// disappears or shrinks paired with a group that appears or grows is a
/// transformation; the first mechanism whose transformations are present
/// names the reaction mechanism. This is a formula heuristic, not a
/// structural analysis.

#pragma once

#include "stoichiometrica/context/AnalysisResults.hpp"
#include "stoichiometrica/context/ReactionComponent.hpp"
#include "stoichiometrica/data/ReferenceData.hpp"
#include <map>
#include <string>
#include <vector>

namespace Stoichiometrica {

class Reaction;

class FunctionalGroupAnalyzer {
public:
    explicit FunctionalGroupAnalyzer(const ReferenceData& data = ReferenceData::standard())
        : data_(data) {}

    FunctionalGroupResult analyze(const Reaction& reaction) const;

    /// @brief Coefficient-weighted group counts of one side
    std::map<std::string, double> identifyGroups(const std::vector<ReactionComponent>& components) const;

    /// @brief Groups present in one molecule
    std::vector<std::string> groupsOf(const IMoleculeComposition& molecule) const;

    /// @brief First mechanism matching the transformations, or "unknown"
    std::string classifyMechanism(
        const std::vector<std::pair<std::string, std::string>>& transformations) const;

private:
    bool matches(const FunctionalGroupPattern& pattern, const IMoleculeComposition& molecule) const;

    const ReferenceData& data_;
};

} // namespace Stoichiometrica
