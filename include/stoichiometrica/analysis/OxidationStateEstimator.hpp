/// @file OxidationStateEstimator.hpp
/// @brief Rule-based oxidation number assignment
/// @details Rules run in order and each only fills elements that are still
/// unassigned:
///   0. neutral single-element substances are 0
///   1. F is -1
///   2. O is -2, or -1 when the formula contains "O2" (peroxide proxy)
///   3. H is +1, or -1 in a hydride made of H and listed metals only
///   4. in a binary compound the more electronegative element takes its
///      most negative common oxidation state
///   5. monatomic ions take charge / count; otherwise one remaining
///      element is solved from the charge balance
/// With two or more elements left after rule 4 nothing more is guessed.

#pragma once

#include "stoichiometrica/context/AnalysisResults.hpp"
#include "stoichiometrica/context/ReactionComponent.hpp"
#include "stoichiometrica/data/ReferenceData.hpp"
#include "stoichiometrica/interfaces/IMoleculeComposition.hpp"
#include <vector>

namespace Stoichiometrica {

class OxidationStateEstimator {
public:
    explicit OxidationStateEstimator(const ReferenceData& data = ReferenceData::standard())
        : data_(data) {}

    /// @brief Oxidation numbers of one molecule
    /// @return Assigned elements only
    OxidationStates estimate(const IMoleculeComposition& molecule) const;

    /// @brief Side averages weighted by coefficient x atom count
    /// @details Unassigned occurrences do not contribute; catalysts are skipped
    OxidationStates sideAverages(const std::vector<ReactionComponent>& components) const;

private:
    const ReferenceData& data_;
};

} // namespace Stoichiometrica
