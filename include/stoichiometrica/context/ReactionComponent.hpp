/// @file ReactionComponent.hpp
/// @brief One species on one side of a reaction

#pragma once

#include "stoichiometrica/interfaces/IMoleculeComposition.hpp"
#include "stoichiometrica/util/Constants.hpp"
#include <memory>
#include <string>

namespace Stoichiometrica {

struct ReactionComponent {
    std::shared_ptr<const IMoleculeComposition> molecule;
    double coefficient = 1.0;
    Constants::Phase phase = Constants::Phase::None;  ///< Overrides the molecule's phase
    bool isCatalyst = false;

    /// @brief Component phase, falling back to the molecule's own phase
    Constants::Phase effectivePhase() const {
        if (phase != Constants::Phase::None) {
            return phase;
        }
        return molecule->phase();
    }

    /// @brief Render as "2 H2O(l)"; coefficient omitted when 1
    std::string toString() const;
};

} // namespace Stoichiometrica
