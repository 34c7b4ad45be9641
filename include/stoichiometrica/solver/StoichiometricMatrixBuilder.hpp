/// @file StoichiometricMatrixBuilder.hpp
/// @brief Builds the signed element x species matrix of a reaction
/// @details Rows are elements in alphabetical order, followed by a charge
/// row labelled "e-" when any participant carries a charge. Columns are the
/// non-catalyst reactants followed by the products. Reactant columns are
/// negated so that a balancing vector is a strictly positive null vector.

#pragma once

#include "stoichiometrica/context/ReactionComponent.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <vector>

namespace Stoichiometrica {

class Reaction;

struct StoichiometricMatrix {
    Eigen::MatrixXd matrix;
    std::vector<std::string> rowLabels;     ///< Element symbols, then "e-" if present
    std::vector<std::string> columnLabels;  ///< Species labels
    std::size_t numReactants = 0;           ///< Leading columns that are reactants
    bool hasChargeRow = false;

    std::size_t numSpecies() const { return columnLabels.size(); }
    std::size_t numElements() const { return rowLabels.size() - (hasChargeRow ? 1 : 0); }
};

class StoichiometricMatrixBuilder {
public:
    /// @brief Matrix of a reaction's non-catalyst participants
    static StoichiometricMatrix build(const Reaction& reaction);

    /// @brief Matrix of explicit reactant and product lists
    static StoichiometricMatrix build(const std::vector<ReactionComponent>& reactants,
                                      const std::vector<ReactionComponent>& products);

    /// @brief Elements present on exactly one side
    /// @return Symbols sorted alphabetically, empty when every element is shared
    static std::vector<std::string> findUnconservedElements(
        const std::vector<ReactionComponent>& reactants,
        const std::vector<ReactionComponent>& products);
};

} // namespace Stoichiometrica
