/// @file IBalancer.hpp
/// @brief Interface for stoichiometric balancing strategies

#pragma once

#include <cstddef>
#include <vector>

namespace Stoichiometrica {

class Reaction;

/// @brief Integer coefficients found by a balancer
struct BalanceSolution {
    std::vector<long long> reactantCoefficients;  ///< Non-catalyst reactants, in order
    std::vector<long long> productCoefficients;
    int rank = 0;                                 ///< Rank of the stoichiometric matrix
    int nullity = 0;                              ///< Dimension of its null space
    double residual = 0.0;                        ///< max |M x| after rationalization
};

/// @brief Abstract interface for balancers
/// @details Implementations never modify the reaction; Reaction::balance()
/// applies the returned coefficients.
class IBalancer {
public:
    virtual ~IBalancer() = default;

    /// @brief Find the minimal positive integer coefficients
    /// @param reaction Reaction to balance (catalysts ignored)
    /// @return Coefficients for reactants and products
    /// @throws BalancingError if atoms cannot be conserved
    virtual BalanceSolution solve(const Reaction& reaction) const = 0;

    /// @brief Get human-readable balancer name
    virtual const char* getBalancerName() const = 0;
};

} // namespace Stoichiometrica
