/// @file NullSpaceBalancer.hpp
/// @brief SVD null-space balancer with rational reconstruction
/// @details Solves M x = 0 for the signed stoichiometric matrix. The
/// balancing vector is the right singular vector of the smallest singular
/// value. It is sign-normalised, scaled so its smallest entry is 1,
/// rationalised with a bounded denominator, brought to coprime integers
/// and verified by substitution.

#pragma once

#include "stoichiometrica/interfaces/IBalancer.hpp"
#include "stoichiometrica/solver/StoichiometricMatrixBuilder.hpp"
#include "stoichiometrica/util/Tolerances.hpp"
#include <Eigen/Dense>
#include <vector>

namespace Stoichiometrica {

class NullSpaceBalancer : public IBalancer {
public:
    NullSpaceBalancer() = default;
    explicit NullSpaceBalancer(const Tolerances& tolerances) : tolerances_(tolerances) {}

    BalanceSolution solve(const Reaction& reaction) const override;

    /// @brief Solve a prepared matrix
    /// @throws BalancingError if no positive integer null vector is found
    BalanceSolution solveMatrix(const StoichiometricMatrix& stoich) const;

    const char* getBalancerName() const override { return "NullSpaceBalancer"; }

    Tolerances& tolerances() { return tolerances_; }
    const Tolerances& tolerances() const { return tolerances_; }

private:
    /// Sign-normalise and scale the raw null vector to a smallest entry of 1
    Eigen::VectorXd normalizeNullVector(const Eigen::VectorXd& raw,
                                        const StoichiometricMatrix& stoich) const;

    /// Convert to coprime integers through bounded-denominator fractions
    std::vector<long long> toIntegers(const Eigen::VectorXd& scaled,
                                      const StoichiometricMatrix& stoich) const;

    Tolerances tolerances_;
};

} // namespace Stoichiometrica
