/// @file NullSpaceBalancer.cpp
/// @brief Implementation of the SVD null-space balancer

#include "stoichiometrica/solver/NullSpaceBalancer.hpp"
#include "stoichiometrica/model/Reaction.hpp"
#include "stoichiometrica/solver/RationalApproximation.hpp"
#include "stoichiometrica/util/Diagnostics.hpp"
#include "stoichiometrica/util/Exceptions.hpp"
#include <Eigen/SVD>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace Stoichiometrica {

BalanceSolution NullSpaceBalancer::solve(const Reaction& reaction) const {
    std::vector<ReactionComponent> reactants = reaction.getReactants(false);
    const std::vector<ReactionComponent>& products = reaction.getProducts();

    if (reactants.empty()) {
        throw BalancingError(ErrorCode::kNoReactants, "");
    }
    if (products.empty()) {
        throw BalancingError(ErrorCode::kNoProducts, "");
    }

    std::vector<std::string> missing =
        StoichiometricMatrixBuilder::findUnconservedElements(reactants, products);
    if (!missing.empty()) {
        std::string list;
        for (const auto& symbol : missing) {
            list += (list.empty() ? "" : ", ") + symbol;
        }
        throw BalancingError(ErrorCode::kElementNotConserved, list);
    }

    return solveMatrix(StoichiometricMatrixBuilder::build(reactants, products));
}

BalanceSolution NullSpaceBalancer::solveMatrix(const StoichiometricMatrix& stoich) const {
    const Eigen::MatrixXd& M = stoich.matrix;
    const int nCols = static_cast<int>(M.cols());

    if (nCols < 2) {
        throw BalancingError(ErrorCode::kNoNullSpace, "fewer than two species");
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(M, Eigen::ComputeFullV);
    const Eigen::VectorXd& sigma = svd.singularValues();

    // Numerical rank
    double sigmaMax = (sigma.size() > 0) ? sigma(0) : 0.0;
    int rank = 0;
    for (int i = 0; i < sigma.size(); ++i) {
        if (sigma(i) > tolerances_[kTolNullSpace] * std::max(1.0, sigmaMax)) {
            ++rank;
        }
    }
    const int nullity = nCols - rank;

    if (Diagnostics::debugEnabled()) {
        std::cerr << "[NullSpaceBalancer] Matrix (" << M.rows() << "x" << nCols << "):\n"
                  << M << "\n";
        std::cerr << "[NullSpaceBalancer] singular values: " << sigma.transpose()
                  << " rank=" << rank << " nullity=" << nullity << "\n";
    }

    if (nullity == 0) {
        throw BalancingError(ErrorCode::kNoNullSpace, "matrix has full column rank");
    }
    if (nullity > 1 && Diagnostics::warningsEnabled()) {
        std::cerr << "[NullSpaceBalancer] null space has dimension " << nullity
                  << ", balancing is not unique\n";
    }

    // Right singular vector of the smallest singular value
    Eigen::VectorXd raw = svd.matrixV().col(nCols - 1);
    Eigen::VectorXd scaled = normalizeNullVector(raw, stoich);
    std::vector<long long> coefficients = toIntegers(scaled, stoich);

    // Verify by substitution
    Eigen::VectorXd x(nCols);
    for (int j = 0; j < nCols; ++j) {
        x(j) = static_cast<double>(coefficients[j]);
    }
    double residual = (M * x).cwiseAbs().maxCoeff();
    if (residual > tolerances_[kTolVerification]) {
        throw BalancingError(ErrorCode::kVerificationFailed,
                             "residual " + std::to_string(residual));
    }

    BalanceSolution solution;
    solution.rank = rank;
    solution.nullity = nullity;
    solution.residual = residual;
    for (int j = 0; j < nCols; ++j) {
        if (static_cast<std::size_t>(j) < stoich.numReactants) {
            solution.reactantCoefficients.push_back(coefficients[j]);
        } else {
            solution.productCoefficients.push_back(coefficients[j]);
        }
    }

    if (Diagnostics::debugEnabled()) {
        std::cerr << "[NullSpaceBalancer] coefficients:";
        for (long long c : coefficients) {
            std::cerr << " " << c;
        }
        std::cerr << "\n";
    }

    return solution;
}

Eigen::VectorXd NullSpaceBalancer::normalizeNullVector(const Eigen::VectorXd& raw,
                                                       const StoichiometricMatrix& stoich) const {
    Eigen::VectorXd v = raw;
    if (v.sum() < 0.0) {
        v = -v;
    }

    const double maxAbs = v.cwiseAbs().maxCoeff();
    if (maxAbs <= 0.0) {
        throw BalancingError(ErrorCode::kDegenerateNullSpace, "zero null vector");
    }
    v /= maxAbs;

    for (int j = 0; j < v.size(); ++j) {
        if (v(j) < -tolerances_[kTolNegativeEntry]) {
            throw BalancingError(ErrorCode::kDegenerateNullSpace,
                                 stoich.columnLabels[j] + " would need a negative coefficient");
        }
        if (v(j) < tolerances_[kTolCoefficientFloor]) {
            v(j) = tolerances_[kTolCoefficientFloor];
        }
    }

    const double minEntry = v.minCoeff();
    if (v.maxCoeff() / minEntry > tolerances_[kTolCoefficientRatio]) {
        int j = 0;
        v.minCoeff(&j);
        throw BalancingError(ErrorCode::kCoefficientOverflow,
                             stoich.columnLabels[j] + " does not take part in the reaction");
    }

    return v / minEntry;
}

std::vector<long long> NullSpaceBalancer::toIntegers(const Eigen::VectorXd& scaled,
                                                     const StoichiometricMatrix& stoich) const {
    const int n = static_cast<int>(scaled.size());

    std::vector<RationalApproximation::Fraction> fractions(n);
    long long commonDenominator = 1;
    for (int j = 0; j < n; ++j) {
        fractions[j] = RationalApproximation::approximate(scaled(j), Constants::kMaxDenominator);
        const long long g = RationalApproximation::gcd(commonDenominator, fractions[j].denominator);
        if (commonDenominator / g > Constants::kMaxCoefficient / fractions[j].denominator) {
            throw BalancingError(ErrorCode::kCoefficientOverflow, "denominators too large");
        }
        commonDenominator = RationalApproximation::lcm(commonDenominator, fractions[j].denominator);
    }

    std::vector<long long> integers(n);
    long long divisor = 0;
    for (int j = 0; j < n; ++j) {
        const long long factor = commonDenominator / fractions[j].denominator;
        if (fractions[j].numerator > Constants::kMaxCoefficient / factor) {
            throw BalancingError(ErrorCode::kCoefficientOverflow, stoich.columnLabels[j]);
        }
        integers[j] = fractions[j].numerator * factor;
        if (integers[j] <= 0) {
            throw BalancingError(ErrorCode::kDegenerateNullSpace,
                                 stoich.columnLabels[j] + " rounds to a zero coefficient");
        }
        divisor = RationalApproximation::gcd(divisor, integers[j]);
    }

    for (auto& value : integers) {
        value /= divisor;
    }
    return integers;
}

} // namespace Stoichiometrica
