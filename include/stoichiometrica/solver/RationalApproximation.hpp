/// @file RationalApproximation.hpp
/// @brief Bounded-denominator rational approximation and integer helpers

#pragma once

#include "stoichiometrica/util/Constants.hpp"

namespace Stoichiometrica {
namespace RationalApproximation {

struct Fraction {
    long long numerator = 0;
    long long denominator = 1;

    double value() const { return static_cast<double>(numerator) / static_cast<double>(denominator); }
};

/// @brief Closest fraction to value with denominator <= maxDenominator
/// @details Continued-fraction convergents followed by a check of the
/// last semiconvergent.
Fraction approximate(double value, long long maxDenominator = Constants::kMaxDenominator);

/// @brief Greatest common divisor, gcd(0, b) == |b|
long long gcd(long long a, long long b);

/// @brief Least common multiple, 0 when either argument is 0
long long lcm(long long a, long long b);

} // namespace RationalApproximation
} // namespace Stoichiometrica
