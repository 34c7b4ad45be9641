#include "stoichiometrica/solver/RationalApproximation.hpp"
#include <cmath>
#include <cstdlib>

namespace Stoichiometrica {
namespace RationalApproximation {

Fraction approximate(double value, long long maxDenominator) {
    Fraction result;
    if (!std::isfinite(value) || maxDenominator < 1) {
        return result;
    }

    const bool negative = value < 0.0;
    const double target = std::abs(value);

    // Convergents p/q
    long long p0 = 0, q0 = 1;
    long long p1 = 1, q1 = 0;
    double x = target;

    for (int iter = 0; iter < 64; ++iter) {
        double a = std::floor(x);
        long long ai = static_cast<long long>(a);
        long long q2 = q0 + ai * q1;
        if (q2 > maxDenominator) {
            break;
        }
        long long p2 = p0 + ai * p1;
        p0 = p1; q0 = q1;
        p1 = p2; q1 = q2;

        double frac = x - a;
        if (frac < 1.0e-12) {
            break;
        }
        x = 1.0 / frac;
    }

    // Semiconvergent between the last two convergents
    long long k = (maxDenominator - q0) / q1;
    long long pb = p0 + k * p1;
    long long qb = q0 + k * q1;

    double errConvergent = std::abs(static_cast<double>(p1) / q1 - target);
    double errSemi = std::abs(static_cast<double>(pb) / qb - target);

    if (errConvergent <= errSemi) {
        result.numerator = p1;
        result.denominator = q1;
    } else {
        result.numerator = pb;
        result.denominator = qb;
    }

    if (negative) {
        result.numerator = -result.numerator;
    }
    return result;
}

long long gcd(long long a, long long b) {
    a = std::llabs(a);
    b = std::llabs(b);
    while (b != 0) {
        long long t = a % b;
        a = b;
        b = t;
    }
    return a;
}

long long lcm(long long a, long long b) {
    if (a == 0 || b == 0) {
        return 0;
    }
    return std::llabs(a / gcd(a, b) * b);
}

} // namespace RationalApproximation
} // namespace Stoichiometrica
