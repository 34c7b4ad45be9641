#pragma once

#include <array>
#include "stoichiometrica/util/Constants.hpp"

namespace Stoichiometrica {

// Tolerance indices
enum ToleranceIndex {
    kTolElementBalance = 0,    // |net atoms| accepted as balanced
    kTolNullSpace = 1,         // Relative singular value cut-off for rank
    kTolVerification = 2,      // Residual of M*x after rationalization
    kTolCoefficientFloor = 3,  // Floor for near-zero null-space entries
    kTolNegativeEntry = 4,     // Largest negative entry treated as zero
    kTolOxidationChange = 5,   // Oxidation state change counted as a transfer
    kTolCoefficientRatio = 6,  // Largest max/min ratio of a balancing vector
    kTolNormalizeScale = 7     // Fixed-point scale used by normalizeCoefficients
};

struct Tolerances {
    std::array<double, Constants::kNumTolerances> values;

    Tolerances() {
        initDefaults();
    }

    void initDefaults() {
        values[kTolElementBalance] = 1.0e-6;
        values[kTolNullSpace] = 1.0e-8;
        values[kTolVerification] = 1.0e-6;
        values[kTolCoefficientFloor] = 1.0e-10;
        values[kTolNegativeEntry] = 1.0e-8;
        values[kTolOxidationChange] = 0.1;
        values[kTolCoefficientRatio] = 1.0e6;
        values[kTolNormalizeScale] = 1.0e6;
    }

    double& operator[](int index) { return values[index]; }
    const double& operator[](int index) const { return values[index]; }
};

} // namespace Stoichiometrica
