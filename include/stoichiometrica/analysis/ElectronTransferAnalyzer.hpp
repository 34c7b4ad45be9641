/// @file ElectronTransferAnalyzer.hpp
/// @brief Redox detection from oxidation states and ionic charges
/// @details Two paths are evaluated. The oxidation-state path diffs the
/// side averages of the estimator; an element changes when |delta| exceeds
/// the oxidation-change tolerance. The ionic path diffs the charges of
/// monatomic ions per element and needs no heuristics, so when it finds
/// redox character it replaces the oxidation-state verdict. Either path
/// needs at least two changed elements to call a reaction redox.

#pragma once

#include "stoichiometrica/analysis/OxidationStateEstimator.hpp"
#include "stoichiometrica/context/AnalysisResults.hpp"
#include "stoichiometrica/data/ReferenceData.hpp"
#include "stoichiometrica/util/Tolerances.hpp"

namespace Stoichiometrica {

class Reaction;

class ElectronTransferAnalyzer {
public:
    explicit ElectronTransferAnalyzer(const ReferenceData& data = ReferenceData::standard());

    /// @brief Combined analysis (ionic path overrides when it finds redox)
    ElectronTransferResult analyze(const Reaction& reaction) const;

    /// @brief Oxidation-state path only
    ElectronTransferResult analyzeOxidationStates(const Reaction& reaction) const;

    /// @brief Ionic-charge path only
    ElectronTransferResult analyzeIonicCharges(const Reaction& reaction) const;

    Tolerances& tolerances() { return tolerances_; }

private:
    OxidationStateEstimator estimator_;
    Tolerances tolerances_;
};

} // namespace Stoichiometrica
