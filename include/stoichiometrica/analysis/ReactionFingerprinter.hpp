/// @file ReactionFingerprinter.hpp
/// @brief Builds ReactionFingerprint snapshots

#pragma once

#include "stoichiometrica/analysis/ElectronTransferAnalyzer.hpp"
#include "stoichiometrica/context/ReactionFingerprint.hpp"
#include "stoichiometrica/data/ReferenceData.hpp"

namespace Stoichiometrica {

class Reaction;

/// @brief Aggregates element, phase and charge deltas; makes no decisions
class ReactionFingerprinter {
public:
    explicit ReactionFingerprinter(const ReferenceData& data = ReferenceData::standard())
        : electronTransfer_(data) {}

    ReactionFingerprint fingerprint(const Reaction& reaction) const;

    /// @brief Fingerprint with a precomputed electron-transfer verdict
    ReactionFingerprint fingerprint(const Reaction& reaction, bool hasChargeTransfer) const;

private:
    ElectronTransferAnalyzer electronTransfer_;
};

} // namespace Stoichiometrica
