#include "stoichiometrica/analysis/ElectronTransferAnalyzer.hpp"
#include "stoichiometrica/model/Reaction.hpp"
#include <cmath>
#include <map>
#include <string>

namespace Stoichiometrica {

namespace {

std::map<std::string, int> monatomicIonCharges(const std::vector<ReactionComponent>& components) {
    std::map<std::string, int> charges;
    for (const auto& c : components) {
        if (!c.isCatalyst && c.molecule->isMonatomicIon()) {
            charges[c.molecule->elements()[0].first] = c.molecule->charge();
        }
    }
    return charges;
}

} // namespace

ElectronTransferAnalyzer::ElectronTransferAnalyzer(const ReferenceData& data)
    : estimator_(data) {}

ElectronTransferResult ElectronTransferAnalyzer::analyze(const Reaction& reaction) const {
    ElectronTransferResult ionic = analyzeIonicCharges(reaction);
    ElectronTransferResult result = analyzeOxidationStates(reaction);
    result.chargeChanges = ionic.chargeChanges;

    if (ionic.isRedox) {
        result.isRedox = true;
        result.fromIonicCharges = true;
        result.oxidizingAgent = ionic.oxidizingAgent;
        result.reducingAgent = ionic.reducingAgent;
    }
    return result;
}

ElectronTransferResult ElectronTransferAnalyzer::analyzeOxidationStates(const Reaction& reaction) const {
    ElectronTransferResult result;
    std::vector<ReactionComponent> reactants = reaction.getReactants(false);

    result.reactantStates = estimator_.sideAverages(reactants);
    result.productStates = estimator_.sideAverages(reaction.getProducts());

    for (const auto& entry : result.reactantStates) {
        auto it = result.productStates.find(entry.first);
        if (it == result.productStates.end()) {
            continue;
        }
        const double delta = it->second - entry.second;
        if (std::abs(delta) > tolerances_[kTolOxidationChange]) {
            result.oxidationChanges[entry.first] = delta;
        }
    }

    result.isRedox = result.oxidationChanges.size() >= 2;
    if (!result.isRedox) {
        return result;
    }

    for (const auto& r : reactants) {
        for (const auto& change : result.oxidationChanges) {
            if (!r.molecule->contains(change.first)) {
                continue;
            }
            // Reduced element: its carrier is the oxidizing agent
            if (change.second < 0.0 && result.oxidizingAgent.empty()) {
                result.oxidizingAgent = r.molecule->label();
            }
            if (change.second > 0.0 && result.reducingAgent.empty()) {
                result.reducingAgent = r.molecule->label();
            }
        }
    }
    return result;
}

ElectronTransferResult ElectronTransferAnalyzer::analyzeIonicCharges(const Reaction& reaction) const {
    ElectronTransferResult result;
    result.fromIonicCharges = true;

    std::vector<ReactionComponent> reactants = reaction.getReactants(false);
    std::map<std::string, int> before = monatomicIonCharges(reactants);
    std::map<std::string, int> after = monatomicIonCharges(reaction.getProducts());

    for (const auto& entry : before) {
        auto it = after.find(entry.first);
        if (it != after.end() && it->second != entry.second) {
            result.chargeChanges[entry.first] = it->second - entry.second;
        }
    }

    result.isRedox = result.chargeChanges.size() >= 2;
    if (!result.isRedox) {
        return result;
    }

    for (const auto& r : reactants) {
        if (!r.molecule->isMonatomicIon()) {
            continue;
        }
        auto it = result.chargeChanges.find(r.molecule->elements()[0].first);
        if (it == result.chargeChanges.end()) {
            continue;
        }
        if (it->second < 0 && result.oxidizingAgent.empty()) {
            result.oxidizingAgent = r.molecule->label();
        }
        if (it->second > 0 && result.reducingAgent.empty()) {
            result.reducingAgent = r.molecule->label();
        }
    }
    return result;
}

} // namespace Stoichiometrica
