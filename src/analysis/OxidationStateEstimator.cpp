#include "stoichiometrica/analysis/OxidationStateEstimator.hpp"
#include <map>
#include <string>

namespace Stoichiometrica {

OxidationStates OxidationStateEstimator::estimate(const IMoleculeComposition& molecule) const {
    OxidationStates states;
    const ElementCounts& counts = molecule.elements();
    const int charge = molecule.charge();

    if (counts.empty()) {
        return states;
    }

    // Rule 0 and the monatomic-ion case of rule 5
    if (counts.size() == 1) {
        states[counts[0].first] = static_cast<double>(charge) / counts[0].second;
        return states;
    }

    // Rule 1: fluorine
    if (molecule.contains("F")) {
        states["F"] = -1.0;
    }

    // Rule 2: oxygen, peroxides by formula substring
    if (molecule.contains("O")) {
        states["O"] = (molecule.formula().find("O2") != std::string::npos) ? -1.0 : -2.0;
    }

    // Rule 3: hydrogen, hydride when every other element is a listed metal
    if (molecule.contains("H")) {
        bool hydride = true;
        for (const auto& entry : counts) {
            if (entry.first != "H" && !data_.isHydrideMetal(entry.first)) {
                hydride = false;
                break;
            }
        }
        states["H"] = hydride ? -1.0 : 1.0;
    }

    // Rule 4: binary compounds
    if (counts.size() == 2) {
        const std::string& a = counts[0].first;
        const std::string& b = counts[1].first;
        auto enA = data_.getElectronegativity(a);
        auto enB = data_.getElectronegativity(b);
        if (enA.second && enB.second) {
            const std::string& negative = (enA.first > enB.first) ? a : b;
            if (states.find(negative) == states.end()) {
                auto minState = data_.getMinOxidationState(negative);
                if (minState.second) {
                    states[negative] = minState.first;
                }
            }
        }
    }

    // Rule 5: charge balance for a single remaining element
    double assigned = 0.0;
    std::vector<std::pair<std::string, int>> remaining;
    for (const auto& entry : counts) {
        auto it = states.find(entry.first);
        if (it != states.end()) {
            assigned += it->second * entry.second;
        } else {
            remaining.push_back(entry);
        }
    }
    if (remaining.size() == 1) {
        states[remaining[0].first] = (charge - assigned) / remaining[0].second;
    }

    return states;
}

OxidationStates OxidationStateEstimator::sideAverages(
    const std::vector<ReactionComponent>& components) const {
    std::map<std::string, double> weightedSum;
    std::map<std::string, double> weight;

    for (const auto& component : components) {
        if (component.isCatalyst) {
            continue;
        }
        OxidationStates states = estimate(*component.molecule);
        for (const auto& entry : component.molecule->elements()) {
            auto it = states.find(entry.first);
            if (it == states.end()) {
                continue;
            }
            const double w = component.coefficient * entry.second;
            weightedSum[entry.first] += it->second * w;
            weight[entry.first] += w;
        }
    }

    OxidationStates averages;
    for (const auto& entry : weight) {
        if (entry.second > 0.0) {
            averages[entry.first] = weightedSum[entry.first] / entry.second;
        }
    }
    return averages;
}

} // namespace Stoichiometrica
