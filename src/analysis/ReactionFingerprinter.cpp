#include "stoichiometrica/analysis/ReactionFingerprinter.hpp"
#include "stoichiometrica/model/Reaction.hpp"

namespace Stoichiometrica {

namespace {

std::map<std::string, double> countElements(const std::vector<ReactionComponent>& components) {
    std::map<std::string, double> totals;
    for (const auto& c : components) {
        for (const auto& entry : c.molecule->elements()) {
            totals[entry.first] += entry.second * c.coefficient;
        }
    }
    return totals;
}

std::map<std::string, std::string> collectPhases(const std::vector<ReactionComponent>& components) {
    std::map<std::string, std::string> phases;
    for (const auto& c : components) {
        Constants::Phase p = c.effectivePhase();
        if (p != Constants::Phase::None) {
            phases[c.molecule->label()] = Constants::getPhaseName(p);
        }
    }
    return phases;
}

} // namespace

ReactionFingerprint ReactionFingerprinter::fingerprint(const Reaction& reaction) const {
    return fingerprint(reaction, electronTransfer_.analyze(reaction).isRedox);
}

ReactionFingerprint ReactionFingerprinter::fingerprint(const Reaction& reaction,
                                                       bool hasChargeTransfer) const {
    ReactionFingerprint fp;
    std::vector<ReactionComponent> reactants = reaction.getReactants(false);
    const std::vector<ReactionComponent>& products = reaction.getProducts();

    fp.reactantElements = countElements(reactants);
    fp.productElements = countElements(products);

    for (const auto& entry : fp.reactantElements) {
        fp.elementBalance[entry.first] -= entry.second;
    }
    for (const auto& entry : fp.productElements) {
        fp.elementBalance[entry.first] += entry.second;
    }

    fp.reactantPhases = collectPhases(reactants);
    fp.productPhases = collectPhases(products);
    for (const auto& entry : fp.reactantPhases) {
        auto it = fp.productPhases.find(entry.first);
        if (it != fp.productPhases.end() && it->second != entry.second) {
            fp.phaseChanges[entry.first] = std::make_pair(entry.second, it->second);
        }
    }

    fp.hasChargeTransfer = hasChargeTransfer;
    fp.reactantCount = reactants.size();
    fp.productCount = products.size();
    return fp;
}

} // namespace Stoichiometrica
