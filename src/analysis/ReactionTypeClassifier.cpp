#include "stoichiometrica/analysis/ReactionTypeClassifier.hpp"
#include "stoichiometrica/model/Reaction.hpp"
#include "stoichiometrica/rules/StandardRules.hpp"
#include "stoichiometrica/util/Constants.hpp"
#include "stoichiometrica/util/Diagnostics.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace Stoichiometrica {

namespace {

void warnStage(const char* stage, const std::exception& e) {
    if (Diagnostics::warningsEnabled()) {
        std::cerr << "[ReactionTypeClassifier] " << stage << " failed: " << e.what() << std::endl;
    }
}

} // namespace

ReactionTypeClassifier::ReactionTypeClassifier(const ReferenceData& data)
    : rules_(data), electronTransfer_(data), functionalGroups_(data), fingerprinter_(data) {}

ClassificationResult ReactionTypeClassifier::classify(const Reaction& reaction) const {
    ClassificationResult result;
    std::map<std::string, double>& scores = result.confidenceScores;

    try {
        result.ruleEvaluations = rules_.evaluate(reaction);
    } catch (const std::exception& e) {
        warnStage("Rule evaluation", e);
    }
    for (const auto& eval : result.ruleEvaluations) {
        if (eval.outcome == RuleOutcome::Matched) {
            double& score = scores[eval.type];
            score = std::max(score, eval.confidence);
        }
    }

    try {
        result.electronTransfer = electronTransfer_.analyze(reaction);
    } catch (const std::exception& e) {
        warnStage("Electron transfer analysis", e);
    }
    if (result.electronTransfer.isRedox) {
        double& redox = scores[Constants::ReactionType::kRedox];
        redox = std::max(redox, Constants::kRedoxConfidence);
        for (const char* structural : {Constants::ReactionType::kSynthesis,
                                       Constants::ReactionType::kDecomposition}) {
            auto it = scores.find(structural);
            if (it != scores.end()) {
                it->second *= Constants::kRedoxStructuralPenalty;
            }
        }
    }

    try {
        result.functionalGroups = functionalGroups_.analyze(reaction);
    } catch (const std::exception& e) {
        warnStage("Functional group analysis", e);
    }

    try {
        result.fingerprint = fingerprinter_.fingerprint(reaction, result.electronTransfer.isRedox);
    } catch (const std::exception& e) {
        warnStage("Fingerprint", e);
    }

    try {
        result.coarseType = coarseType(reaction);
    } catch (const std::exception& e) {
        warnStage("Coarse cascade", e);
    }
    if (result.coarseType != Constants::ReactionType::kUnknown) {
        double& coarse = scores[result.coarseType];
        coarse = std::max(coarse, Constants::kCoarseTypeBaseline);
    }

    for (auto& entry : scores) {
        entry.second = std::min(1.0, std::max(0.0, entry.second));
    }

    result.primaryType = selectPrimaryType(scores);

    if (Diagnostics::debugEnabled()) {
        std::cerr << "[ReactionTypeClassifier] " << reaction.toString()
                  << " -> " << result.primaryType << std::endl;
    }
    return result;
}

std::string ReactionTypeClassifier::coarseType(const Reaction& reaction) {
    std::vector<ReactionComponent> reactants = reaction.getReactants(false);
    const std::vector<ReactionComponent>& products = reaction.getProducts();
    const std::size_t nr = reactants.size();
    const std::size_t np = products.size();

    if (nr == 1 && np == 1) {
        return reactants.front().molecule->sameComposition(*products.front().molecule)
            ? Constants::ReactionType::kIsomerization
            : Constants::ReactionType::kUnknown;
    }
    if (nr == 1 && np > 1) {
        return Constants::ReactionType::kDecomposition;
    }
    if (nr > 1 && np == 1) {
        return Constants::ReactionType::kSynthesis;
    }
    if (nr == 2 && np == 2) {
        if (ReactionPatterns::isSingleReplacement(reactants, products)) {
            return Constants::ReactionType::kSingleReplacement;
        }
        if (ReactionPatterns::isDoubleReplacement(reactants, products)) {
            return Constants::ReactionType::kDoubleReplacement;
        }
    }
    return Constants::ReactionType::kUnknown;
}

std::string ReactionTypeClassifier::selectPrimaryType(const std::map<std::string, double>& scores) {
    std::string best = Constants::ReactionType::kUnknown;
    double bestScore = 0.0;

    // Priority order first, so an equal score later in the list never wins
    for (int i = 0; i < Constants::kNumReactionTypes; ++i) {
        auto it = scores.find(Constants::kTypePriority[i]);
        if (it != scores.end() && it->second > bestScore) {
            best = it->first;
            bestScore = it->second;
        }
    }
    // Custom rule types rank after the built-in ones
    for (const auto& entry : scores) {
        if (entry.second > bestScore) {
            best = entry.first;
            bestScore = entry.second;
        }
    }
    return best;
}

} // namespace Stoichiometrica
