/// @file ExpertRuleEngine.cpp
/// @brief Implementation of the rule registry

#include "stoichiometrica/rules/ExpertRuleEngine.hpp"
#include "stoichiometrica/rules/StandardRules.hpp"
#include "stoichiometrica/util/Diagnostics.hpp"
#include <exception>
#include <iostream>

namespace Stoichiometrica {

ExpertRuleEngine::ExpertRuleEngine(const ReferenceData& data) : data_(data) {
    registerStandardRules();
}

void ExpertRuleEngine::registerRule(std::unique_ptr<IReactionRule> rule) {
    if (rule) {
        rules_.push_back(std::move(rule));
    }
}

std::vector<std::string> ExpertRuleEngine::getRuleNames() const {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_) {
        names.emplace_back(rule->getRuleName());
    }
    return names;
}

std::vector<RuleEvaluation> ExpertRuleEngine::evaluate(const Reaction& reaction) const {
    std::vector<RuleEvaluation> evaluations;
    evaluations.reserve(rules_.size());

    for (const auto& rule : rules_) {
        RuleEvaluation eval;
        eval.type = rule->getRuleName();
        eval.confidence = rule->getConfidence();
        try {
            eval.outcome = rule->matches(reaction) ? RuleOutcome::Matched : RuleOutcome::NotMatched;
        } catch (const std::exception& e) {
            eval.outcome = RuleOutcome::Failed;
            eval.message = e.what();
        } catch (...) {
            eval.outcome = RuleOutcome::Failed;
            eval.message = "non-standard exception";
        }
        if (eval.outcome == RuleOutcome::Failed && Diagnostics::warningsEnabled()) {
            std::cerr << "[ExpertRuleEngine] Rule '" << eval.type
                      << "' failed: " << eval.message << std::endl;
        }
        evaluations.push_back(eval);
    }
    return evaluations;
}

std::vector<RuleEvaluation> ExpertRuleEngine::getMatches(const Reaction& reaction) const {
    std::vector<RuleEvaluation> matches;
    for (const auto& eval : evaluate(reaction)) {
        if (eval.outcome == RuleOutcome::Matched) {
            matches.push_back(eval);
        }
    }
    return matches;
}

void ExpertRuleEngine::registerStandardRules() {
    registerRule(std::make_unique<CombustionRule>());
    registerRule(std::make_unique<AcidBaseRule>(data_));
    registerRule(std::make_unique<PrecipitationRule>());
    registerRule(std::make_unique<HydrolysisRule>(data_));
    registerRule(std::make_unique<SingleReplacementRule>());
    registerRule(std::make_unique<DoubleReplacementRule>());
    registerRule(std::make_unique<SynthesisRule>());
    registerRule(std::make_unique<DecompositionRule>());
    registerRule(std::make_unique<IsomerizationRule>());
}

} // namespace Stoichiometrica
