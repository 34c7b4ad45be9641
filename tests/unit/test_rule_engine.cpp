#include <gtest/gtest.h>
#include <stoichiometrica/model/Reaction.hpp>
#include <stoichiometrica/rules/ExpertRuleEngine.hpp>
#include <stoichiometrica/rules/StandardRules.hpp>
#include <stdexcept>

using namespace Stoichiometrica;

namespace {

Reaction makeReaction(const std::vector<std::string>& reactants,
                      const std::vector<std::string>& products) {
    Reaction r;
    for (const auto& f : reactants) {
        r.addReactant(f);
    }
    for (const auto& f : products) {
        r.addProduct(f);
    }
    return r;
}

const RuleEvaluation& findEvaluation(const std::vector<RuleEvaluation>& evaluations,
                                     const std::string& type) {
    for (const auto& eval : evaluations) {
        if (eval.type == type) {
            return eval;
        }
    }
    throw std::out_of_range("no evaluation for " + type);
}

} // namespace

TEST(ExpertRuleEngineTest, StandardRulesInOrder) {
    ExpertRuleEngine engine;
    EXPECT_EQ(engine.numRules(), 9u);
    EXPECT_EQ(engine.getRuleNames(),
              (std::vector<std::string>{"combustion", "acid_base", "precipitation", "hydrolysis",
                                        "single_replacement", "double_replacement", "synthesis",
                                        "decomposition", "isomerization"}));
}

TEST(ExpertRuleEngineTest, EvaluatesEveryRule) {
    ExpertRuleEngine engine;
    Reaction r = makeReaction({"CH4", "O2"}, {"CO2", "H2O"});

    std::vector<RuleEvaluation> evaluations = engine.evaluate(r);
    ASSERT_EQ(evaluations.size(), 9u);

    const RuleEvaluation& combustion = findEvaluation(evaluations, "combustion");
    EXPECT_EQ(combustion.outcome, RuleOutcome::Matched);
    EXPECT_DOUBLE_EQ(combustion.confidence, 0.95);
    EXPECT_EQ(findEvaluation(evaluations, "synthesis").outcome, RuleOutcome::NotMatched);
    EXPECT_EQ(findEvaluation(evaluations, "acid_base").outcome, RuleOutcome::NotMatched);
}

TEST(ExpertRuleEngineTest, FailingRuleIsRecorded) {
    ExpertRuleEngine engine;
    engine.registerRule(std::make_unique<LambdaRule>(
        "explosive", 0.5, [](const Reaction&) -> bool { throw std::runtime_error("boom"); }));
    EXPECT_EQ(engine.numRules(), 10u);

    Reaction r = makeReaction({"H2", "O2"}, {"H2O"});
    std::vector<RuleEvaluation> evaluations;
    ASSERT_NO_THROW(evaluations = engine.evaluate(r));

    const RuleEvaluation& failed = findEvaluation(evaluations, "explosive");
    EXPECT_EQ(failed.outcome, RuleOutcome::Failed);
    EXPECT_EQ(failed.message, "boom");

    std::vector<RuleEvaluation> matches = engine.getMatches(r);
    for (const auto& m : matches) {
        EXPECT_NE(m.type, "explosive");
    }
    EXPECT_EQ(findEvaluation(matches, "synthesis").outcome, RuleOutcome::Matched);
}

TEST(ExpertRuleEngineTest, NonStandardThrowIsRecorded) {
    ExpertRuleEngine engine;
    engine.registerRule(std::make_unique<LambdaRule>(
        "odd", 0.5, [](const Reaction&) -> bool { throw 42; }));

    Reaction r = makeReaction({"H2", "O2"}, {"H2O"});
    std::vector<RuleEvaluation> evaluations;
    ASSERT_NO_THROW(evaluations = engine.evaluate(r));
    EXPECT_EQ(findEvaluation(evaluations, "odd").outcome, RuleOutcome::Failed);
    EXPECT_FALSE(findEvaluation(evaluations, "odd").message.empty());
}

TEST(ExpertRuleEngineTest, CustomRules) {
    ExpertRuleEngine engine;
    engine.clearRules();
    EXPECT_EQ(engine.numRules(), 0u);
    EXPECT_TRUE(engine.evaluate(makeReaction({"H2", "O2"}, {"H2O"})).empty());

    engine.registerRule(nullptr);
    EXPECT_EQ(engine.numRules(), 0u);

    engine.registerRule(std::make_unique<LambdaRule>(
        "pyrolysis", 0.7, [](const Reaction& r) { return r.getTemperature() > 1000.0; }));

    Reaction cold = makeReaction({"CH4"}, {"C", "H2"});
    EXPECT_TRUE(engine.getMatches(cold).empty());

    Reaction hot = cold;
    hot.setTemperature(1500.0);
    std::vector<RuleEvaluation> matches = engine.getMatches(hot);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].type, "pyrolysis");
    EXPECT_DOUBLE_EQ(matches[0].confidence, 0.7);
}

TEST(StandardRulesTest, Combustion) {
    CombustionRule rule;
    EXPECT_TRUE(rule.matches(makeReaction({"C2H5OH", "O2"}, {"CO2", "H2O"})));
    EXPECT_FALSE(rule.matches(makeReaction({"C", "O2"}, {"CO2"})));
    EXPECT_FALSE(rule.matches(makeReaction({"H2", "O2"}, {"H2O"})));
}

TEST(StandardRulesTest, AcidBase) {
    AcidBaseRule rule(ReferenceData::standard());
    EXPECT_TRUE(rule.matches(makeReaction({"H2SO4", "KOH"}, {"K2SO4", "H2O"})));
    EXPECT_TRUE(rule.matches(makeReaction({"H^+", "OH^-"}, {"H2O"})));
    EXPECT_FALSE(rule.matches(makeReaction({"HCl", "NH3"}, {"NH4Cl"})));
    EXPECT_FALSE(rule.matches(makeReaction({"HCl", "Zn"}, {"ZnCl2", "H2"})));
}

TEST(StandardRulesTest, PrecipitationNeedsPhases) {
    PrecipitationRule rule;
    Reaction plain = makeReaction({"AgNO3", "NaCl"}, {"AgCl", "NaNO3"});
    EXPECT_FALSE(rule.matches(plain));

    Reaction withPhases = plain;
    withPhases.setPhases({Constants::Phase::Aqueous, Constants::Phase::Aqueous},
                         {Constants::Phase::Solid, Constants::Phase::Aqueous});
    EXPECT_TRUE(rule.matches(withPhases));
}

TEST(StandardRulesTest, ReplacementPatterns) {
    Reaction single = makeReaction({"Zn", "CuSO4"}, {"ZnSO4", "Cu"});
    Reaction swap = makeReaction({"AgNO3", "NaCl"}, {"AgCl", "NaNO3"});

    EXPECT_TRUE(SingleReplacementRule().matches(single));
    EXPECT_FALSE(DoubleReplacementRule().matches(single));
    EXPECT_FALSE(SingleReplacementRule().matches(swap));
    EXPECT_TRUE(DoubleReplacementRule().matches(swap));

    EXPECT_FALSE(ReactionPatterns::isSingleReplacement(
        makeReaction({"H2", "O2"}, {"H2O"}).getReactants(false),
        makeReaction({"H2", "O2"}, {"H2O"}).getProducts()));
}

TEST(StandardRulesTest, CountBasedRules) {
    EXPECT_TRUE(SynthesisRule().matches(makeReaction({"Na", "Cl2"}, {"NaCl"})));
    EXPECT_FALSE(SynthesisRule().matches(makeReaction({"CaCO3"}, {"CaO", "CO2"})));
    EXPECT_TRUE(DecompositionRule().matches(makeReaction({"CaCO3"}, {"CaO", "CO2"})));
    EXPECT_TRUE(IsomerizationRule().matches(makeReaction({"C2H5OH"}, {"CH3OCH3"})));
    EXPECT_FALSE(IsomerizationRule().matches(makeReaction({"O2"}, {"O3"})));
}

TEST(StandardRulesTest, CatalystDoesNotCountAsReactant) {
    Reaction r;
    r.addReactant("H2O2").addCatalyst("MnO2").addProduct("H2O").addProduct("O2");
    EXPECT_TRUE(DecompositionRule().matches(r));
    EXPECT_FALSE(SynthesisRule().matches(r));
}

TEST(StandardRulesTest, Hydrolysis) {
    HydrolysisRule rule(ReferenceData::standard());
    EXPECT_TRUE(rule.matches(makeReaction({"CH3COOC2H5", "H2O"}, {"CH3COOH", "C2H5OH"})));
    EXPECT_FALSE(rule.matches(makeReaction({"CH3COOH", "C2H5OH"}, {"CH3COOC2H5", "H2O"})));
}
