#include <gtest/gtest.h>
#include <stoichiometrica/analysis/ReactionFingerprinter.hpp>
#include <stoichiometrica/analysis/ReactionTypeClassifier.hpp>
#include <stoichiometrica/model/Reaction.hpp>
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

} // namespace

TEST(CoarseTypeTest, CountCascade) {
    EXPECT_EQ(ReactionTypeClassifier::coarseType(makeReaction({"Na", "Cl2"}, {"NaCl"})), "synthesis");
    EXPECT_EQ(ReactionTypeClassifier::coarseType(makeReaction({"CaCO3"}, {"CaO", "CO2"})),
              "decomposition");
    EXPECT_EQ(ReactionTypeClassifier::coarseType(makeReaction({"C2H5OH"}, {"CH3OCH3"})),
              "isomerization");
    EXPECT_EQ(ReactionTypeClassifier::coarseType(makeReaction({"O2"}, {"O3"})), "unknown");
    EXPECT_EQ(ReactionTypeClassifier::coarseType(makeReaction({"Zn", "CuSO4"}, {"ZnSO4", "Cu"})),
              "single_replacement");
    EXPECT_EQ(ReactionTypeClassifier::coarseType(makeReaction({"AgNO3", "NaCl"}, {"AgCl", "NaNO3"})),
              "double_replacement");
    EXPECT_EQ(ReactionTypeClassifier::coarseType(
                  makeReaction({"C3H8", "O2"}, {"CO2", "H2O", "CO"})),
              "unknown");
}

TEST(SelectPrimaryTypeTest, HighestScoreWins) {
    EXPECT_EQ(ReactionTypeClassifier::selectPrimaryType({}), "unknown");
    EXPECT_EQ(ReactionTypeClassifier::selectPrimaryType({{"synthesis", 0.8}, {"redox", 0.95}}),
              "redox");
    EXPECT_EQ(ReactionTypeClassifier::selectPrimaryType({{"synthesis", 0.0}}), "unknown");
}

TEST(SelectPrimaryTypeTest, TiesFollowPriority) {
    EXPECT_EQ(ReactionTypeClassifier::selectPrimaryType({{"combustion", 0.95}, {"redox", 0.95}}),
              "combustion");
    EXPECT_EQ(ReactionTypeClassifier::selectPrimaryType({{"synthesis", 0.9}, {"decomposition", 0.9}}),
              "synthesis");
    EXPECT_EQ(ReactionTypeClassifier::selectPrimaryType(
                  {{"double_replacement", 0.8}, {"single_replacement", 0.8}}),
              "single_replacement");
}

TEST(SelectPrimaryTypeTest, CustomTypesRankLast) {
    EXPECT_EQ(ReactionTypeClassifier::selectPrimaryType({{"alkylation", 0.9}, {"synthesis", 0.9}}),
              "synthesis");
    EXPECT_EQ(ReactionTypeClassifier::selectPrimaryType({{"alkylation", 0.91}, {"synthesis", 0.9}}),
              "alkylation");
}

TEST(ReactionTypeClassifierTest, RedoxPenalizesStructuralTypes) {
    ReactionTypeClassifier classifier;
    Reaction r = makeReaction({"N2", "H2"}, {"NH3"});

    ClassificationResult result = classifier.classify(r);
    EXPECT_TRUE(result.electronTransfer.isRedox);
    EXPECT_EQ(result.primaryType, "redox");
    EXPECT_EQ(result.coarseType, "synthesis");
    EXPECT_DOUBLE_EQ(result.getConfidence("redox"), 0.95);
    // 0.9 halved, then lifted back to the coarse baseline
    EXPECT_DOUBLE_EQ(result.getConfidence("synthesis"), 0.8);
    EXPECT_DOUBLE_EQ(result.getConfidence("combustion"), 0.0);
}

TEST(ReactionTypeClassifierTest, ResultCarriesDiagnostics) {
    ReactionTypeClassifier classifier;
    ClassificationResult result =
        classifier.classify(makeReaction({"CH3COOC2H5", "H2O"}, {"CH3COOH", "C2H5OH"}));

    EXPECT_EQ(result.primaryType, "hydrolysis");
    EXPECT_EQ(result.ruleEvaluations.size(), 9u);
    EXPECT_EQ(result.functionalGroups.mechanism, "hydrolysis");
    EXPECT_EQ(result.fingerprint.reactantCount, 2u);
    EXPECT_EQ(result.fingerprint.productCount, 2u);
}

TEST(ReactionTypeClassifierTest, FailingCustomRuleDoesNotThrow) {
    ReactionTypeClassifier classifier;
    classifier.ruleEngine().registerRule(std::make_unique<LambdaRule>(
        "broken", 1.0, [](const Reaction&) -> bool { throw std::logic_error("broken rule"); }));

    ClassificationResult result;
    ASSERT_NO_THROW(result = classifier.classify(makeReaction({"CaCO3"}, {"CaO", "CO2"})));
    EXPECT_EQ(result.primaryType, "decomposition");
    EXPECT_EQ(result.getConfidence("broken"), 0.0);
    EXPECT_EQ(result.ruleEvaluations.back().outcome, RuleOutcome::Failed);
}

TEST(ReactionTypeClassifierTest, CustomRuleCanWin) {
    ReactionTypeClassifier classifier;
    classifier.ruleEngine().registerRule(std::make_unique<LambdaRule>(
        "calcination", 0.97, [](const Reaction& r) { return r.getTemperature() > 800.0; }));

    Reaction r = makeReaction({"CaCO3"}, {"CaO", "CO2"});
    EXPECT_EQ(classifier.classify(r).primaryType, "decomposition");
    r.setTemperature(1100.0);
    EXPECT_EQ(classifier.classify(r).primaryType, "calcination");
}

TEST(ReactionTypeClassifierTest, EmptyReactionIsUnknown) {
    ReactionTypeClassifier classifier;
    ClassificationResult result = classifier.classify(Reaction());
    EXPECT_EQ(result.primaryType, "unknown");
    EXPECT_EQ(result.coarseType, "unknown");
}

TEST(ReactionFingerprinterTest, ElementAndPhaseDeltas) {
    Reaction r;
    r.addReactant("H2O", 2.0, Constants::Phase::Liquid).addProduct("H2O", 2.0, Constants::Phase::Gas);

    ReactionFingerprinter fingerprinter;
    ReactionFingerprint fp = fingerprinter.fingerprint(r);
    EXPECT_DOUBLE_EQ(fp.reactantElements.at("H"), 4.0);
    EXPECT_DOUBLE_EQ(fp.elementBalance.at("O"), 0.0);
    ASSERT_EQ(fp.phaseChanges.count("H2O"), 1u);
    EXPECT_EQ(fp.phaseChanges.at("H2O").first, "l");
    EXPECT_EQ(fp.phaseChanges.at("H2O").second, "g");
    EXPECT_FALSE(fp.hasChargeTransfer);

    ReactionFingerprint same = fingerprinter.fingerprint(r);
    EXPECT_EQ(fp, same);
    r.scaleCoefficients(2.0);
    EXPECT_NE(fp, fingerprinter.fingerprint(r));
}

TEST(ReactionFingerprinterTest, ChargeTransferFlag) {
    ReactionFingerprinter fingerprinter;
    ReactionFingerprint fp = fingerprinter.fingerprint(
        makeReaction({"Fe^2+", "Ce^4+"}, {"Fe^3+", "Ce^3+"}));
    EXPECT_TRUE(fp.hasChargeTransfer);
}
