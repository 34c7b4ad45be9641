#include <gtest/gtest.h>
#include <stoichiometrica/analysis/OxidationStateEstimator.hpp>
#include <stoichiometrica/molecule/Molecule.hpp>

using namespace Stoichiometrica;

class OxidationStateTest : public ::testing::Test {
protected:
    OxidationStates estimate(const std::string& formula) const {
        return estimator.estimate(*Molecule::fromFormula(formula));
    }

    static ReactionComponent component(const std::string& formula, double coefficient) {
        ReactionComponent c;
        c.molecule = Molecule::fromFormula(formula);
        c.coefficient = coefficient;
        return c;
    }

    OxidationStateEstimator estimator;
};

TEST_F(OxidationStateTest, ElementalSubstancesAreZero) {
    EXPECT_DOUBLE_EQ(estimate("O2").at("O"), 0.0);
    EXPECT_DOUBLE_EQ(estimate("Fe").at("Fe"), 0.0);
    EXPECT_DOUBLE_EQ(estimate("S8").at("S"), 0.0);
}

TEST_F(OxidationStateTest, MonatomicIons) {
    EXPECT_DOUBLE_EQ(estimate("Fe^3+").at("Fe"), 3.0);
    EXPECT_DOUBLE_EQ(estimate("Cl^-").at("Cl"), -1.0);
    EXPECT_DOUBLE_EQ(estimate("Hg2^2+").at("Hg"), 1.0);
}

TEST_F(OxidationStateTest, HydrogenAndOxygen) {
    OxidationStates water = estimate("H2O");
    EXPECT_DOUBLE_EQ(water.at("H"), 1.0);
    EXPECT_DOUBLE_EQ(water.at("O"), -2.0);

    OxidationStates peroxide = estimate("H2O2");
    EXPECT_DOUBLE_EQ(peroxide.at("O"), -1.0);
    EXPECT_DOUBLE_EQ(peroxide.at("H"), 1.0);

    OxidationStates hydroxide = estimate("NaOH");
    EXPECT_DOUBLE_EQ(hydroxide.at("H"), 1.0);
    EXPECT_DOUBLE_EQ(hydroxide.at("O"), -2.0);
    EXPECT_DOUBLE_EQ(hydroxide.at("Na"), 1.0);
}

TEST_F(OxidationStateTest, MetalHydride) {
    OxidationStates hydride = estimate("NaH");
    EXPECT_DOUBLE_EQ(hydride.at("H"), -1.0);
    EXPECT_DOUBLE_EQ(hydride.at("Na"), 1.0);
}

TEST_F(OxidationStateTest, BinaryCompounds) {
    OxidationStates methane = estimate("CH4");
    EXPECT_DOUBLE_EQ(methane.at("C"), -4.0);
    EXPECT_DOUBLE_EQ(methane.at("H"), 1.0);

    OxidationStates hcl = estimate("HCl");
    EXPECT_DOUBLE_EQ(hcl.at("Cl"), -1.0);
    EXPECT_DOUBLE_EQ(hcl.at("H"), 1.0);

    OxidationStates salt = estimate("NaCl");
    EXPECT_DOUBLE_EQ(salt.at("Cl"), -1.0);
    EXPECT_DOUBLE_EQ(salt.at("Na"), 1.0);

    EXPECT_DOUBLE_EQ(estimate("HF").at("F"), -1.0);
}

TEST_F(OxidationStateTest, ChargeBalanceForPolyatomicIon) {
    OxidationStates sulfate = estimate("SO4^2-");
    EXPECT_DOUBLE_EQ(sulfate.at("O"), -2.0);
    EXPECT_DOUBLE_EQ(sulfate.at("S"), 6.0);
}

TEST_F(OxidationStateTest, AmbiguousElementsStayUnassigned) {
    OxidationStates permanganate = estimate("KMnO4");
    EXPECT_DOUBLE_EQ(permanganate.at("O"), -2.0);
    EXPECT_EQ(permanganate.count("K"), 0u);
    EXPECT_EQ(permanganate.count("Mn"), 0u);
}

TEST_F(OxidationStateTest, SideAveragesAreWeighted) {
    std::vector<ReactionComponent> side = {component("NaH", 1.0), component("H2O", 1.0)};
    OxidationStates averages = estimator.sideAverages(side);
    // one hydride H at -1, two water H at +1
    EXPECT_NEAR(averages.at("H"), 1.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(averages.at("O"), -2.0);
    EXPECT_DOUBLE_EQ(averages.at("Na"), 1.0);
}

TEST_F(OxidationStateTest, SideAveragesSkipCatalystsAndUnassigned) {
    ReactionComponent catalyst = component("MnO2", 1.0);
    catalyst.isCatalyst = true;
    std::vector<ReactionComponent> side = {component("KMnO4", 2.0), catalyst};
    OxidationStates averages = estimator.sideAverages(side);
    EXPECT_EQ(averages.count("Mn"), 0u);
    EXPECT_EQ(averages.count("K"), 0u);
    EXPECT_DOUBLE_EQ(averages.at("O"), -2.0);
}
