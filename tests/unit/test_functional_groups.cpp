#include <gtest/gtest.h>
#include <algorithm>
#include <stoichiometrica/analysis/FunctionalGroupAnalyzer.hpp>
#include <stoichiometrica/model/Reaction.hpp>
#include <stoichiometrica/molecule/Molecule.hpp>

using namespace Stoichiometrica;

class FunctionalGroupTest : public ::testing::Test {
protected:
    std::vector<std::string> groupsOf(const std::string& formula) const {
        return analyzer.groupsOf(*Molecule::fromFormula(formula));
    }

    FunctionalGroupAnalyzer analyzer;
};

TEST_F(FunctionalGroupTest, GroupsOfCommonMolecules) {
    EXPECT_EQ(groupsOf("C2H5OH"), (std::vector<std::string>{"alcohol"}));
    EXPECT_EQ(groupsOf("CH3COOH"), (std::vector<std::string>{"alcohol", "carboxylic_acid"}));
    EXPECT_EQ(groupsOf("CH3CHO"), (std::vector<std::string>{"aldehyde"}));
    EXPECT_EQ(groupsOf("CH3COCH3"), (std::vector<std::string>{"ketone"}));
    EXPECT_EQ(groupsOf("CH3NH2"), (std::vector<std::string>{"amine"}));
    EXPECT_TRUE(groupsOf("H2O").empty());
}

TEST_F(FunctionalGroupTest, EsterAlsoReadsAsKetone) {
    std::vector<std::string> groups = groupsOf("CH3COOC2H5");
    EXPECT_NE(std::find(groups.begin(), groups.end(), "ester"), groups.end());
    EXPECT_NE(std::find(groups.begin(), groups.end(), "ketone"), groups.end());
    EXPECT_EQ(std::find(groups.begin(), groups.end(), "carboxylic_acid"), groups.end());
}

TEST_F(FunctionalGroupTest, HalidesByElement) {
    EXPECT_EQ(groupsOf("CH3Cl"), (std::vector<std::string>{"halide"}));
    EXPECT_TRUE(groupsOf("Fe").empty());
    EXPECT_TRUE(groupsOf("In").empty());
    EXPECT_TRUE(groupsOf("Fe2O3").empty());
}

TEST_F(FunctionalGroupTest, WeightedCounts) {
    Reaction r;
    r.addReactant("C2H5OH", 2.0).addCatalyst("CH3COOH").addProduct("H2O");
    std::map<std::string, double> counts = analyzer.identifyGroups(r.getReactants());
    EXPECT_DOUBLE_EQ(counts.at("alcohol"), 2.0);
    EXPECT_EQ(counts.count("carboxylic_acid"), 0u);
}

TEST_F(FunctionalGroupTest, EsterHydrolysis) {
    Reaction r;
    r.addReactant("CH3COOC2H5").addReactant("H2O").addProduct("CH3COOH").addProduct("C2H5OH");

    FunctionalGroupResult result = analyzer.analyze(r);
    EXPECT_EQ(result.mechanism, "hydrolysis");
    EXPECT_DOUBLE_EQ(result.productGroups.at("alcohol"), 2.0);
    auto pair = std::make_pair(std::string("ester"), std::string("carboxylic_acid"));
    EXPECT_NE(std::find(result.transformations.begin(), result.transformations.end(), pair),
              result.transformations.end());
}

TEST_F(FunctionalGroupTest, Esterification) {
    Reaction r;
    r.addReactant("CH3COOH").addReactant("C2H5OH").addProduct("CH3COOC2H5").addProduct("H2O");
    EXPECT_EQ(analyzer.analyze(r).mechanism, "esterification");
}

TEST_F(FunctionalGroupTest, AlcoholOxidationAndKetoneReduction) {
    Reaction oxidation;
    oxidation.addReactant("C2H5OH").addReactant("O2").addProduct("CH3CHO").addProduct("H2O");
    EXPECT_EQ(analyzer.analyze(oxidation).mechanism, "oxidation");

    Reaction reduction;
    reduction.addReactant("CH3COCH3").addReactant("H2").addProduct("CH3CH(OH)CH3");
    EXPECT_EQ(analyzer.analyze(reduction).mechanism, "reduction");
}

TEST_F(FunctionalGroupTest, MechanismLookup) {
    EXPECT_EQ(analyzer.classifyMechanism({{"halide", "alcohol"}}), "nucleophilic_substitution");
    EXPECT_EQ(analyzer.classifyMechanism({{"ester", "alcohol"}}), "unknown");
    EXPECT_EQ(analyzer.classifyMechanism({}), "unknown");
}

TEST_F(FunctionalGroupTest, InorganicReactionHasNoMechanism) {
    Reaction r;
    r.addReactant("HCl").addReactant("NaOH").addProduct("NaCl").addProduct("H2O");
    FunctionalGroupResult result = analyzer.analyze(r);
    EXPECT_EQ(result.mechanism, "unknown");
}
