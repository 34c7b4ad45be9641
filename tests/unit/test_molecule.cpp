#include <gtest/gtest.h>
#include <stoichiometrica/data/PeriodicTable.hpp>
#include <stoichiometrica/molecule/Molecule.hpp>
#include <stoichiometrica/util/Exceptions.hpp>

using namespace Stoichiometrica;

TEST(PeriodicTableTest, Lookup) {
    EXPECT_EQ(PeriodicTable::getAtomicNumber("Fe"), 26);
    EXPECT_EQ(PeriodicTable::getElementSymbol(8), "O");
    EXPECT_TRUE(PeriodicTable::isElement("Og"));
    EXPECT_FALSE(PeriodicTable::isElement("Xx"));
    EXPECT_NEAR(PeriodicTable::getAtomicWeight("C"), 12.011, 1e-3);
}

TEST(MoleculeTest, HillOrder) {
    EXPECT_EQ(Molecule::fromFormula("C2H5OH")->formula(), "C2H6O");
    EXPECT_EQ(Molecule::fromFormula("NaOH")->formula(), "HNaO");
    EXPECT_EQ(Molecule::fromFormula("HCl")->formula(), "HCl");
    EXPECT_EQ(Molecule::fromFormula("CuSO4")->formula(), "CuO4S");
    EXPECT_EQ(Molecule::fromFormula("O2")->formula(), "O2");
}

TEST(MoleculeTest, ElementsAreHillOrdered) {
    auto glucose = Molecule::fromFormula("C6H12O6");
    const ElementCounts& elements = glucose->elements();
    ASSERT_EQ(elements.size(), 3u);
    EXPECT_EQ(elements[0].first, "C");
    EXPECT_EQ(elements[1].first, "H");
    EXPECT_EQ(elements[2].first, "O");
    EXPECT_EQ(glucose->countOf("H"), 12);
    EXPECT_EQ(glucose->countOf("N"), 0);
}

TEST(MoleculeTest, MolecularWeight) {
    EXPECT_NEAR(Molecule::fromFormula("H2O")->molecularWeight(), 18.015, 0.01);
    EXPECT_NEAR(Molecule::fromFormula("CO2")->molecularWeight(), 44.009, 0.01);
    EXPECT_NEAR(Molecule::fromFormula("NaCl")->molecularWeight(), 58.44, 0.01);
}

TEST(MoleculeTest, ChargeAndLabel) {
    auto iron = Molecule::fromFormula("Fe^2+");
    EXPECT_EQ(iron->charge(), 2);
    EXPECT_EQ(iron->formula(), "Fe");
    EXPECT_EQ(iron->label(), "Fe^2+");
    EXPECT_TRUE(iron->isMonatomicIon());
    EXPECT_TRUE(iron->isElemental());

    auto chloride = Molecule::fromFormula("Cl-");
    EXPECT_EQ(chloride->label(), "Cl^-");

    EXPECT_FALSE(Molecule::fromFormula("O2")->isMonatomicIon());
    EXPECT_EQ(formatCharge(0), "");
    EXPECT_EQ(formatCharge(1), "^+");
    EXPECT_EQ(formatCharge(-2), "^2-");
}

TEST(MoleculeTest, SourceFormulaIsKept) {
    auto acid = Molecule::fromFormula("CH3COOH");
    EXPECT_EQ(acid->sourceFormula(), "CH3COOH");
    EXPECT_EQ(acid->formula(), "C2H4O2");

    auto built = Molecule::fromElements({{"H", 2}, {"O", 1}});
    EXPECT_EQ(built->sourceFormula(), "H2O");
}

TEST(MoleculeTest, SameComposition) {
    auto ethanol = Molecule::fromFormula("C2H5OH");
    auto ether = Molecule::fromFormula("CH3OCH3");
    EXPECT_TRUE(ethanol->sameComposition(*ether));

    auto ferrous = Molecule::fromFormula("Fe^2+");
    auto ferric = Molecule::fromFormula("Fe^3+");
    EXPECT_FALSE(ferrous->sameComposition(*ferric));
}

TEST(MoleculeTest, Copies) {
    auto iron = Molecule::fromFormula("Fe^2+");
    auto ferric = iron->withCharge(3);
    EXPECT_EQ(ferric->label(), "Fe^3+");
    EXPECT_EQ(ferric->sourceFormula(), "Fe^3+");
    EXPECT_EQ(iron->charge(), 2);

    auto solid = Molecule::fromFormula("NaCl")->withPhase(Constants::Phase::Solid);
    EXPECT_EQ(solid->phase(), Constants::Phase::Solid);
}

TEST(MoleculeTest, InvalidElements) {
    EXPECT_THROW(Molecule::fromElements({}), ValidationError);
    EXPECT_THROW(Molecule::fromElements({{"Xx", 1}}), ValidationError);
    EXPECT_THROW(Molecule::fromElements({{"H", 0}}), ValidationError);
}
