#include <gtest/gtest.h>
#include <stoichiometrica/molecule/FormulaParser.hpp>
#include <stoichiometrica/util/Exceptions.hpp>

using namespace Stoichiometrica;

namespace {

int errorCodeOf(const std::string& formula) {
    try {
        FormulaParser::parse(formula);
    } catch (const ValidationError& e) {
        return e.code();
    }
    return ErrorCode::kSuccess;
}

} // namespace

TEST(FormulaParserTest, SimpleFormula) {
    ParsedFormula water = FormulaParser::parse("H2O");
    EXPECT_EQ(water.counts.size(), 2u);
    EXPECT_EQ(water.counts["H"], 2);
    EXPECT_EQ(water.counts["O"], 1);
    EXPECT_EQ(water.charge, 0);
}

TEST(FormulaParserTest, RepeatedElementsAccumulate) {
    ParsedFormula ethanol = FormulaParser::parse("CH3CH2OH");
    EXPECT_EQ(ethanol.counts["C"], 2);
    EXPECT_EQ(ethanol.counts["H"], 6);
    EXPECT_EQ(ethanol.counts["O"], 1);
}

TEST(FormulaParserTest, Groups) {
    ParsedFormula hydroxide = FormulaParser::parse("Ca(OH)2");
    EXPECT_EQ(hydroxide.counts["Ca"], 1);
    EXPECT_EQ(hydroxide.counts["O"], 2);
    EXPECT_EQ(hydroxide.counts["H"], 2);

    ParsedFormula ferrocyanide = FormulaParser::parse("K4[Fe(CN)6]");
    EXPECT_EQ(ferrocyanide.counts["K"], 4);
    EXPECT_EQ(ferrocyanide.counts["Fe"], 1);
    EXPECT_EQ(ferrocyanide.counts["C"], 6);
    EXPECT_EQ(ferrocyanide.counts["N"], 6);
}

TEST(FormulaParserTest, Hydrates) {
    ParsedFormula dot = FormulaParser::parse("CuSO4.5H2O");
    EXPECT_EQ(dot.counts["Cu"], 1);
    EXPECT_EQ(dot.counts["S"], 1);
    EXPECT_EQ(dot.counts["O"], 9);
    EXPECT_EQ(dot.counts["H"], 10);

    ParsedFormula middleDot = FormulaParser::parse("CuSO4\xC2\xB7" "5H2O");
    EXPECT_EQ(middleDot.counts, dot.counts);

    ParsedFormula star = FormulaParser::parse("CaSO4*2H2O");
    EXPECT_EQ(star.counts["H"], 4);
    EXPECT_EQ(star.counts["O"], 6);
}

TEST(FormulaParserTest, CaretCharges) {
    EXPECT_EQ(FormulaParser::parse("Fe^3+").charge, 3);
    EXPECT_EQ(FormulaParser::parse("SO4^2-").charge, -2);
    EXPECT_EQ(FormulaParser::parse("Na^+").charge, 1);
    EXPECT_EQ(FormulaParser::parse("Cl^-").charge, -1);
    EXPECT_EQ(FormulaParser::parse("Fe^+2").charge, 2);

    ParsedFormula sulfate = FormulaParser::parse("SO4^2-");
    EXPECT_EQ(sulfate.counts["S"], 1);
    EXPECT_EQ(sulfate.counts["O"], 4);
}

TEST(FormulaParserTest, SuperscriptCharges) {
    ParsedFormula iron = FormulaParser::parse("Fe\xC2\xB3\xE2\x81\xBA");
    EXPECT_EQ(iron.charge, 3);
    EXPECT_EQ(iron.counts["Fe"], 1);

    EXPECT_EQ(FormulaParser::parse("OH\xE2\x81\xBB").charge, -1);
}

TEST(FormulaParserTest, BareTrailingSigns) {
    EXPECT_EQ(FormulaParser::parse("OH-").charge, -1);
    EXPECT_EQ(FormulaParser::parse("Na+").charge, 1);
    EXPECT_EQ(FormulaParser::parse("Fe+++").charge, 3);
}

TEST(FormulaParserTest, Errors) {
    EXPECT_EQ(errorCodeOf(""), ErrorCode::kEmptyFormula);
    EXPECT_EQ(errorCodeOf("   "), ErrorCode::kEmptyFormula);
    EXPECT_EQ(errorCodeOf("Xx2"), ErrorCode::kUnknownElement);
    EXPECT_EQ(errorCodeOf("H2(O"), ErrorCode::kMalformedFormula);
    EXPECT_EQ(errorCodeOf("H2O)"), ErrorCode::kMalformedFormula);
    EXPECT_EQ(errorCodeOf("h2o"), ErrorCode::kMalformedFormula);
    EXPECT_EQ(errorCodeOf("H0"), ErrorCode::kMalformedFormula);
    EXPECT_EQ(errorCodeOf("()2"), ErrorCode::kMalformedFormula);
}

TEST(FormulaParserTest, CountsMustFitInt) {
    EXPECT_EQ(FormulaParser::parse("(H999999)2000").counts["H"], 1999998000);
    EXPECT_EQ(errorCodeOf("(H999999)3000"), ErrorCode::kMalformedFormula);
    EXPECT_EQ(errorCodeOf("((H999999)999999)999999"), ErrorCode::kMalformedFormula);
    EXPECT_EQ(errorCodeOf("CuSO4.999999H999999"), ErrorCode::kMalformedFormula);
}
