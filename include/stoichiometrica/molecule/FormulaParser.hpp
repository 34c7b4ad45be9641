/// @file FormulaParser.hpp
/// @brief Parser for molecular formula strings
/// @details Accepts element symbols with counts, nested () and [] groups
/// with multipliers, hydrate separators ('.', '*', U+00B7) with a leading
/// multiplier, and an ionic charge written as "^2+", "^+2", "^-", Unicode
/// superscripts ("Fe³⁺") or a bare trailing sign ("OH-").

#pragma once

#include <map>
#include <string>

namespace Stoichiometrica {

/// @brief Result of parsing one formula
struct ParsedFormula {
    std::map<std::string, int> counts;  ///< Element -> atom count
    int charge = 0;
};

class FormulaParser {
public:
    /// @brief Parse a formula string
    /// @param formula Formula such as "CuSO4.5H2O" or "Fe^3+"
    /// @return Element counts and charge
    /// @throws ValidationError on empty input, unknown elements or bad syntax
    static ParsedFormula parse(const std::string& formula);

private:
    static int extractCharge(std::string& body);
    static void parseGroupSequence(const std::string& text,
                                   std::map<std::string, int>& counts);
};

} // namespace Stoichiometrica
