/// @file EquationParser.hpp
/// @brief Parser for chemical equation strings
/// @details Grammar:
///   equation := side arrow side
///   arrow    := "->" | "→" | "="
///   side     := term ('+' term)* | "∅" | ""
///   term     := [coefficient] formula [phase]
///   phase    := "(s)" | "(l)" | "(g)" | "(aq)"
///
/// When a side contains " + " (plus surrounded by whitespace) only those
/// separate terms, so "Fe^3+ + Ce^3+" is read correctly. Without spaces a
/// '+' separates terms when it is not part of a charge, i.e. not right after
/// '^' and followed by the start of a new term.

#pragma once

#include "stoichiometrica/model/Reaction.hpp"
#include "stoichiometrica/util/Constants.hpp"
#include <string>
#include <vector>

namespace Stoichiometrica {

/// @brief One side term after coefficient and phase extraction
struct EquationTerm {
    double coefficient = 1.0;
    std::string formula;
    Constants::Phase phase = Constants::Phase::None;
};

class EquationParser {
public:
    /// @brief Parse an equation into a Reaction
    /// @throws ValidationError (kMalformedEquation) on a missing or repeated
    /// arrow or an empty term; formula errors propagate from Molecule
    static Reaction parse(const std::string& equation);

    /// @brief Split one side into raw term strings
    static std::vector<std::string> splitTerms(const std::string& side);

    /// @brief Extract leading coefficient and trailing phase of a term
    static EquationTerm parseTerm(const std::string& term);
};

} // namespace Stoichiometrica
