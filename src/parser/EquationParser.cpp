/// @file EquationParser.cpp
/// @brief Implementation of the equation string parser

#include "stoichiometrica/parser/EquationParser.hpp"
#include "stoichiometrica/util/Exceptions.hpp"
#include <cctype>
#include <cstdlib>

namespace Stoichiometrica {

namespace {

const char* kArrows[] = {"->", "\xE2\x86\x92", "="};
const char* kEmptySet = "\xE2\x88\x85";

std::string trim(const std::string& s) {
    std::size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// A phase suffix such as "(aq)" starting at pos
bool phaseAt(const std::string& text, std::size_t pos) {
    std::size_t close = text.find(')', pos);
    if (text[pos] != '(' || close == std::string::npos) {
        return false;
    }
    std::pair<Constants::Phase, bool> phase =
        Constants::parsePhaseName(text.substr(pos + 1, close - pos - 1));
    return phase.second && phase.first != Constants::Phase::None;
}

bool startsTerm(const std::string& text, std::size_t pos) {
    char c = text[pos];
    if (c == '(') {
        return !phaseAt(text, pos);
    }
    return std::isupper(static_cast<unsigned char>(c)) ||
           std::isdigit(static_cast<unsigned char>(c)) || c == '[';
}

} // namespace

Reaction EquationParser::parse(const std::string& equation) {
    std::size_t arrowPos = std::string::npos;
    std::size_t arrowLen = 0;
    for (const char* arrow : kArrows) {
        arrowPos = equation.find(arrow);
        if (arrowPos != std::string::npos) {
            arrowLen = std::string(arrow).size();
            break;
        }
    }
    if (arrowPos == std::string::npos) {
        throw ValidationError(ErrorCode::kMalformedEquation, "no arrow in '" + equation + "'");
    }

    std::string left = equation.substr(0, arrowPos);
    std::string right = equation.substr(arrowPos + arrowLen);
    for (const char* arrow : kArrows) {
        if (right.find(arrow) != std::string::npos) {
            throw ValidationError(ErrorCode::kMalformedEquation, "more than one arrow in '" + equation + "'");
        }
    }

    Reaction reaction;
    for (const auto& raw : splitTerms(left)) {
        EquationTerm term = parseTerm(raw);
        reaction.addReactant(term.formula, term.coefficient, term.phase);
    }
    for (const auto& raw : splitTerms(right)) {
        EquationTerm term = parseTerm(raw);
        reaction.addProduct(term.formula, term.coefficient, term.phase);
    }
    return reaction;
}

std::vector<std::string> EquationParser::splitTerms(const std::string& side) {
    std::vector<std::string> terms;
    std::string text = trim(side);
    if (text.empty() || text == kEmptySet) {
        return terms;
    }

    bool spaced = false;
    for (std::size_t i = 1; i + 1 < text.size(); ++i) {
        if (text[i] == '+' && isSpace(text[i - 1]) && isSpace(text[i + 1])) {
            spaced = true;
            break;
        }
    }

    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        bool separator = false;
        if (c == '+') {
            if (spaced) {
                separator = i > 0 && i + 1 < text.size() && isSpace(text[i - 1]) && isSpace(text[i + 1]);
            } else {
                separator = i > 0 && text[i - 1] != '^' && i + 1 < text.size() && startsTerm(text, i + 1);
            }
        }
        if (separator) {
            terms.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    terms.push_back(trim(current));

    for (const auto& term : terms) {
        if (term.empty()) {
            throw ValidationError(ErrorCode::kMalformedEquation, "empty term in '" + side + "'");
        }
    }
    return terms;
}

EquationTerm EquationParser::parseTerm(const std::string& term) {
    EquationTerm result;
    std::string text = trim(term);

    // Leading coefficient: "2", "0.5", "1.5 "
    std::size_t pos = 0;
    while (pos < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
        ++pos;
    }
    if (pos > 0) {
        std::string number = text.substr(0, pos);
        char* end = nullptr;
        result.coefficient = std::strtod(number.c_str(), &end);
        if (end != number.c_str() + number.size()) {
            throw ValidationError(ErrorCode::kMalformedEquation, "bad coefficient in '" + term + "'");
        }
        text = trim(text.substr(pos));
    }

    // Trailing phase: "(aq)", "(s)"
    if (!text.empty() && text.back() == ')') {
        std::size_t open = text.rfind('(');
        if (open != std::string::npos) {
            std::string name = text.substr(open + 1, text.size() - open - 2);
            std::pair<Constants::Phase, bool> phase = Constants::parsePhaseName(name);
            if (phase.second && phase.first != Constants::Phase::None) {
                result.phase = phase.first;
                text = trim(text.substr(0, open));
            }
        }
    }

    if (text.empty()) {
        throw ValidationError(ErrorCode::kMalformedEquation, "no formula in '" + term + "'");
    }
    result.formula = text;
    return result;
}

} // namespace Stoichiometrica
