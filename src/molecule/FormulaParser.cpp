/// @file FormulaParser.cpp
/// @brief Implementation of the molecular formula parser

#include "stoichiometrica/molecule/FormulaParser.hpp"
#include "stoichiometrica/data/PeriodicTable.hpp"
#include "stoichiometrica/util/Exceptions.hpp"
#include <cctype>
#include <climits>
#include <vector>

namespace Stoichiometrica {

namespace {

constexpr std::size_t kMaxCountDigits = 6;

// UTF-8 superscripts and their ASCII equivalents
const std::pair<const char*, char> kSuperscripts[] = {
    {"\xE2\x81\xB0", '0'}, {"\xC2\xB9", '1'}, {"\xC2\xB2", '2'}, {"\xC2\xB3", '3'},
    {"\xE2\x81\xB4", '4'}, {"\xE2\x81\xB5", '5'}, {"\xE2\x81\xB6", '6'},
    {"\xE2\x81\xB7", '7'}, {"\xE2\x81\xB8", '8'}, {"\xE2\x81\xB9", '9'},
    {"\xE2\x81\xBA", '+'}, {"\xE2\x81\xBB", '-'}
};

const char* kMiddleDot = "\xC2\xB7";

std::string trim(const std::string& s) {
    std::size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isDigits(const std::string& s) {
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

int parseChargeText(const std::string& chargeText, const std::string& formula) {
    if (chargeText.empty()) {
        throw ValidationError(ErrorCode::kMalformedFormula, "empty charge in '" + formula + "'");
    }

    int sign = 0;
    std::string digits;
    if (chargeText.front() == '+' || chargeText.front() == '-') {
        sign = (chargeText.front() == '+') ? 1 : -1;
        digits = chargeText.substr(1);
    } else if (chargeText.back() == '+' || chargeText.back() == '-') {
        sign = (chargeText.back() == '+') ? 1 : -1;
        digits = chargeText.substr(0, chargeText.size() - 1);
    } else {
        throw ValidationError(ErrorCode::kMalformedFormula, "charge without sign in '" + formula + "'");
    }

    if (!isDigits(digits) || digits.size() > kMaxCountDigits) {
        throw ValidationError(ErrorCode::kMalformedFormula, "bad charge in '" + formula + "'");
    }

    int magnitude = digits.empty() ? 1 : std::stoi(digits);
    if (magnitude == 0) {
        throw ValidationError(ErrorCode::kMalformedFormula, "zero charge magnitude in '" + formula + "'");
    }
    return sign * magnitude;
}

// Reads an optional count at pos; absent means 1
int readCount(const std::string& text, std::size_t& pos) {
    std::size_t start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == start) {
        return 1;
    }
    if (pos - start > kMaxCountDigits) {
        throw ValidationError(ErrorCode::kMalformedFormula, "count too large in '" + text + "'");
    }
    int count = std::stoi(text.substr(start, pos - start));
    if (count == 0) {
        throw ValidationError(ErrorCode::kMalformedFormula, "zero count in '" + text + "'");
    }
    return count;
}

// current + count * multiplier, rejecting totals that do not fit an int
int addCount(int current, int count, int multiplier, const std::string& text) {
    long long total = static_cast<long long>(count) * multiplier + current;
    if (total > INT_MAX) {
        throw ValidationError(ErrorCode::kMalformedFormula, "count too large in '" + text + "'");
    }
    return static_cast<int>(total);
}

} // namespace

ParsedFormula FormulaParser::parse(const std::string& formula) {
    std::string body = trim(formula);
    if (body.empty()) {
        throw ValidationError(ErrorCode::kEmptyFormula, "");
    }

    ParsedFormula result;
    result.charge = extractCharge(body);

    // Hydrates: normalise separators to '.'
    std::size_t dot = body.find(kMiddleDot);
    while (dot != std::string::npos) {
        body.replace(dot, 2, ".");
        dot = body.find(kMiddleDot);
    }

    std::size_t start = 0;
    while (start <= body.size()) {
        std::size_t end = body.find_first_of(".*", start);
        if (end == std::string::npos) {
            end = body.size();
        }
        std::string segment = body.substr(start, end - start);
        if (segment.empty()) {
            throw ValidationError(ErrorCode::kMalformedFormula, "empty segment in '" + formula + "'");
        }

        std::size_t pos = 0;
        int multiplier = readCount(segment, pos);
        std::map<std::string, int> segmentCounts;
        parseGroupSequence(segment.substr(pos), segmentCounts);
        for (const auto& entry : segmentCounts) {
            int& total = result.counts[entry.first];
            total = addCount(total, entry.second, multiplier, formula);
        }

        start = end + 1;
    }

    if (result.counts.empty()) {
        throw ValidationError(ErrorCode::kMalformedFormula, "no elements in '" + formula + "'");
    }
    return result;
}

int FormulaParser::extractCharge(std::string& body) {
    const std::string original = body;

    // Caret notation: "Fe^3+", "SO4^2-", "Na^+"
    std::size_t caret = body.find('^');
    if (caret != std::string::npos) {
        std::string chargeText = body.substr(caret + 1);
        body.erase(caret);
        return parseChargeText(chargeText, original);
    }

    // Unicode superscripts: "Fe³⁺"
    std::string chargeText;
    bool stripped = true;
    while (stripped) {
        stripped = false;
        for (const auto& sup : kSuperscripts) {
            if (endsWith(body, sup.first)) {
                body.erase(body.size() - std::string(sup.first).size());
                chargeText.insert(chargeText.begin(), sup.second);
                stripped = true;
                break;
            }
        }
    }
    if (!chargeText.empty()) {
        return parseChargeText(chargeText, original);
    }

    // Bare trailing signs: "OH-", "Na+", "Fe+++"
    if (!body.empty() && (body.back() == '+' || body.back() == '-')) {
        char sign = body.back();
        int magnitude = 0;
        while (!body.empty() && body.back() == sign) {
            body.pop_back();
            ++magnitude;
        }
        return (sign == '+') ? magnitude : -magnitude;
    }

    return 0;
}

void FormulaParser::parseGroupSequence(const std::string& text,
                                       std::map<std::string, int>& counts) {
    if (text.empty()) {
        throw ValidationError(ErrorCode::kMalformedFormula, "missing formula body");
    }

    std::vector<std::map<std::string, int>> stack(1);
    std::vector<char> openers;
    std::size_t i = 0;

    while (i < text.size()) {
        char c = text[i];
        if (c == '(' || c == '[') {
            stack.emplace_back();
            openers.push_back(c);
            ++i;
        } else if (c == ')' || c == ']') {
            char expected = (c == ')') ? '(' : '[';
            if (openers.empty() || openers.back() != expected) {
                throw ValidationError(ErrorCode::kMalformedFormula, "unbalanced brackets in '" + text + "'");
            }
            openers.pop_back();
            ++i;
            int multiplier = readCount(text, i);
            std::map<std::string, int> group = std::move(stack.back());
            stack.pop_back();
            if (group.empty()) {
                throw ValidationError(ErrorCode::kMalformedFormula, "empty group in '" + text + "'");
            }
            for (const auto& entry : group) {
                int& total = stack.back()[entry.first];
                total = addCount(total, entry.second, multiplier, text);
            }
        } else if (std::isupper(static_cast<unsigned char>(c))) {
            std::string symbol(1, c);
            ++i;
            if (i < text.size() && std::islower(static_cast<unsigned char>(text[i]))) {
                symbol += text[i];
                ++i;
            }
            if (!PeriodicTable::isElement(symbol)) {
                throw ValidationError(ErrorCode::kUnknownElement, symbol);
            }
            int count = readCount(text, i);
            int& total = stack.back()[symbol];
            total = addCount(total, count, 1, text);
        } else {
            throw ValidationError(ErrorCode::kMalformedFormula,
                                  std::string("unexpected '") + c + "' in '" + text + "'");
        }
    }

    if (!openers.empty()) {
        throw ValidationError(ErrorCode::kMalformedFormula, "unclosed bracket in '" + text + "'");
    }

    for (const auto& entry : stack.front()) {
        int& total = counts[entry.first];
        total = addCount(total, entry.second, 1, text);
    }
}

} // namespace Stoichiometrica
