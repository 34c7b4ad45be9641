#include "stoichiometrica/interfaces/IMoleculeComposition.hpp"
#include <algorithm>
#include <cstdlib>

namespace Stoichiometrica {

namespace {

int hillRank(const std::string& symbol) {
    if (symbol == "C") return 0;
    if (symbol == "H") return 1;
    return 2;
}

} // namespace

std::string IMoleculeComposition::label() const {
    return formula() + formatCharge(charge());
}

int IMoleculeComposition::countOf(const std::string& symbol) const {
    for (const auto& entry : elements()) {
        if (entry.first == symbol) {
            return entry.second;
        }
    }
    return 0;
}

bool IMoleculeComposition::isMonatomicIon() const {
    const auto& counts = elements();
    return counts.size() == 1 && charge() != 0;
}

bool IMoleculeComposition::sameComposition(const IMoleculeComposition& other) const {
    return charge() == other.charge() && elements() == other.elements();
}

std::string formatCharge(int charge) {
    if (charge == 0) {
        return "";
    }
    std::string suffix = "^";
    int magnitude = std::abs(charge);
    if (magnitude > 1) {
        suffix += std::to_string(magnitude);
    }
    suffix += (charge > 0) ? "+" : "-";
    return suffix;
}

void sortHill(ElementCounts& counts) {
    std::sort(counts.begin(), counts.end(),
              [](const std::pair<std::string, int>& a, const std::pair<std::string, int>& b) {
                  int ra = hillRank(a.first);
                  int rb = hillRank(b.first);
                  if (ra != rb) {
                      return ra < rb;
                  }
                  return a.first < b.first;
              });
}

std::string hillFormula(const ElementCounts& counts) {
    std::string result;
    for (const auto& entry : counts) {
        result += entry.first;
        if (entry.second != 1) {
            result += std::to_string(entry.second);
        }
    }
    return result;
}

} // namespace Stoichiometrica
