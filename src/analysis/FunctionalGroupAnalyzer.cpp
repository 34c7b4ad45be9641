#include "stoichiometrica/analysis/FunctionalGroupAnalyzer.hpp"
#include "stoichiometrica/model/Reaction.hpp"
#include <algorithm>

namespace Stoichiometrica {

bool FunctionalGroupAnalyzer::matches(const FunctionalGroupPattern& pattern,
                                      const IMoleculeComposition& molecule) const {
    const std::string formula = molecule.sourceFormula();

    if (!pattern.forbiddenPrefix.empty() &&
        formula.compare(0, pattern.forbiddenPrefix.size(), pattern.forbiddenPrefix) == 0) {
        return false;
    }

    for (const auto& token : pattern.noneOf) {
        if (formula.find(token) != std::string::npos) {
            return false;
        }
    }

    for (const auto& token : pattern.anyOf) {
        bool found = pattern.matchElements ? molecule.contains(token)
                                           : formula.find(token) != std::string::npos;
        if (found) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> FunctionalGroupAnalyzer::groupsOf(const IMoleculeComposition& molecule) const {
    std::vector<std::string> groups;
    for (const auto& pattern : data_.functionalGroups) {
        if (matches(pattern, molecule)) {
            groups.push_back(pattern.name);
        }
    }
    return groups;
}

std::map<std::string, double> FunctionalGroupAnalyzer::identifyGroups(
    const std::vector<ReactionComponent>& components) const {
    std::map<std::string, double> counts;
    for (const auto& c : components) {
        if (c.isCatalyst) {
            continue;
        }
        for (const auto& group : groupsOf(*c.molecule)) {
            counts[group] += c.coefficient;
        }
    }
    return counts;
}

std::string FunctionalGroupAnalyzer::classifyMechanism(
    const std::vector<std::pair<std::string, std::string>>& transformations) const {
    auto present = [&transformations](const std::pair<std::string, std::string>& pair) {
        return std::find(transformations.begin(), transformations.end(), pair) != transformations.end();
    };

    for (const auto& mechanism : data_.mechanisms) {
        if (mechanism.transformations.empty()) {
            continue;
        }
        bool matched = mechanism.requireAll
            ? std::all_of(mechanism.transformations.begin(), mechanism.transformations.end(), present)
            : std::any_of(mechanism.transformations.begin(), mechanism.transformations.end(), present);
        if (matched) {
            return mechanism.name;
        }
    }
    return "unknown";
}

FunctionalGroupResult FunctionalGroupAnalyzer::analyze(const Reaction& reaction) const {
    FunctionalGroupResult result;
    result.reactantGroups = identifyGroups(reaction.getReactants(false));
    result.productGroups = identifyGroups(reaction.getProducts());

    for (const auto& lost : result.reactantGroups) {
        auto after = result.productGroups.find(lost.first);
        if (after != result.productGroups.end() && after->second >= lost.second) {
            continue;
        }
        for (const auto& gained : result.productGroups) {
            auto before = result.reactantGroups.find(gained.first);
            if (before == result.reactantGroups.end() || gained.second > before->second) {
                result.transformations.emplace_back(lost.first, gained.first);
            }
        }
    }

    result.mechanism = classifyMechanism(result.transformations);
    return result;
}

} // namespace Stoichiometrica
