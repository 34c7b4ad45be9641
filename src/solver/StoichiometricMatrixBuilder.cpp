#include "stoichiometrica/solver/StoichiometricMatrixBuilder.hpp"
#include "stoichiometrica/model/Reaction.hpp"
#include "stoichiometrica/util/Constants.hpp"
#include <algorithm>
#include <map>

namespace Stoichiometrica {

namespace {

std::map<std::string, bool> elementSet(const std::vector<ReactionComponent>& components) {
    std::map<std::string, bool> present;
    for (const auto& c : components) {
        if (c.isCatalyst) {
            continue;
        }
        for (const auto& entry : c.molecule->elements()) {
            present[entry.first] = true;
        }
    }
    return present;
}

} // namespace

StoichiometricMatrix StoichiometricMatrixBuilder::build(const Reaction& reaction) {
    return build(reaction.getReactants(false), reaction.getProducts());
}

StoichiometricMatrix StoichiometricMatrixBuilder::build(
    const std::vector<ReactionComponent>& reactants,
    const std::vector<ReactionComponent>& products) {
    StoichiometricMatrix result;

    std::vector<const ReactionComponent*> species;
    for (const auto& r : reactants) {
        if (!r.isCatalyst) {
            species.push_back(&r);
        }
    }
    result.numReactants = species.size();
    for (const auto& p : products) {
        species.push_back(&p);
    }

    // Row index per element, alphabetical
    std::map<std::string, int> rowOf;
    bool charged = false;
    for (const ReactionComponent* c : species) {
        for (const auto& entry : c->molecule->elements()) {
            rowOf[entry.first] = 0;
        }
        if (c->molecule->charge() != 0) {
            charged = true;
        }
    }
    int row = 0;
    for (auto& entry : rowOf) {
        entry.second = row++;
        result.rowLabels.push_back(entry.first);
    }
    if (charged) {
        result.rowLabels.push_back(Constants::kChargeRowLabel);
        result.hasChargeRow = true;
    }

    const int nRows = static_cast<int>(result.rowLabels.size());
    const int nCols = static_cast<int>(species.size());
    result.matrix = Eigen::MatrixXd::Zero(nRows, nCols);

    for (int j = 0; j < nCols; ++j) {
        const ReactionComponent* c = species[j];
        const double sign = (static_cast<std::size_t>(j) < result.numReactants) ? -1.0 : 1.0;
        for (const auto& entry : c->molecule->elements()) {
            result.matrix(rowOf[entry.first], j) = sign * entry.second;
        }
        if (charged) {
            result.matrix(nRows - 1, j) = sign * c->molecule->charge();
        }
        result.columnLabels.push_back(c->molecule->label());
    }

    return result;
}

std::vector<std::string> StoichiometricMatrixBuilder::findUnconservedElements(
    const std::vector<ReactionComponent>& reactants,
    const std::vector<ReactionComponent>& products) {
    std::map<std::string, bool> left = elementSet(reactants);
    std::map<std::string, bool> right = elementSet(products);

    std::vector<std::string> missing;
    for (const auto& entry : left) {
        if (right.find(entry.first) == right.end()) {
            missing.push_back(entry.first);
        }
    }
    for (const auto& entry : right) {
        if (left.find(entry.first) == left.end()) {
            missing.push_back(entry.first);
        }
    }
    std::sort(missing.begin(), missing.end());
    return missing;
}

} // namespace Stoichiometrica
