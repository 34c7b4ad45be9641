#include "stoichiometrica/Stoichiometrica.hpp"
#include "stoichiometrica/parser/EquationParser.hpp"
#include "stoichiometrica/util/Diagnostics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Stoichiometrica {

namespace {

std::string formatAmount(double value) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3) << value;
    return os.str();
}

} // namespace

Reaction parseEquation(const std::string& equation) {
    return EquationParser::parse(equation);
}

Reaction balanceReaction(const Reaction& reaction) {
    Reaction balanced = reaction;
    balanced.balance();
    return balanced;
}

std::string balanceEquationString(const std::string& equation) {
    Reaction reaction = parseEquation(equation);
    reaction.balance();
    return reaction.toString();
}

BalanceReport verifyBalance(const Reaction& reaction, double tolerance) {
    BalanceReport report;
    report.elementBalance = reaction.getElementBalance();
    for (const auto& entry : report.elementBalance) {
        if (std::abs(entry.second) < tolerance) {
            report.balancedElements.insert(entry);
        } else {
            report.unbalancedElements.insert(entry);
        }
    }

    report.isBalanced = reaction.isBalanced(tolerance);
    report.massBalance = reaction.getMolecularWeightBalance();
    report.massBalanced = std::abs(report.massBalance) < tolerance;
    report.totalReactantMass = reaction.getReactantMass();
    report.totalProductMass = reaction.getProductMass();
    report.chargeBalance = reaction.getChargeBalance();
    report.numReactants = reaction.numReactants();
    report.numProducts = reaction.numProducts();
    report.numCatalysts = reaction.getCatalysts().size();
    return report;
}

std::vector<std::string> suggestBalancingSteps(const Reaction& reaction) {
    std::vector<std::string> steps;
    if (reaction.isBalanced()) {
        steps.push_back("Reaction is already balanced!");
        return steps;
    }

    std::map<std::string, double> unbalanced = reaction.getUnbalancedElements();
    steps.push_back("Unbalanced elements found:");
    for (const auto& entry : unbalanced) {
        if (entry.second > 0.0) {
            steps.push_back("  - " + entry.first + ": excess in products (+" + formatAmount(entry.second) + ")");
        } else {
            steps.push_back("  - " + entry.first + ": excess in reactants (" + formatAmount(entry.second) + ")");
        }
    }

    std::vector<std::pair<const IMoleculeComposition*, const char*>> species;
    for (const auto& r : reaction.getReactants(false)) {
        species.emplace_back(r.molecule.get(), "reactant");
    }
    for (const auto& p : reaction.getProducts()) {
        species.emplace_back(p.molecule.get(), "product");
    }

    if (!species.empty()) {
        auto mostComplex = species.front();
        for (const auto& s : species) {
            if (s.first->elements().size() > mostComplex.first->elements().size()) {
                mostComplex = s;
            }
        }
        steps.push_back("Suggestion: Start by balancing the most complex molecule:");
        steps.push_back("  - " + mostComplex.first->label() + " (" + mostComplex.second + ")");
    }

    // Fewest containing species first; stable for equal counts
    std::vector<std::pair<std::string, int>> order;
    for (const auto& entry : unbalanced) {
        int count = 0;
        for (const auto& s : species) {
            if (s.first->contains(entry.first)) {
                ++count;
            }
        }
        order.emplace_back(entry.first, count);
    }
    std::stable_sort(order.begin(), order.end(),
                     [](const std::pair<std::string, int>& a, const std::pair<std::string, int>& b) {
                         return a.second < b.second;
                     });

    if (!order.empty()) {
        steps.push_back("Suggested balancing order (least to most complex):");
        for (const auto& entry : order) {
            steps.push_back("  - " + entry.first + " (appears in " + std::to_string(entry.second) + " molecules)");
        }
    }
    return steps;
}

ClassificationResult analyzeReaction(const Reaction& reaction) {
    return reaction.classification();
}

void printResults(const Reaction& reaction) {
    const ClassificationResult result = reaction.classification();
    BalanceReport report = verifyBalance(reaction);
    const std::streamsize precision = std::cout.precision();

    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "       STOICHIOMETRICA RESULTS\n";
    std::cout << "========================================\n";

    if (!reaction.getName().empty()) {
        std::cout << "\nReaction: " << reaction.getName() << "\n";
    }
    std::cout << "\nEquation: " << reaction.toString() << "\n";

    std::cout << "\nBalance:\n";
    std::cout << "  Balanced:      " << (report.isBalanced ? "yes" : "no") << "\n";
    std::cout << "  Reactant mass: " << std::fixed << std::setprecision(4)
              << report.totalReactantMass << " g\n";
    std::cout << "  Product mass:  " << report.totalProductMass << " g\n";
    for (const auto& entry : report.unbalancedElements) {
        std::cout << "  " << std::setw(4) << std::left << entry.first << std::right
                  << ": " << std::showpos << entry.second << std::noshowpos << " atoms\n";
    }

    std::cout << "\nClassification:\n";
    std::cout << "  Primary type: " << result.primaryType << "\n";
    std::cout << "  Coarse type:  " << result.coarseType << "\n";
    for (const auto& entry : result.confidenceScores) {
        std::cout << "    " << std::setw(20) << std::left << entry.first << std::right
                  << ": " << std::setprecision(2) << entry.second << "\n";
    }

    const ElectronTransferResult& et = result.electronTransfer;
    if (et.isRedox) {
        std::cout << "\nElectron transfer (" << (et.fromIonicCharges ? "ionic charges" : "oxidation states") << "):\n";
        if (!et.oxidizingAgent.empty()) {
            std::cout << "  Oxidizing agent: " << et.oxidizingAgent << "\n";
        }
        if (!et.reducingAgent.empty()) {
            std::cout << "  Reducing agent:  " << et.reducingAgent << "\n";
        }
        for (const auto& entry : et.oxidationChanges) {
            std::cout << "  " << std::setw(4) << std::left << entry.first << std::right
                      << ": " << std::showpos << std::setprecision(2) << entry.second
                      << std::noshowpos << "\n";
        }
    }

    if (result.functionalGroups.mechanism != "unknown") {
        std::cout << "\nMechanism: " << result.functionalGroups.mechanism << "\n";
    }

    std::cout << "========================================\n";
    std::cout.unsetf(std::ios_base::floatfield);
    std::cout.precision(precision);
}

void setVerbosity(int level) {
    Diagnostics::setVerbosity(level);
}

const char* getErrorMessage(int errorCode) {
    return ErrorCode::getMessage(errorCode);
}

} // namespace Stoichiometrica
