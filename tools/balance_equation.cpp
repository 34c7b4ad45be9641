/// @file balance_equation.cpp
/// @brief Balance and classify equations given on the command line
/// @details Usage: stoich_balance [-v|-vv] [--steps] "EQUATION" ...
/// Without equations, one equation per line is read from stdin.

#include "stoichiometrica/Stoichiometrica.hpp"
#include "stoichiometrica/util/Diagnostics.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace Stoichiometrica;

namespace {

int processEquation(const std::string& equation, bool showSteps) {
    Reaction reaction;
    try {
        reaction = parseEquation(equation);
    } catch (const ValidationError& e) {
        std::cerr << "Cannot parse '" << equation << "' (code " << e.code() << "): "
                  << e.what() << "\n";
        return 1;
    }

    if (showSteps) {
        for (const auto& step : suggestBalancingSteps(reaction)) {
            std::cout << step << "\n";
        }
    }

    try {
        reaction.balance();
    } catch (const BalancingError& e) {
        std::cerr << "Cannot balance '" << equation << "' (code " << e.code() << "): "
                  << e.what() << "\n";
        return 1;
    }

    printResults(reaction);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    bool showSteps = false;
    std::vector<std::string> equations;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v") {
            setVerbosity(Diagnostics::kWarnings);
        } else if (arg == "-vv") {
            setVerbosity(Diagnostics::kDebug);
        } else if (arg == "--steps") {
            showSteps = true;
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [-v|-vv] [--steps] \"EQUATION\" ...\n"
                      << "  e.g. " << argv[0] << " \"C3H8 + O2 -> CO2 + H2O\"\n";
            return 0;
        } else {
            equations.push_back(arg);
        }
    }

    if (equations.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line[0] != '#') {
                equations.push_back(line);
            }
        }
    }

    int failures = 0;
    for (const auto& equation : equations) {
        failures += processEquation(equation, showSteps);
    }

    if (equations.size() > 1) {
        std::cout << "\n" << (equations.size() - failures) << "/" << equations.size()
                  << " equations balanced\n";
    }
    return failures == 0 ? 0 : 1;
}
