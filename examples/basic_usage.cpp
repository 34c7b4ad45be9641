/// Basic usage example for Stoichiometrica
/// Walks through building, balancing, classifying and quantifying reactions

#include <stoichiometrica/Stoichiometrica.hpp>
#include <iostream>

int main() {
    using namespace Stoichiometrica;

    // Build a reaction from species (coefficients default to 1)
    Reaction combustion("propane combustion");
    combustion.addReactant("C3H8").addReactant("O2").addProduct("CO2").addProduct("H2O");

    std::cout << "Before balancing: " << combustion << "\n";

    try {
        combustion.balance();
    } catch (const BalancingError& e) {
        std::cerr << "Balancing failed (code " << e.code() << "): " << e.what() << std::endl;
        return 1;
    }

    std::cout << "After balancing:  " << combustion << "\n";
    std::cout << "Type: " << combustion.type() << "\n";

    // Or parse an equation string; ionic charges and phases are understood
    Reaction ionic = parseEquation("Fe^2+(aq) + Ce^4+(aq) -> Fe^3+(aq) + Ce^3+(aq)");
    ionic.balance();
    printResults(ionic);

    // Quantities need a balanced reaction
    Reaction ammonia = balanceReaction(parseEquation("N2 + H2 -> NH3"));
    StoichiometryCalculator::SpeciesAmounts amounts = {{"N2", 2.0}, {"H2", 3.0}};

    auto limiting = StoichiometryCalculator::findLimitingReactant(ammonia, amounts);
    auto yield = StoichiometryCalculator::calculateTheoreticalYield(ammonia, amounts);
    if (limiting.second == ErrorCode::kSuccess && yield.second == ErrorCode::kSuccess) {
        std::cout << "\nLimiting reactant: " << limiting.first << "\n";
        std::cout << "NH3 formed: " << yield.first["H3N"] << " mol\n";
    } else {
        std::cerr << "Yield calculation failed: " << getErrorMessage(yield.second) << std::endl;
    }

    // Hints for an unbalanced equation
    for (const auto& step : suggestBalancingSteps(parseEquation("Al + O2 -> Al2O3"))) {
        std::cout << step << "\n";
    }

    return 0;
}
