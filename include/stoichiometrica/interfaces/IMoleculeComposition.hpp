/// @file IMoleculeComposition.hpp
/// @brief Interface for the composition of a chemical species
/// @details Everything the balancer and the classifiers need from a
/// molecule: element counts in Hill order, formula strings, weight, phase
/// and ionic charge. Any molecule model can take part in a Reaction by
/// implementing it.

#pragma once

#include "stoichiometrica/util/Constants.hpp"
#include <string>
#include <utility>
#include <vector>

namespace Stoichiometrica {

/// Element symbol to atom count, Hill ordered, all counts positive
using ElementCounts = std::vector<std::pair<std::string, int>>;

/// @brief Abstract interface for a species composition
class IMoleculeComposition {
public:
    virtual ~IMoleculeComposition() = default;

    /// @brief Element counts in Hill order
    virtual const ElementCounts& elements() const = 0;

    /// @brief Canonical Hill formula without charge ("C2H6O", "Fe")
    virtual std::string formula() const = 0;

    /// @brief Formula as the user wrote it, used for group patterns
    virtual std::string sourceFormula() const { return label(); }

    /// @brief Display label including charge ("Fe^2+")
    virtual std::string label() const;

    /// @brief Molar mass [g/mol]
    virtual double molecularWeight() const = 0;

    /// @brief Intrinsic phase, Phase::None when unspecified
    virtual Constants::Phase phase() const = 0;

    /// @brief Net ionic charge
    virtual int charge() const = 0;

    /// @brief Atom count of one element, 0 if absent
    int countOf(const std::string& symbol) const;

    /// @brief Check if element is present
    bool contains(const std::string& symbol) const { return countOf(symbol) > 0; }

    /// @brief Single element, e.g. O2 or Fe^3+
    bool isElemental() const { return elements().size() == 1; }

    /// @brief Single atom carrying a charge, e.g. Fe^3+ or Cl^-
    bool isMonatomicIon() const;

    /// @brief Same element counts and same charge
    bool sameComposition(const IMoleculeComposition& other) const;
};

/// @brief Render a charge suffix: "", "^+", "^2-"
std::string formatCharge(int charge);

/// @brief Sort element counts into Hill order (C, H, then alphabetical)
void sortHill(ElementCounts& counts);

/// @brief Hill formula string of element counts
std::string hillFormula(const ElementCounts& counts);

} // namespace Stoichiometrica
