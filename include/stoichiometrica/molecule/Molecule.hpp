/// @file Molecule.hpp
/// @brief Concrete species composition built from a formula or element map

#pragma once

#include "stoichiometrica/interfaces/IMoleculeComposition.hpp"
#include <map>
#include <memory>
#include <string>

namespace Stoichiometrica {

/// @brief Immutable molecule composition
/// @details Element counts are stored in Hill order and the molecular
/// weight is computed once from standard atomic weights.
class Molecule : public IMoleculeComposition {
public:
    /// @brief Construct from element counts
    /// @throws ValidationError if a count is not positive, a symbol is unknown,
    /// or the map is empty
    Molecule(const std::map<std::string, int>& counts,
             int charge = 0,
             Constants::Phase phase = Constants::Phase::None,
             const std::string& sourceFormula = "");

    /// @brief Parse a formula string ("H2SO4", "Fe^3+", "CuSO4.5H2O")
    static std::shared_ptr<const Molecule> fromFormula(
        const std::string& formula,
        Constants::Phase phase = Constants::Phase::None);

    static std::shared_ptr<const Molecule> fromElements(
        const std::map<std::string, int>& counts,
        int charge = 0,
        Constants::Phase phase = Constants::Phase::None);

    /// @brief Copy with a different intrinsic phase
    std::shared_ptr<const Molecule> withPhase(Constants::Phase phase) const;

    /// @brief Copy with a different charge
    std::shared_ptr<const Molecule> withCharge(int charge) const;

    const ElementCounts& elements() const override { return elements_; }
    std::string formula() const override { return formula_; }
    std::string sourceFormula() const override;
    double molecularWeight() const override { return molecularWeight_; }
    Constants::Phase phase() const override { return phase_; }
    int charge() const override { return charge_; }

private:
    ElementCounts elements_;
    std::string formula_;
    std::string sourceFormula_;
    double molecularWeight_ = 0.0;
    int charge_ = 0;
    Constants::Phase phase_ = Constants::Phase::None;
};

} // namespace Stoichiometrica
