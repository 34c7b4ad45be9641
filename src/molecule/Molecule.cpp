#include "stoichiometrica/molecule/Molecule.hpp"
#include "stoichiometrica/data/PeriodicTable.hpp"
#include "stoichiometrica/molecule/FormulaParser.hpp"
#include "stoichiometrica/util/Exceptions.hpp"

namespace Stoichiometrica {

Molecule::Molecule(const std::map<std::string, int>& counts,
                   int charge,
                   Constants::Phase phase,
                   const std::string& sourceFormula)
    : sourceFormula_(sourceFormula), charge_(charge), phase_(phase) {
    if (counts.empty()) {
        throw ValidationError(ErrorCode::kEmptyFormula, "molecule has no elements");
    }

    for (const auto& entry : counts) {
        if (!PeriodicTable::isElement(entry.first)) {
            throw ValidationError(ErrorCode::kUnknownElement, entry.first);
        }
        if (entry.second <= 0) {
            throw ValidationError(ErrorCode::kMalformedFormula,
                                  "non-positive count for " + entry.first);
        }
        elements_.emplace_back(entry.first, entry.second);
        molecularWeight_ += PeriodicTable::getAtomicWeight(entry.first) * entry.second;
    }

    sortHill(elements_);
    formula_ = hillFormula(elements_);
}

std::shared_ptr<const Molecule> Molecule::fromFormula(const std::string& formula,
                                                      Constants::Phase phase) {
    ParsedFormula parsed = FormulaParser::parse(formula);
    return std::make_shared<const Molecule>(parsed.counts, parsed.charge, phase, formula);
}

std::shared_ptr<const Molecule> Molecule::fromElements(const std::map<std::string, int>& counts,
                                                       int charge,
                                                       Constants::Phase phase) {
    return std::make_shared<const Molecule>(counts, charge, phase);
}

std::shared_ptr<const Molecule> Molecule::withPhase(Constants::Phase phase) const {
    auto copy = std::make_shared<Molecule>(*this);
    copy->phase_ = phase;
    return copy;
}

std::shared_ptr<const Molecule> Molecule::withCharge(int charge) const {
    auto copy = std::make_shared<Molecule>(*this);
    copy->charge_ = charge;
    // The written formula carries the old charge
    copy->sourceFormula_.clear();
    return copy;
}

std::string Molecule::sourceFormula() const {
    if (sourceFormula_.empty()) {
        return label();
    }
    return sourceFormula_;
}

} // namespace Stoichiometrica
