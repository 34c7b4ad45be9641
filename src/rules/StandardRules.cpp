#include "stoichiometrica/rules/StandardRules.hpp"
#include "stoichiometrica/model/Reaction.hpp"
#include "stoichiometrica/molecule/Molecule.hpp"
#include "stoichiometrica/util/Constants.hpp"
#include <algorithm>

namespace Stoichiometrica {

namespace {

using ElementSet = std::vector<std::string>;

ElementSet elementSet(const ReactionComponent& component) {
    ElementSet symbols;
    for (const auto& entry : component.molecule->elements()) {
        symbols.push_back(entry.first);
    }
    return symbols;
}

bool has(const ElementSet& symbols, const std::string& symbol) {
    return std::find(symbols.begin(), symbols.end(), symbol) != symbols.end();
}

bool overlaps(const ElementSet& a, const ElementSet& b) {
    return std::any_of(a.begin(), a.end(),
                       [&b](const std::string& s) { return has(b, s); });
}

bool hasAnyOf(const std::vector<ReactionComponent>& components,
              const std::vector<std::shared_ptr<const IMoleculeComposition>>& candidates) {
    for (const auto& candidate : candidates) {
        if (ReactionPatterns::hasComposition(components, *candidate)) {
            return true;
        }
    }
    return false;
}

std::vector<std::shared_ptr<const IMoleculeComposition>> parseAll(
    const std::vector<std::string>& formulas) {
    std::vector<std::shared_ptr<const IMoleculeComposition>> molecules;
    molecules.reserve(formulas.size());
    for (const auto& f : formulas) {
        molecules.push_back(Molecule::fromFormula(f));
    }
    return molecules;
}

} // namespace

// ============================================================================
// Pattern tests
// ============================================================================

namespace ReactionPatterns {

bool isSingleReplacement(const std::vector<ReactionComponent>& reactants,
                         const std::vector<ReactionComponent>& products) {
    if (reactants.size() != 2 || products.size() != 2) {
        return false;
    }

    ElementSet first = elementSet(reactants[0]);
    ElementSet second = elementSet(reactants[1]);
    if (first.size() != 1 && second.size() != 1) {
        return false;
    }

    const std::string single = (first.size() == 1) ? *first.begin() : *second.begin();
    const ElementSet& compound = (first.size() == 1) ? second : first;

    for (std::size_t i = 0; i < 2; ++i) {
        if (!has(elementSet(products[i]), single)) {
            continue;
        }
        if (overlaps(elementSet(products[1 - i]), compound)) {
            return true;
        }
    }
    return false;
}

bool isDoubleReplacement(const std::vector<ReactionComponent>& reactants,
                         const std::vector<ReactionComponent>& products) {
    if (reactants.size() != 2 || products.size() != 2) {
        return false;
    }
    for (const auto& r : reactants) {
        ElementSet rs = elementSet(r);
        for (const auto& p : products) {
            if (!overlaps(rs, elementSet(p))) {
                return false;
            }
        }
    }
    return true;
}

bool hasNeutralSpecies(const std::vector<ReactionComponent>& components,
                       const std::string& hillFormula) {
    return std::any_of(components.begin(), components.end(),
                       [&hillFormula](const ReactionComponent& c) {
                           return c.molecule->charge() == 0 && c.molecule->formula() == hillFormula;
                       });
}

bool hasComposition(const std::vector<ReactionComponent>& components,
                    const IMoleculeComposition& molecule) {
    return std::any_of(components.begin(), components.end(),
                       [&molecule](const ReactionComponent& c) {
                           return c.molecule->sameComposition(molecule);
                       });
}

} // namespace ReactionPatterns

// ============================================================================
// Rules
// ============================================================================

CombustionRule::CombustionRule()
    : ReactionRule(Constants::ReactionType::kCombustion, Constants::kConfidenceCombustion) {}

bool CombustionRule::matches(const Reaction& reaction) const {
    std::vector<ReactionComponent> reactants = reaction.getReactants(false);
    const std::vector<ReactionComponent>& products = reaction.getProducts();

    bool hasFuel = std::any_of(reactants.begin(), reactants.end(),
                               [](const ReactionComponent& c) {
                                   return c.molecule->contains("C") && c.molecule->contains("H");
                               });

    return hasFuel &&
           ReactionPatterns::hasNeutralSpecies(reactants, "O2") &&
           ReactionPatterns::hasNeutralSpecies(products, "CO2") &&
           ReactionPatterns::hasNeutralSpecies(products, "H2O");
}

AcidBaseRule::AcidBaseRule(const ReferenceData& data)
    : ReactionRule(Constants::ReactionType::kAcidBase, Constants::kConfidenceAcidBase),
      acids_(parseAll(data.acids)),
      bases_(parseAll(data.bases)) {}

bool AcidBaseRule::matches(const Reaction& reaction) const {
    std::vector<ReactionComponent> reactants = reaction.getReactants(false);
    return hasAnyOf(reactants, acids_) &&
           hasAnyOf(reactants, bases_) &&
           ReactionPatterns::hasNeutralSpecies(reaction.getProducts(), "H2O");
}

PrecipitationRule::PrecipitationRule()
    : ReactionRule(Constants::ReactionType::kPrecipitation, Constants::kConfidencePrecipitation) {}

bool PrecipitationRule::matches(const Reaction& reaction) const {
    std::vector<ReactionComponent> reactants = reaction.getReactants(false);
    const std::vector<ReactionComponent>& products = reaction.getProducts();
    if (reactants.size() < 2) {
        return false;
    }

    bool aqueous = std::any_of(reactants.begin(), reactants.end(), [](const ReactionComponent& c) {
        return c.effectivePhase() == Constants::Phase::Aqueous;
    });
    bool solid = std::any_of(products.begin(), products.end(), [](const ReactionComponent& c) {
        return c.effectivePhase() == Constants::Phase::Solid;
    });
    return aqueous && solid;
}

HydrolysisRule::HydrolysisRule(const ReferenceData& data)
    : ReactionRule(Constants::ReactionType::kHydrolysis, Constants::kConfidenceHydrolysis),
      groups_(data) {}

bool HydrolysisRule::matches(const Reaction& reaction) const {
    if (reaction.numProducts() < 2 ||
        !ReactionPatterns::hasNeutralSpecies(reaction.getReactants(false), "H2O")) {
        return false;
    }
    return groups_.analyze(reaction).mechanism == "hydrolysis";
}

SingleReplacementRule::SingleReplacementRule()
    : ReactionRule(Constants::ReactionType::kSingleReplacement,
                   Constants::kConfidenceSingleReplacement) {}

bool SingleReplacementRule::matches(const Reaction& reaction) const {
    return ReactionPatterns::isSingleReplacement(reaction.getReactants(false), reaction.getProducts());
}

DoubleReplacementRule::DoubleReplacementRule()
    : ReactionRule(Constants::ReactionType::kDoubleReplacement,
                   Constants::kConfidenceDoubleReplacement) {}

bool DoubleReplacementRule::matches(const Reaction& reaction) const {
    std::vector<ReactionComponent> reactants = reaction.getReactants(false);
    const std::vector<ReactionComponent>& products = reaction.getProducts();
    // A + BC -> AC + B also overlaps pairwise when A is in both products
    return !ReactionPatterns::isSingleReplacement(reactants, products) &&
           ReactionPatterns::isDoubleReplacement(reactants, products);
}

SynthesisRule::SynthesisRule()
    : ReactionRule(Constants::ReactionType::kSynthesis, Constants::kConfidenceSynthesis) {}

bool SynthesisRule::matches(const Reaction& reaction) const {
    return reaction.numReactants() > 1 && reaction.numProducts() == 1;
}

DecompositionRule::DecompositionRule()
    : ReactionRule(Constants::ReactionType::kDecomposition, Constants::kConfidenceDecomposition) {}

bool DecompositionRule::matches(const Reaction& reaction) const {
    return reaction.numReactants() == 1 && reaction.numProducts() > 1;
}

IsomerizationRule::IsomerizationRule()
    : ReactionRule(Constants::ReactionType::kIsomerization, Constants::kConfidenceIsomerization) {}

bool IsomerizationRule::matches(const Reaction& reaction) const {
    if (reaction.numReactants() != 1 || reaction.numProducts() != 1) {
        return false;
    }
    std::vector<ReactionComponent> reactants = reaction.getReactants(false);
    return reactants.front().molecule->sameComposition(*reaction.getProducts().front().molecule);
}

} // namespace Stoichiometrica
