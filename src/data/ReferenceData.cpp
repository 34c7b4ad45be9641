#include "stoichiometrica/data/ReferenceData.hpp"
#include <algorithm>

namespace Stoichiometrica {

std::pair<double, bool> ReferenceData::getElectronegativity(const std::string& symbol) const {
    auto it = electronegativity.find(symbol);
    if (it == electronegativity.end()) {
        return {0.0, false};
    }
    return {it->second, true};
}

std::pair<int, bool> ReferenceData::getMinOxidationState(const std::string& symbol) const {
    auto it = oxidationStates.find(symbol);
    if (it == oxidationStates.end() || it->second.empty()) {
        return {0, false};
    }
    return {*std::min_element(it->second.begin(), it->second.end()), true};
}

bool ReferenceData::isHydrideMetal(const std::string& symbol) const {
    return std::find(hydrideMetals.begin(), hydrideMetals.end(), symbol) != hydrideMetals.end();
}

ReferenceData ReferenceData::makeStandard() {
    ReferenceData data;

    data.electronegativity = {
        {"H", 2.20}, {"Li", 0.98}, {"Be", 1.57}, {"B", 2.04}, {"C", 2.55},
        {"N", 3.04}, {"O", 3.44}, {"F", 3.98}, {"Na", 0.93}, {"Mg", 1.31},
        {"Al", 1.61}, {"Si", 1.90}, {"P", 2.19}, {"S", 2.58}, {"Cl", 3.16},
        {"K", 0.82}, {"Ca", 1.00}, {"Sc", 1.36}, {"Ti", 1.54}, {"V", 1.63},
        {"Cr", 1.66}, {"Mn", 1.55}, {"Fe", 1.83}, {"Co", 1.88}, {"Ni", 1.91},
        {"Cu", 1.90}, {"Zn", 1.65}, {"Ga", 1.81}, {"Ge", 2.01}, {"As", 2.18},
        {"Se", 2.55}, {"Br", 2.96}, {"Rb", 0.82}, {"Sr", 0.95}, {"Y", 1.22},
        {"Zr", 1.33}, {"Nb", 1.6}, {"Mo", 2.16}, {"Tc", 1.9}, {"Ru", 2.2},
        {"Rh", 2.28}, {"Pd", 2.20}, {"Ag", 1.93}, {"Cd", 1.69}, {"In", 1.78},
        {"Sn", 1.96}, {"Sb", 2.05}, {"Te", 2.1}, {"I", 2.66}, {"Cs", 0.79},
        {"Ba", 0.89}, {"La", 1.1}, {"Ce", 1.12}, {"Pr", 1.13}, {"Nd", 1.14},
        {"Pm", 1.13}, {"Sm", 1.17}, {"Eu", 1.2}, {"Gd", 1.2}, {"Tb", 1.1},
        {"Dy", 1.22}, {"Ho", 1.23}, {"Er", 1.24}, {"Tm", 1.25}, {"Yb", 1.1},
        {"Lu", 1.27}, {"Hf", 1.3}, {"Ta", 1.5}, {"W", 2.36}, {"Re", 1.9},
        {"Os", 2.2}, {"Ir", 2.20}, {"Pt", 2.28}, {"Au", 2.54}, {"Hg", 2.00},
        {"Tl", 1.62}, {"Pb", 2.33}, {"Bi", 2.02}, {"Po", 2.0}, {"At", 2.2},
        {"Fr", 0.7}, {"Ra", 0.9}, {"Ac", 1.1}, {"Th", 1.3}, {"Pa", 1.5},
        {"U", 1.38}, {"Np", 1.36}, {"Pu", 1.28}, {"Am", 1.3}, {"Cm", 1.3},
        {"Bk", 1.3}, {"Cf", 1.3}, {"Es", 1.3}, {"Fm", 1.3}, {"Md", 1.3},
        {"No", 1.3}, {"Lr", 1.3}
    };

    data.oxidationStates = {
        {"H", {-1, 1}},
        {"Li", {1}}, {"Na", {1}}, {"K", {1}}, {"Rb", {1}}, {"Cs", {1}},
        {"Be", {2}}, {"Mg", {2}}, {"Ca", {2}}, {"Sr", {2}}, {"Ba", {2}},
        {"B", {3}}, {"Al", {3}}, {"Ga", {3}}, {"In", {3}},
        {"C", {-4, -3, -2, -1, 0, 1, 2, 3, 4}},
        {"Si", {-4, 4}},
        {"Ge", {-4, 2, 4}},
        {"N", {-3, -2, -1, 0, 1, 2, 3, 4, 5}},
        {"P", {-3, 3, 5}}, {"As", {-3, 3, 5}},
        {"O", {-2, -1, 0, 1, 2}},
        {"S", {-2, 0, 2, 4, 6}}, {"Se", {-2, 0, 2, 4, 6}},
        {"F", {-1}},
        {"Cl", {-1, 0, 1, 3, 5, 7}}, {"Br", {-1, 0, 1, 3, 5, 7}}, {"I", {-1, 0, 1, 3, 5, 7}},
        {"Fe", {2, 3}}, {"Co", {2, 3}}, {"Ni", {2, 3}},
        {"Cu", {1, 2}}, {"Ag", {1}}, {"Au", {1, 3}},
        {"Zn", {2}}, {"Cd", {2}}, {"Hg", {1, 2}},
        {"Mn", {2, 3, 4, 6, 7}},
        {"Cr", {2, 3, 6}},
        {"Mo", {2, 3, 4, 5, 6}}, {"W", {2, 3, 4, 5, 6}},
        {"V", {2, 3, 4, 5}},
        {"Ti", {2, 3, 4}},
        {"Pt", {2, 4}}, {"Pd", {2, 4}}
    };

    data.hydrideMetals = {
        "Li", "Na", "K", "Rb", "Cs", "Be", "Mg", "Ca", "Sr", "Ba",
        "Al", "Ga", "In", "Sn", "Pb", "Fe", "Co", "Ni", "Cu", "Ag",
        "Au", "Zn", "Cd", "Hg", "Pt", "Mn", "Cr", "Mo", "W", "V", "Ti"
    };

    data.acids = {
        "HCl", "H2SO4", "HNO3", "HBr", "HI", "HClO4",
        "H3PO4", "CH3COOH", "HF", "H2CO3", "H2S", "HCN",
        "H^+", "H3O^+"
    };

    data.bases = {
        "NaOH", "KOH", "LiOH", "Ca(OH)2", "Ba(OH)2", "Sr(OH)2",
        "NH3", "CH3NH2", "C5H5N",
        "OH^-"
    };

    FunctionalGroupPattern alcohol;
    alcohol.name = "alcohol";
    alcohol.anyOf = {"OH"};
    alcohol.forbiddenPrefix = "HO";

    FunctionalGroupPattern aldehyde;
    aldehyde.name = "aldehyde";
    aldehyde.anyOf = {"CHO"};

    FunctionalGroupPattern ketone;
    ketone.name = "ketone";
    ketone.anyOf = {"CO"};
    ketone.noneOf = {"CHO", "COOH"};

    FunctionalGroupPattern carboxylic;
    carboxylic.name = "carboxylic_acid";
    carboxylic.anyOf = {"COOH"};

    FunctionalGroupPattern ester;
    ester.name = "ester";
    ester.anyOf = {"COO"};
    ester.noneOf = {"COOH"};

    FunctionalGroupPattern amine;
    amine.name = "amine";
    amine.anyOf = {"NH2"};

    FunctionalGroupPattern nitrile;
    nitrile.name = "nitrile";
    nitrile.anyOf = {"CN"};

    FunctionalGroupPattern nitro;
    nitro.name = "nitro";
    nitro.anyOf = {"NO2"};

    // Element test so that "Fe" or "In" do not read as halides
    FunctionalGroupPattern halide;
    halide.name = "halide";
    halide.anyOf = {"F", "Cl", "Br", "I"};
    halide.matchElements = true;

    data.functionalGroups = {alcohol, aldehyde, ketone, carboxylic, ester,
                             amine, nitrile, nitro, halide};

    // Two-pair mechanisms first: esterification also produces an
    // alcohol->ketone pair from the ester's "CO" token
    data.mechanisms = {
        {"esterification", {{"alcohol", "ester"}, {"carboxylic_acid", "ester"}}, true},
        {"hydrolysis", {{"ester", "alcohol"}, {"ester", "carboxylic_acid"}}, true},
        {"oxidation", {{"alcohol", "ketone"}, {"alcohol", "aldehyde"}}, false},
        {"reduction", {{"ketone", "alcohol"}, {"aldehyde", "alcohol"}}, false},
        {"nucleophilic_substitution", {{"halide", "alcohol"}}, false}
    };

    return data;
}

const ReferenceData& ReferenceData::standard() {
    static const ReferenceData instance = makeStandard();
    return instance;
}

} // namespace Stoichiometrica
