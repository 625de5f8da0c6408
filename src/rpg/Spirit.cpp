#include "Spirit.hpp"

namespace Wildspirit {

std::vector<Ability> defaultAbilities(Element element) {
    std::vector<Ability> abilities;

    Ability attack;
    attack.id = "attack";
    attack.name = "Attack";
    attack.type = AbilityType::Physical;
    attack.power = 40;
    abilities.push_back(attack);

    Ability spell;
    spell.type = AbilityType::Magical;
    spell.element = element;
    spell.power = 50;
    spell.mpCost = 8;
    switch (element) {
        case Element::Fire:
            spell.id = "fireball";
            spell.name = "Fireball";
            break;
        case Element::Water:
            spell.id = "aqua_jet";
            spell.name = "Aqua Jet";
            break;
        case Element::Earth:
            spell.id = "rock_throw";
            spell.name = "Rock Throw";
            break;
        case Element::Wind:
            spell.id = "gust";
            spell.name = "Gust";
            break;
        case Element::None:
            break;
    }
    if (!spell.id.empty()) {
        abilities.push_back(spell);
    }

    Ability heal;
    heal.id = "heal";
    heal.name = "Heal";
    heal.type = AbilityType::Supportive;
    heal.power = 30;
    heal.mpCost = 10;
    heal.target = AbilityTarget::SingleAlly;
    abilities.push_back(heal);

    return abilities;
}

} // namespace Wildspirit
