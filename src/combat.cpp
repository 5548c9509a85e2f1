#include "combat.hpp"

#include <algorithm>
#include <sstream>

CombatResult resolveAttack(RNG& rng, const Entity& attacker, Entity& defender) {
    CombatResult r;
    r.attackRoll = std::max(0, rollDice(rng, attacker.attack));
    r.defenceRoll = std::max(0, rollDice(rng, defender.defence));

    const int dmg = r.attackRoll - r.defenceRoll;
    if (dmg > 0) {
        r.damage = dmg;
        defender.hp -= dmg;
    } else {
        r.blocked = true;
    }

    r.killed = defender.hp <= 0;
    return r;
}

std::string describeAttack(const Entity& attacker, const Entity& defender, const CombatResult& r) {
    std::ostringstream ss;
    ss << attacker.name << " attacks " << defender.name
       << " (" << r.attackRoll << " vs " << r.defenceRoll << "): ";
    if (r.blocked) {
        ss << defender.name << " blocks.";
    } else {
        ss << "hits for " << r.damage << ".";
    }
    ss << " " << defender.name << " HP " << std::max(0, defender.hp) << ".";
    if (r.killed) ss << " " << defender.name << " dies!";
    return ss.str();
}
