#pragma once

#include "entity.hpp"
#include "rng.hpp"

#include <string>

// Outcome of a single attack (one direction of an exchange).
struct CombatResult {
    int attackRoll = 0;  // clamped to >= 0
    int defenceRoll = 0; // clamped to >= 0
    int damage = 0;      // 0 when blocked
    bool blocked = false;
    bool killed = false; // defender HP <= 0 after this attack
};

// Rolls attacker's attack dice against defender's defence dice and applies the
// difference to the defender's HP. Only the defender is modified.
CombatResult resolveAttack(RNG& rng, const Entity& attacker, Entity& defender);

// Human-readable status line for one attack, e.g.
//   "Player attacks Rat (9 vs 4): hits for 5. Rat HP 0."
// Defender HP is floored at 0 for display.
std::string describeAttack(const Entity& attacker, const Entity& defender, const CombatResult& r);
