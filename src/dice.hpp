#pragma once

#include "rng.hpp"

#include <string>

// A tiny dice expression: `count` d `sides` + `modifier`.
// Examples:
//   {1,6,3}  => 1d6+3
//   {3,4,2}  => 3d4+2
struct DiceExpr {
    int count = 1;
    int sides = 6;
    int modifier = 0;
};

// Builds a dice expression with count floored at 0 and sides floored at 1.
// Out-of-range inputs are clamped, never rejected.
DiceExpr makeDice(int count, int sides, int modifier);

// Sum of `count` uniform draws in [1, sides] plus the modifier.
// With count == 0 the result is exactly the modifier.
int rollDice(RNG& rng, DiceExpr d);

// Smallest / largest value rollDice() can produce for `d`.
int minRoll(DiceExpr d);
int maxRoll(DiceExpr d);

// Label like "2d6+2" or "1d8-1". A non-negative modifier always carries its sign ("2d6+0").
std::string diceToString(DiceExpr d);
