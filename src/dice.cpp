#include "dice.hpp"

#include <algorithm>
#include <sstream>

DiceExpr makeDice(int count, int sides, int modifier) {
    DiceExpr d;
    d.count = std::max(0, count);
    d.sides = std::max(1, sides);
    d.modifier = modifier;
    return d;
}

int rollDice(RNG& rng, DiceExpr d) {
    d = makeDice(d.count, d.sides, d.modifier);

    int sum = 0;
    for (int i = 0; i < d.count; ++i) {
        sum += rng.range(1, d.sides);
    }
    return sum + d.modifier;
}

int minRoll(DiceExpr d) {
    d = makeDice(d.count, d.sides, d.modifier);
    return d.count + d.modifier;
}

int maxRoll(DiceExpr d) {
    d = makeDice(d.count, d.sides, d.modifier);
    return d.count * d.sides + d.modifier;
}

std::string diceToString(DiceExpr d) {
    d = makeDice(d.count, d.sides, d.modifier);

    std::ostringstream ss;
    ss << d.count << "d" << d.sides;
    if (d.modifier >= 0) ss << "+";
    ss << d.modifier;
    return ss.str();
}
