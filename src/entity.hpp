#pragma once
#include "common.hpp"
#include "dice.hpp"

#include <cstdint>
#include <string>

// Every kind of thing that can sit on a map tile.
// Walls and potions are plain data; the three actor kinds share Entity.
enum class ElementKind : uint8_t {
    Wall = 0,
    HealthPotion,
    Player,
    Rat,
    Snake,
};

inline bool isActorKind(ElementKind k) {
    switch (k) {
        case ElementKind::Player:
        case ElementKind::Rat:
        case ElementKind::Snake:
            return true;
        default:
            return false;
    }
}

// Display symbol for each kind (also the level file glyph, except the player start).
inline char glyphFor(ElementKind k) {
    switch (k) {
        case ElementKind::Wall: return '#';
        case ElementKind::HealthPotion: return 'K';
        case ElementKind::Player: return '@';
        case ElementKind::Rat: return 'r';
        case ElementKind::Snake: return 's';
        default: return '?';
    }
}

// Presentation-only tint. The engine carries it, the renderer uses it.
inline Color colorFor(ElementKind k) {
    switch (k) {
        case ElementKind::Wall: return {110, 110, 120, 255};
        case ElementKind::HealthPotion: return {220, 80, 220, 255};
        case ElementKind::Player: return {240, 220, 60, 255};
        case ElementKind::Rat: return {220, 60, 50, 255};
        case ElementKind::Snake: return {70, 200, 80, 255};
        default: return {255, 255, 255, 255};
    }
}

const char* kindName(ElementKind k);

struct Wall {
    Vec2i pos{0,0};
};

struct HealthPotion {
    static constexpr int HEAL_AMOUNT = 10;

    Vec2i pos{0,0};
    int healAmount = HEAL_AMOUNT;
};

// An actor: the player or an enemy.
// HP has no floor in storage; anything <= 0 is dead.
struct Entity {
    int id = 0;
    ElementKind kind = ElementKind::Rat;
    Vec2i pos{0,0};

    int hp = 1;

    DiceExpr attack;
    DiceExpr defence;

    std::string name;

    bool isAlive() const { return hp > 0; }
    char glyph() const { return glyphFor(kind); }
    Color color() const { return colorFor(kind); }
};

static constexpr int PLAYER_MAX_HP = 100;

// Builds an actor of the given kind with its fixed starting stats.
// Non-actor kinds fall back to a Rat.
Entity makeActor(ElementKind kind, int id, Vec2i pos);
