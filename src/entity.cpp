#include "entity.hpp"

const char* kindName(ElementKind k) {
    switch (k) {
        case ElementKind::Wall: return "Wall";
        case ElementKind::HealthPotion: return "Health potion";
        case ElementKind::Player: return "Player";
        case ElementKind::Rat: return "Rat";
        case ElementKind::Snake: return "Snake";
        default: return "Thing";
    }
}

Entity makeActor(ElementKind kind, int id, Vec2i pos) {
    if (!isActorKind(kind)) kind = ElementKind::Rat;

    Entity e;
    e.id = id;
    e.kind = kind;
    e.pos = pos;
    e.name = kindName(kind);

    switch (kind) {
        case ElementKind::Player:
            e.hp = PLAYER_MAX_HP;
            e.attack = makeDice(2, 6, 2);
            e.defence = makeDice(2, 6, 0);
            break;
        case ElementKind::Rat:
            e.hp = 5;
            e.attack = makeDice(1, 6, 3);
            e.defence = makeDice(1, 6, 1);
            break;
        case ElementKind::Snake:
            e.hp = 5;
            e.attack = makeDice(3, 4, 2);
            e.defence = makeDice(1, 8, 5);
            break;
        default:
            break;
    }
    return e;
}
