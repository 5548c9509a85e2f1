#include "game.hpp"

#include <algorithm>

bool Game::inSight(Vec2i p) const {
    return dist2(p, playerEnt.pos) <= SIGHT_RADIUS * SIGHT_RADIUS;
}

bool Game::isDiscovered(int x, int y) const {
    if (!lvl.inBounds(x, y)) return false;
    const size_t i = static_cast<size_t>(y * lvl.width + x);
    return i < discovered.size() && discovered[i] != 0;
}

void Game::revealAround() {
    if (discovered.size() != static_cast<size_t>(lvl.width * lvl.height)) {
        discovered.assign(static_cast<size_t>(lvl.width * lvl.height), 0);
    }

    for (const auto& w : lvl.walls) {
        if (inSight(w.pos)) {
            discovered[static_cast<size_t>(w.pos.y * lvl.width + w.pos.x)] = 1;
        }
    }
}

FrameView Game::frame() const {
    FrameView v;
    v.width = lvl.width;
    v.height = lvl.height;

    for (const auto& w : lvl.walls) {
        if (isDiscovered(w.pos.x, w.pos.y)) v.walls.push_back(w);
    }
    for (const auto& e : lvl.enemies) {
        if (e.isAlive() && inSight(e.pos)) v.enemies.push_back(e);
    }
    for (const auto& h : lvl.potions) {
        if (inSight(h.pos)) v.potions.push_back(h);
    }

    v.player = playerEnt;
    v.hp = std::max(0, playerEnt.hp);
    v.attackLabel = diceToString(playerEnt.attack);
    v.defenceLabel = diceToString(playerEnt.defence);
    v.kills = killCount;
    v.turns = turnCount;
    return v;
}
