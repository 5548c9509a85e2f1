#include "game.hpp"

#include <array>
#include <vector>

namespace {

const std::array<Vec2i, 4> kCardinal = {{{0, -1}, {0, 1}, {-1, 0}, {1, 0}}};

} // namespace

void Game::enemiesTurn() {
    // Snapshot ids: enemies removed mid-phase are skipped, and the ones still
    // standing act in load order.
    std::vector<int> ids;
    ids.reserve(lvl.enemies.size());
    for (const auto& e : lvl.enemies) ids.push_back(e.id);

    for (int id : ids) {
        // Stops the phase on purpose instead of letting the rest of the
        // snapshot move: enemies after the killing blow stay where the
        // player last saw them, and the next tick reports the death.
        if (!playerEnt.isAlive()) break;

        const Entity* e = lvl.enemyById(id);
        if (!e || !e->isAlive()) continue;
        updateEnemy(id);
    }
}

void Game::updateEnemy(int enemyId) {
    const Entity* e = lvl.enemyById(enemyId);
    if (!e) return;

    switch (e->kind) {
        case ElementKind::Rat: updateRat(enemyId); break;
        case ElementKind::Snake: updateSnake(enemyId); break;
        default: break;
    }
}

void Game::updateRat(int enemyId) {
    const Entity* e = lvl.enemyById(enemyId);
    if (!e) return;

    const Vec2i d = kCardinal[static_cast<size_t>(rng_.range(0, static_cast<int>(kCardinal.size()) - 1))];
    tryMoveEnemy(enemyId, {e->pos.x + d.x, e->pos.y + d.y});
}

void Game::updateSnake(int enemyId) {
    if (rng_.chance(SNAKE_IDLE_CHANCE)) return;

    const Entity* e = lvl.enemyById(enemyId);
    if (!e) return;

    const Vec2i p = playerEnt.pos;
    const int here = dist2(e->pos, p);
    if (here > SNAKE_ALERT_RADIUS * SNAKE_ALERT_RADIUS) return;

    // Greedy step that maximizes distance to the player. Ties keep the
    // current tile, so a cornered snake stays put.
    Vec2i best = e->pos;
    int bestD2 = here;
    for (const Vec2i& d : kCardinal) {
        const Vec2i n{e->pos.x + d.x, e->pos.y + d.y};
        if (isBlocked(n.x, n.y)) continue;
        const int d2 = dist2(n, p);
        if (d2 > bestD2) {
            bestD2 = d2;
            best = n;
        }
    }

    tryMoveEnemy(enemyId, best);
}
