#include "game.hpp"

#include <algorithm>
#include <sstream>

Game::Game(uint32_t seed) : rng_(seed), seed_(seed) {
    playerEnt = makeActor(ElementKind::Player, PLAYER_ID, {0, 0});
}

bool Game::loadLevel(const std::string& path, std::string* err) {
    loaded_ = false;
    if (!lvl.loadFromFile(path, err)) return false;
    startRun();
    return true;
}

void Game::loadLevelFromText(const std::string& text) {
    lvl.loadFromText(text);
    startRun();
}

void Game::startRun() {
    playerEnt = makeActor(ElementKind::Player, PLAYER_ID, lvl.playerStart);
    discovered.assign(static_cast<size_t>(lvl.width * lvl.height), 0);
    msgs.clear();
    killCount = 0;
    turnCount = 0;
    loaded_ = true;

    if (!lvl.hasPlayerStart()) {
        pushMsg("No player start in this level; starting at the top-left corner.", MessageKind::Warning);
    }
}

void Game::pushMsg(const std::string& s, MessageKind kind) {
    // Coalesce consecutive identical messages (an enemy bumping into a
    // blocking player every turn reads the same each time).
    if (!msgs.empty()) {
        Message& last = msgs.back();
        if (last.text == s && last.kind == kind) {
            if (last.repeat < 9999) ++last.repeat;
            return;
        }
    }

    // Keep some scrollback
    if (msgs.size() > 400) {
        msgs.erase(msgs.begin(), msgs.begin() + 100);
    }
    msgs.push_back({s, kind});
    ++pushedCount;
}

void Game::pushSystemMessage(const std::string& msg) {
    pushMsg(msg, MessageKind::System);
}

RunState Game::runState() const {
    if (playerEnt.hp <= 0) return RunState::PlayerDead;
    if (lvl.enemies.empty()) return RunState::AllEnemiesCleared;
    return RunState::Playing;
}

void Game::handleAction(Action a) {
    if (!loaded_ || a == Action::Quit) return;
    if (runState() != RunState::Playing) return;

    ++turnCount;
    playerTurn(a);
    enemiesTurn();
}

void Game::playerTurn(Action a) {
    const Vec2i d = actionDelta(a);
    if (d.x == 0 && d.y == 0) return;

    const Vec2i target{playerEnt.pos.x + d.x, playerEnt.pos.y + d.y};
    if (!lvl.inBounds(target.x, target.y)) return;

    if (Entity* e = lvl.enemyAt(target.x, target.y)) {
        const int id = e->id;
        exchangeBlows(playerEnt, *e);
        reapEnemy(id);
        return;
    }

    if (lvl.isWall(target.x, target.y)) return;

    playerEnt.pos = target;
    pickUpPotion(target);
}

bool Game::isBlocked(int x, int y) const {
    if (!lvl.inBounds(x, y)) return true;
    if (lvl.isWall(x, y)) return true;
    if (playerEnt.pos.x == x && playerEnt.pos.y == y) return true;
    const Entity* e = lvl.enemyAt(x, y);
    return e && e->isAlive();
}

bool Game::tryMoveEnemy(int enemyId, Vec2i dest) {
    Entity* e = lvl.enemyById(enemyId);
    if (!e || !e->isAlive()) return false;
    if (!lvl.inBounds(dest.x, dest.y)) return false;

    if (dest == playerEnt.pos) {
        exchangeBlows(*e, playerEnt);
        reapEnemy(enemyId);
        return true;
    }

    if (dest == e->pos) return false;
    if (lvl.isWall(dest.x, dest.y)) return false;
    const Entity* other = lvl.enemyAt(dest.x, dest.y);
    if (other && other->isAlive()) return false;

    e->pos = dest;
    return true;
}

void Game::exchangeBlows(Entity& first, Entity& second) {
    attack(first, second);
    if (second.isAlive()) {
        attack(second, first);
    }
}

void Game::attack(Entity& attacker, Entity& defender) {
    const CombatResult r = resolveAttack(rng_, attacker, defender);
    pushMsg(describeAttack(attacker, defender, r), MessageKind::Combat);
}

void Game::reapEnemy(int enemyId) {
    const Entity* e = lvl.enemyById(enemyId);
    if (!e || e->isAlive()) return;
    lvl.removeEnemy(enemyId);
    ++killCount;

    if (lvl.enemies.empty()) {
        pushMsg("The last enemy falls. The level is clear!", MessageKind::Success);
    }
}

void Game::pickUpPotion(Vec2i p) {
    const HealthPotion* h = lvl.potionAt(p.x, p.y);
    if (!h) return;

    const int before = playerEnt.hp;
    const int healed = std::max(0, std::min(h->healAmount, PLAYER_MAX_HP - before));
    playerEnt.hp = before + healed;
    lvl.removePotionAt(p.x, p.y);

    std::ostringstream ss;
    ss << "You drink a health potion: +" << healed << " HP (HP " << playerEnt.hp << ").";
    pushMsg(ss.str(), MessageKind::Loot);
}
