#pragma once
#include "combat.hpp"
#include "common.hpp"
#include "entity.hpp"
#include "level.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class Action : uint8_t {
    None = 0, // any key without a binding; still spends a turn

    Up,
    Down,
    Left,
    Right,

    Quit,
};

enum class RunState : uint8_t {
    Playing = 0,
    PlayerDead,
    AllEnemiesCleared,
    Quit, // left without a result
};

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Loot,
    System,
    Warning,
    Success,
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;

    // Consecutive duplicate messages are compacted by incrementing this counter.
    int repeat = 1;
};

// Everything a front end needs to draw one frame.
// Walls are the discovered set; enemies and potions only those in sight right now.
struct FrameView {
    int width = 0;
    int height = 0;

    std::vector<Wall> walls;
    std::vector<Entity> enemies;
    std::vector<HealthPotion> potions;
    Entity player;

    int hp = 0; // floored at 0
    std::string attackLabel;
    std::string defenceLabel;
    uint32_t kills = 0;
    uint32_t turns = 0;
};

inline Vec2i actionDelta(Action a) {
    switch (a) {
        case Action::Up: return {0, -1};
        case Action::Down: return {0, 1};
        case Action::Left: return {-1, 0};
        case Action::Right: return {1, 0};
        default: return {0, 0};
    }
}

class Game {
public:
    // Walls within this radius are discovered for good; actors and potions
    // within it are visible this frame only.
    static constexpr int SIGHT_RADIUS = 5;
    static constexpr int SNAKE_ALERT_RADIUS = 2;
    static constexpr float SNAKE_IDLE_CHANCE = 0.15f;
    static constexpr int PLAYER_ID = 0;

    explicit Game(uint32_t seed = 0x12345678u);

    // Loads a level and starts a fresh run on it (player at the level's start).
    // On failure the game keeps no level and must not be run.
    bool loadLevel(const std::string& path, std::string* err = nullptr);
    void loadLevelFromText(const std::string& text);

    bool hasLevel() const { return loaded_; }

    // PlayerDead takes precedence over AllEnemiesCleared.
    RunState runState() const;

    // One full turn: the player's action, then every live enemy.
    void handleAction(Action a);

    void playerTurn(Action a);
    void enemiesTurn();

    // Shared enemy movement rule. Attacks when `dest` is the player's tile.
    // Returns true if the enemy moved or fought.
    bool tryMoveEnemy(int enemyId, Vec2i dest);

    // Wall, live enemy, the player's tile, or outside the map.
    bool isBlocked(int x, int y) const;

    // Fog of war
    void revealAround();
    bool inSight(Vec2i p) const;
    bool isDiscovered(int x, int y) const;
    FrameView frame() const;

    const Level& level() const { return lvl; }
    Level& levelMut() { return lvl; }

    const Entity& player() const { return playerEnt; }
    Entity& playerMut() { return playerEnt; }

    uint32_t seed() const { return seed_; }
    uint32_t kills() const { return killCount; }
    uint32_t turns() const { return turnCount; }

    const std::vector<Message>& messages() const { return msgs; }

    // Lines ever appended to the log (coalesced repeats not counted). Keeps
    // growing when old lines are trimmed or a new run clears the log, so
    // messagesPushed() - messages().size() is the serial of messages()[0].
    uint64_t messagesPushed() const { return pushedCount; }
    void pushSystemMessage(const std::string& msg);

private:
    void startRun();

    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);

    // `first` attacks; `second` hits back if it survives.
    void exchangeBlows(Entity& first, Entity& second);
    void attack(Entity& attacker, Entity& defender);

    // Removes the enemy if it died and counts the kill.
    void reapEnemy(int enemyId);

    void pickUpPotion(Vec2i p);

    // Per-kind policies (ai.cpp). Each picks a destination and calls tryMoveEnemy.
    void updateEnemy(int enemyId);
    void updateRat(int enemyId);
    void updateSnake(int enemyId);

    Level lvl;
    Entity playerEnt;

    RNG rng_;
    uint32_t seed_ = 0;

    bool loaded_ = false;

    // Walls the player has seen (width * height flags).
    std::vector<uint8_t> discovered;

    std::vector<Message> msgs;
    uint64_t pushedCount = 0;

    uint32_t killCount = 0;
    uint32_t turnCount = 0;
};
