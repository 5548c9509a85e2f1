#pragma once
#include "common.hpp"
#include "entity.hpp"

#include <cstdint>
#include <string>
#include <vector>

// A level parsed from a plain text grid.
//
// Glyphs:
//   '#' wall, 'r' rat, 's' snake, 'K' health potion, '@' player start.
// Anything else (spaces included) is empty floor. Rows may have different
// lengths; missing cells on short rows are empty, not walls.
class Level {
public:
    int width = 0;
    int height = 0;

    std::vector<Wall> walls;
    std::vector<Entity> enemies;
    std::vector<HealthPotion> potions;

    Vec2i playerStart{0, 0};

    Level() = default;

    // Replaces all state with the contents of `path`.
    // Returns false (and leaves the level empty) if the file cannot be read.
    bool loadFromFile(const std::string& path, std::string* err = nullptr);

    // Replaces all state with the parsed grid. Never fails.
    void loadFromText(const std::string& text);

    bool hasPlayerStart() const { return hasPlayerStart_; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    bool isWall(int x, int y) const {
        if (!inBounds(x, y)) return false;
        return wallMask_[static_cast<size_t>(y * width + x)] != 0;
    }

    Entity* enemyAt(int x, int y);
    const Entity* enemyAt(int x, int y) const;
    Entity* enemyById(int id);

    const HealthPotion* potionAt(int x, int y) const;

    // Both return true if something was removed.
    bool removeEnemy(int id);
    bool removePotionAt(int x, int y);

private:
    void clear();

    std::vector<uint8_t> wallMask_;
    bool hasPlayerStart_ = false;
    int nextId_ = 1;
};
