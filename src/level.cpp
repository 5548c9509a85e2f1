#include "level.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

void Level::clear() {
    width = 0;
    height = 0;
    walls.clear();
    enemies.clear();
    potions.clear();
    playerStart = {0, 0};
    wallMask_.clear();
    hasPlayerStart_ = false;
    nextId_ = 1;
}

bool Level::loadFromFile(const std::string& path, std::string* err) {
    clear();

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "Cannot open level file: " + path;
        return false;
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        if (err) *err = "Failed reading level file: " + path;
        return false;
    }

    loadFromText(ss.str());
    return true;
}

void Level::loadFromText(const std::string& text) {
    clear();

    std::vector<std::string> lines;
    {
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            // CRLF files
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(line);
        }
    }

    height = static_cast<int>(lines.size());
    for (const auto& l : lines) width = std::max(width, static_cast<int>(l.size()));

    wallMask_.assign(static_cast<size_t>(width * height), 0);

    for (int y = 0; y < height; ++y) {
        const std::string& line = lines[static_cast<size_t>(y)];
        for (int x = 0; x < static_cast<int>(line.size()); ++x) {
            const Vec2i p{x, y};
            switch (line[static_cast<size_t>(x)]) {
                case '#':
                    walls.push_back({p});
                    wallMask_[static_cast<size_t>(y * width + x)] = 1;
                    break;
                case 'r':
                    enemies.push_back(makeActor(ElementKind::Rat, nextId_++, p));
                    break;
                case 's':
                    enemies.push_back(makeActor(ElementKind::Snake, nextId_++, p));
                    break;
                case '@':
                    playerStart = p;
                    hasPlayerStart_ = true;
                    break;
                case 'K': {
                    HealthPotion h;
                    h.pos = p;
                    potions.push_back(h);
                    break;
                }
                default:
                    break;
            }
        }
    }
}

Entity* Level::enemyAt(int x, int y) {
    for (auto& e : enemies) {
        if (e.pos.x == x && e.pos.y == y) return &e;
    }
    return nullptr;
}

const Entity* Level::enemyAt(int x, int y) const {
    for (const auto& e : enemies) {
        if (e.pos.x == x && e.pos.y == y) return &e;
    }
    return nullptr;
}

Entity* Level::enemyById(int id) {
    for (auto& e : enemies) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

const HealthPotion* Level::potionAt(int x, int y) const {
    for (const auto& h : potions) {
        if (h.pos.x == x && h.pos.y == y) return &h;
    }
    return nullptr;
}

bool Level::removeEnemy(int id) {
    auto it = std::find_if(enemies.begin(), enemies.end(), [id](const Entity& e) { return e.id == id; });
    if (it == enemies.end()) return false;
    enemies.erase(it);
    return true;
}

bool Level::removePotionAt(int x, int y) {
    auto it = std::find_if(potions.begin(), potions.end(), [x, y](const HealthPotion& h) {
        return h.pos.x == x && h.pos.y == y;
    });
    if (it == potions.end()) return false;
    potions.erase(it);
    return true;
}
