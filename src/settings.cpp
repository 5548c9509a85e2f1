#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string trim(std::string s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        size_t used = 0;
        const std::string t = trim(v);
        const int n = std::stoi(t, &used);
        if (used != t.size()) return false;
        out = n;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        // Strip comments (# or ;)
        const auto cut = line.find_first_of("#;");
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        if (key == "tile_size") {
            int v = 0;
            if (parseInt(val, v)) s.tileSize = std::clamp(v, 12, 64);
        } else if (key == "hud_height") {
            int v = 0;
            if (parseInt(val, v)) s.hudHeight = std::clamp(v, 60, 240);
        } else if (key == "start_fullscreen") {
            bool b = false;
            if (parseBool(val, b)) s.startFullscreen = b;
        } else if (key == "vsync") {
            bool b = true;
            if (parseBool(val, b)) s.vsync = b;
        } else if (key == "music_enabled") {
            bool b = true;
            if (parseBool(val, b)) s.musicEnabled = b;
        } else if (key == "music_path") {
            s.musicPath = val;
        } else if (key == "music_volume") {
            int v = 0;
            if (parseInt(val, v)) s.musicVolume = std::clamp(v, 0, 128);
        } else if (key == "level_path") {
            if (!val.empty()) s.levelPath = val;
        } else if (key == "unmapped_keys_pass_turn") {
            bool b = true;
            if (parseBool(val, b)) s.unmappedKeysPassTurn = b;
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# DungeonCrawler settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# Window
tile_size = 24
hud_height = 120
start_fullscreen = false
vsync = true

# Background music (WAV). A missing file is not an error.
music_enabled = true
music_path = assets/music.wav
# 0..128
music_volume = 64

# Level loaded when no path is given on the command line.
level_path = levels/level1.txt

# true: keys without a binding still spend a turn (enemies move).
# false: such keys are ignored.
unmapped_keys_pass_turn = true

# Key bindings: bind_<action> = key[, key, ...]
# Actions: up, down, left, right, quit
# Keys: a single character (w, k, ...) or a name: up, down, left, right, escape,
# enter, space, tab, kp_2, kp_4, kp_6, kp_8. "none" unbinds an action.
# bind_up = w, up, kp_8
# bind_down = s, down, kp_2
# bind_left = a, left, kp_4
# bind_right = d, right, kp_6
# bind_quit = escape, q
)INI";

    return static_cast<bool>(f);
}
