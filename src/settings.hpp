#pragma once

#include <string>

// Simple user-editable settings file (INI-ish: key = value).
// Created with commented defaults on first run.
//
// Key bindings live in the same file (bind_<action> = ...) and are read by KeyBinds.
struct Settings {
    int tileSize = 24;
    int hudHeight = 120;
    bool startFullscreen = false;

    // Rendering
    bool vsync = true;

    // Background music (best effort; a missing file only logs a warning).
    bool musicEnabled = true;
    std::string musicPath = "assets/music.wav";
    int musicVolume = 64; // 0..128 (SDL_MIX_MAXVOLUME)

    // Level used when none is given on the command line.
    std::string levelPath = "levels/level1.txt";

    // Keys with no binding still spend a turn (enemies move). Set to false to
    // ignore them instead.
    bool unmappedKeysPassTurn = true;
};

// Loads settings from disk. If the file is missing or a value is invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
