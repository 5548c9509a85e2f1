#pragma once
#include "sdl.hpp"

#include "game.hpp"

#include <string>

// SDL2 window that draws the engine's FrameView: map tiles as glyphs from the
// built-in bitmap font and a HUD strip with stats and recent messages.
class Renderer {
public:
    Renderer(int tileSize, int hudHeight, bool vsync);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Window size follows the level size. Returns false if SDL fails.
    bool init(int mapW, int mapH, bool fullscreen);
    void shutdown();

    void render(const Game& game);

    // Dims the last frame and prints a centered banner (win/loss/quit).
    void renderBanner(const Game& game, const std::string& title, const std::string& subtitle);

    void toggleFullscreen();

    // Shown in the HUD ("MOVE: WASD/ARROWS  QUIT: ESC").
    void setHelpLine(const std::string& s) { helpLine = s; }

private:
    void drawMap(const FrameView& view);
    void drawHud(const Game& game, const FrameView& view);

    int tile = 24;
    int hudH = 120;
    bool vsyncEnabled = true;

    int winW = 0;
    int winH = 0;
    int mapPxW = 0;
    int mapPxH = 0;

    bool initialized = false;
    bool fullscreen = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    std::string helpLine;
};
