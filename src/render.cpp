#include "render.hpp"
#include "ui_font.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace {

Color messageColor(MessageKind k) {
    switch (k) {
        case MessageKind::Combat: return {235, 120, 100, 255};
        case MessageKind::Loot: return {220, 120, 230, 255};
        case MessageKind::System: return {150, 190, 255, 255};
        case MessageKind::Warning: return {255, 200, 80, 255};
        case MessageKind::Success: return {120, 230, 120, 255};
        case MessageKind::Info:
        default:
            return {210, 210, 210, 255};
    }
}

} // namespace

Renderer::Renderer(int tileSize, int hudHeight, bool vsync)
    : tile(tileSize), hudH(hudHeight), vsyncEnabled(vsync) {}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init(int mapW, int mapH, bool startFullscreen) {
    if (initialized) return true;

    // Keep the HUD wide enough for its text even on tiny levels.
    mapPxW = std::max(1, mapW) * tile;
    mapPxH = std::max(1, mapH) * tile;
    winW = std::max(mapPxW, 480);
    winH = mapPxH + hudH;

    const std::string title = std::string(DUNGEONCRAWLER_APPNAME) + " v" + DUNGEONCRAWLER_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        // Software fallback (headless VMs, remote desktops).
        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Fixed logical resolution; SDL scales when the window is resized.
    SDL_RenderSetLogicalSize(renderer, winW, winH);

    initialized = true;
    if (startFullscreen) toggleFullscreen();
    return true;
}

void Renderer::shutdown() {
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    initialized = false;
}

void Renderer::toggleFullscreen() {
    if (!window) return;
    fullscreen = !fullscreen;
    if (SDL_SetWindowFullscreen(window, fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0) != 0) {
        std::cerr << "SDL_SetWindowFullscreen failed: " << SDL_GetError() << "\n";
        fullscreen = !fullscreen;
    }
}

void Renderer::render(const Game& game) {
    if (!initialized) return;

    const FrameView view = game.frame();

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    drawMap(view);
    drawHud(game, view);

    SDL_RenderPresent(renderer);
}

void Renderer::drawMap(const FrameView& view) {
    const Vec2i pp = view.player.pos;
    const int r2 = Game::SIGHT_RADIUS * Game::SIGHT_RADIUS;

    // Lit floor inside the sight radius.
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(renderer, 24, 22, 30, 255);
    for (int y = std::max(0, pp.y - Game::SIGHT_RADIUS); y <= std::min(view.height - 1, pp.y + Game::SIGHT_RADIUS); ++y) {
        for (int x = std::max(0, pp.x - Game::SIGHT_RADIUS); x <= std::min(view.width - 1, pp.x + Game::SIGHT_RADIUS); ++x) {
            if (dist2({x, y}, pp) > r2) continue;
            SDL_Rect rc{x * tile, y * tile, tile, tile};
            SDL_RenderFillRect(renderer, &rc);
        }
    }

    for (const auto& w : view.walls) {
        drawCellGlyph(renderer, w.pos.x * tile, w.pos.y * tile, tile, colorFor(ElementKind::Wall), glyphFor(ElementKind::Wall));
    }
    for (const auto& h : view.potions) {
        drawCellGlyph(renderer, h.pos.x * tile, h.pos.y * tile, tile, colorFor(ElementKind::HealthPotion), glyphFor(ElementKind::HealthPotion));
    }
    for (const auto& e : view.enemies) {
        drawCellGlyph(renderer, e.pos.x * tile, e.pos.y * tile, tile, e.color(), e.glyph());
    }
    drawCellGlyph(renderer, pp.x * tile, pp.y * tile, tile, view.player.color(), view.player.glyph());
}

void Renderer::drawHud(const Game& game, const FrameView& view) {
    const int top = mapPxH;

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(renderer, 18, 18, 26, 255);
    SDL_Rect bg{0, top, winW, hudH};
    SDL_RenderFillRect(renderer, &bg);
    SDL_SetRenderDrawColor(renderer, 70, 70, 90, 255);
    SDL_RenderDrawLine(renderer, 0, top, winW, top);

    const int scale = 2;
    const int lineH = (FONT_H + 2) * scale;
    int y = top + 6;

    std::ostringstream stats;
    stats << "HP " << view.hp << "/" << PLAYER_MAX_HP
          << "  ATK " << view.attackLabel
          << "  DEF " << view.defenceLabel
          << "  KILLS " << view.kills
          << "  TURN " << view.turns;
    const Color hpColor = (view.hp <= 25) ? Color{255, 90, 80, 255} : Color{240, 230, 200, 255};
    drawText5x7(renderer, 8, y, scale, hpColor, stats.str());
    y += lineH;

    if (!helpLine.empty()) {
        drawText5x7(renderer, 8, y, 1, Color{130, 130, 150, 255}, helpLine);
        y += (FONT_H + 3);
    }

    // Newest messages at the bottom, as many as fit.
    const auto& msgs = game.messages();
    const int room = std::max(0, (top + hudH - y - 4) / lineH);
    const int first = std::max(0, static_cast<int>(msgs.size()) - room);
    for (int i = first; i < static_cast<int>(msgs.size()); ++i) {
        const Message& m = msgs[static_cast<size_t>(i)];
        std::string text = m.text;
        if (m.repeat > 1) text += " (x" + std::to_string(m.repeat) + ")";
        // Long combat lines drop to scale 1 rather than run off the window.
        const int ms = (textWidth5x7(text, scale) <= winW - 16) ? scale : 1;
        drawText5x7(renderer, 8, y, ms, messageColor(m.kind), text);
        y += lineH;
    }
}

void Renderer::renderBanner(const Game& game, const std::string& title, const std::string& subtitle) {
    if (!initialized) return;

    const FrameView view = game.frame();

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);
    drawMap(view);
    drawHud(game, view);

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 180);
    SDL_Rect dim{0, 0, winW, winH};
    SDL_RenderFillRect(renderer, &dim);

    const int big = std::max(2, winW / 160);
    const int tw = textWidth5x7(title, big);
    drawText5x7(renderer, (winW - tw) / 2, winH / 2 - FONT_H * big, big, Color{255, 230, 120, 255}, title);

    const int sw = textWidth5x7(subtitle, 2);
    drawText5x7(renderer, (winW - sw) / 2, winH / 2 + 8, 2, Color{200, 200, 210, 255}, subtitle);

    SDL_RenderPresent(renderer);
}
