#include "sdl.hpp"

#include <cstdint>
#include <ctime>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include "game.hpp"
#include "game_loop.hpp"
#include "keybinds.hpp"
#include "music.hpp"
#include "render.hpp"
#include "settings.hpp"
#include "version.hpp"

namespace {

std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            try {
                const unsigned long v = std::stoul(argv[i + 1], nullptr, 0);
                return static_cast<uint32_t>(v);
            } catch (const std::exception&) {
                std::cerr << "Ignoring invalid --seed value: " << argv[i + 1] << "\n";
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

// First argument that is neither an option nor an option's value.
std::optional<std::string> parseLevelArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" || a == "--settings") { ++i; continue; }
        if (!a.empty() && a[0] == '-') continue;
        return a;
    }
    return std::nullopt;
}

void printUsage(const char* exe) {
    std::cout
        << DUNGEONCRAWLER_APPNAME << " " << DUNGEONCRAWLER_VERSION << "\n"
        << "Usage: " << (exe ? exe : "dungeoncrawler") << " [level.txt] [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Seed the dice and enemy moves (default: current time)\n"
        << "  --settings <path>    Settings file (default: dungeoncrawler_settings.ini)\n"
        << "  --no-music           Do not play background music\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

class SdlFrontend : public Frontend {
public:
    SdlFrontend(Renderer& r, const KeyBinds& kb, bool unmappedPassTurn)
        : renderer(r), keyBinds(kb), unmappedKeysPassTurn(unmappedPassTurn) {}

    void present(const Game& game) override {
        renderer.render(game);
    }

    Action nextAction(const Game& game) override {
        for (;;) {
            SDL_Event ev;
            if (SDL_WaitEvent(&ev) == 0) {
                std::cerr << "SDL_WaitEvent failed: " << SDL_GetError() << "\n";
                return Action::Quit;
            }

            switch (ev.type) {
                case SDL_QUIT:
                    return Action::Quit;

                case SDL_WINDOWEVENT:
                    if (ev.window.event == SDL_WINDOWEVENT_EXPOSED ||
                        ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                        renderer.render(game);
                    }
                    break;

                case SDL_KEYDOWN: {
                    const SDL_Keycode key = ev.key.keysym.sym;
                    if (key == SDLK_F11) {
                        renderer.toggleFullscreen();
                        renderer.render(game);
                        break;
                    }
                    // Lone modifier presses are not commands.
                    if (key == SDLK_LSHIFT || key == SDLK_RSHIFT || key == SDLK_LCTRL ||
                        key == SDLK_RCTRL || key == SDLK_LALT || key == SDLK_RALT) {
                        break;
                    }

                    const std::optional<Action> a = keyBinds.mapKey(key, ev.key.keysym.mod);
                    if (a.has_value()) return *a;
                    if (unmappedKeysPassTurn) return Action::None;
                    break;
                }

                default:
                    break;
            }
        }
    }

private:
    Renderer& renderer;
    const KeyBinds& keyBinds;
    bool unmappedKeysPassTurn = true;
};

// Holds the end banner until any key or the window closes.
void waitForDismiss(Renderer& renderer, const Game& game, const std::string& title, const std::string& subtitle) {
    renderer.renderBanner(game, title, subtitle);
    SDL_Event ev;
    while (SDL_WaitEvent(&ev)) {
        if (ev.type == SDL_QUIT || ev.type == SDL_KEYDOWN) return;
        if (ev.type == SDL_WINDOWEVENT) renderer.renderBanner(game, title, subtitle);
    }
}

} // namespace

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "dungeoncrawler");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << DUNGEONCRAWLER_APPNAME << " " << DUNGEONCRAWLER_VERSION << "\n";
        return 0;
    }

    const std::string settingsPath = parseStringArg(argc, argv, "--settings").value_or("dungeoncrawler_settings.ini");
    {
        std::ifstream probe(settingsPath);
        if (!probe) {
            if (writeDefaultSettings(settingsPath)) {
                std::cout << "Wrote default settings: " << settingsPath << "\n";
            } else {
                std::cerr << "Could not write default settings to " << settingsPath << "; using defaults\n";
            }
        }
    }
    const Settings settings = loadSettings(settingsPath);

    KeyBinds keyBinds = KeyBinds::defaults();
    keyBinds.loadOverridesFromIni(settingsPath);

    const std::string levelPath = parseLevelArg(argc, argv).value_or(settings.levelPath);
    const uint32_t seed = parseSeedArg(argc, argv).value_or(static_cast<uint32_t>(std::time(nullptr)));

    Game game(seed);
    std::string err;
    if (!game.loadLevel(levelPath, &err)) {
        std::cerr << "Cannot start: " << err << "\n";
        return 1;
    }
    if (!game.level().hasPlayerStart()) {
        std::cerr << "Warning: " << levelPath << " has no '@'; the player starts at (0,0)\n";
    }
    std::cout << "Level " << levelPath << " (" << game.level().width << "x" << game.level().height
              << ", " << game.level().enemies.size() << " enemies), seed " << seed << "\n";

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    {
        Renderer renderer(settings.tileSize, settings.hudHeight, settings.vsync);
        if (!renderer.init(game.level().width, game.level().height, settings.startFullscreen)) {
            SDL_Quit();
            return 1;
        }
        renderer.setHelpLine("MOVE: " + keyBinds.describeAction(Action::Up) + " / " +
                             keyBinds.describeAction(Action::Left) + " / " +
                             keyBinds.describeAction(Action::Down) + " / " +
                             keyBinds.describeAction(Action::Right) +
                             "   QUIT: " + keyBinds.describeAction(Action::Quit) +
                             "   FULLSCREEN: F11");

        MusicPlayer music;
        if (settings.musicEnabled && !hasFlag(argc, argv, "--no-music")) {
            // Failure is already logged; the run goes on without music.
            (void)music.playLooped(settings.musicPath, settings.musicVolume);
        }

        game.pushSystemMessage("Kill every enemy to win. Walls stay on the map once seen.");

        SdlFrontend frontend(renderer, keyBinds, settings.unmappedKeysPassTurn);
        const RunState result = runGame(game, frontend);

        std::cout << "Run ended: " << runStateName(result)
                  << " after " << game.turns() << " turns, " << game.kills() << " kills\n";

        const std::string summary = "KILLS " + std::to_string(game.kills()) + "  TURNS " + std::to_string(game.turns());
        if (result == RunState::PlayerDead) {
            waitForDismiss(renderer, game, "YOU DIED", summary);
        } else if (result == RunState::AllEnemiesCleared) {
            waitForDismiss(renderer, game, "VICTORY!", summary);
        }

        music.stop();
        renderer.shutdown();
    }

    SDL_Quit();
    return 0;
}
