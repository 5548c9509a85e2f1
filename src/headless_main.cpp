#include "game.hpp"
#include "game_loop.hpp"
#include "terminal_frontend.hpp"
#include "version.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " <level.txt> [options]  (commands on stdin, one per line)\n\n"
        << "Commands:\n"
        << "  w a s d | up left down right   Move / attack\n"
        << "  q | quit                       Leave the run\n"
        << "  anything else                  Pass the turn\n\n"
        << "Options:\n"
        << "  --seed <n>      RNG seed (default 1).\n"
        << "  --quiet         Only print the final result.\n"
        << "  --version       Print version.\n"
        << "  --help          Show this help.\n";
}

bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string levelPath;
    uint32_t seed = 1;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (a == "--version") {
            std::cout << DUNGEONCRAWLER_APPNAME << " " << DUNGEONCRAWLER_VERSION << "\n";
            return 0;
        }
        if (a == "--quiet") {
            quiet = true;
            continue;
        }
        if (a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v) || !parseU32(v, seed)) {
                std::cerr << "--seed needs a non-negative integer\n";
                return 2;
            }
            continue;
        }
        if (!a.empty() && a[0] == '-') {
            std::cerr << "Unknown option: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
        levelPath = a;
    }

    if (levelPath.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    Game game(seed);
    std::string err;
    if (!game.loadLevel(levelPath, &err)) {
        std::cerr << "Cannot start: " << err << "\n";
        return 1;
    }
    if (!game.level().hasPlayerStart()) {
        std::cerr << "Warning: " << levelPath << " has no '@'; the player starts at (0,0)\n";
    }

    TerminalFrontend frontend(std::cin, std::cout, quiet);
    const RunState result = runGame(game, frontend);

    std::cout << "RESULT: " << runStateName(result)
              << " turns=" << game.turns() << " kills=" << game.kills()
              << " hp=" << std::max(0, game.player().hp)
              << " seed=" << game.seed() << "\n";
    return 0;
}
