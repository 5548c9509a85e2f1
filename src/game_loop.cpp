#include "game_loop.hpp"

RunState runGame(Game& game, Frontend& frontend) {
    if (!game.hasLevel()) return RunState::Quit;

    for (;;) {
        game.revealAround();
        frontend.present(game);

        const RunState st = game.runState();
        if (st != RunState::Playing) return st;

        const Action a = frontend.nextAction(game);
        if (a == Action::Quit) return RunState::Quit;

        game.handleAction(a);
    }
}

const char* runStateName(RunState s) {
    switch (s) {
        case RunState::Playing: return "playing";
        case RunState::PlayerDead: return "player dead";
        case RunState::AllEnemiesCleared: return "all enemies cleared";
        case RunState::Quit: return "quit";
        default: return "unknown";
    }
}
