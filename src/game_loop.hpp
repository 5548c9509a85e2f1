#pragma once

#include "game.hpp"

// The seam between the engine and whatever shows it to a human (SDL window,
// terminal, a test script).
class Frontend {
public:
    virtual ~Frontend() = default;

    // Draw the current state. Called once per tick, before the end checks.
    virtual void present(const Game& game) = 0;

    // Block until the next command. Front ends map keys they do not know to
    // Action::None (or keep waiting, depending on settings).
    virtual Action nextAction(const Game& game) = 0;
};

// Runs ticks until the player dies, the level is cleared or the player quits.
// Each tick: reveal + present, end checks, one input, player turn, enemy turn.
// A game without a loaded level returns Quit immediately.
RunState runGame(Game& game, Frontend& frontend);

const char* runStateName(RunState s);
