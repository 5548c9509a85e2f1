#pragma once
#include "game.hpp"
#include "game_loop.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

// Maps one typed command to an action. Unknown words pass the turn.
Action parseCommand(const std::string& line);

// Plain-text front end: an ASCII frame plus the status lines logged since the
// previous frame, one command per input line.
class TerminalFrontend : public Frontend {
public:
    TerminalFrontend(std::istream& in, std::ostream& out, bool quietMode);

    void present(const Game& game) override;
    Action nextAction(const Game& game) override;

private:
    void printNewMessages(const Game& game);

    std::istream& in;
    std::ostream& out;
    bool quiet = false;

    // Serial (see Game::messagesPushed) one past the last line shown, and the
    // repeat count that line had when it was shown.
    uint64_t shownUpTo = 0;
    int shownRepeat = 0;
};
