#include "terminal_frontend.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <vector>

namespace {

std::string lowerTrim(const std::string& in) {
    std::string out;
    for (unsigned char c : in) {
        if (!std::isspace(c)) out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

void printLine(std::ostream& out, const Message& m) {
    out << "> " << m.text;
    if (m.repeat > 1) out << " (x" << m.repeat << ")";
    out << "\n";
}

} // namespace

Action parseCommand(const std::string& line) {
    const std::string c = lowerTrim(line);
    if (c == "w" || c == "up" || c == "k") return Action::Up;
    if (c == "s" || c == "down" || c == "j") return Action::Down;
    if (c == "a" || c == "left" || c == "h") return Action::Left;
    if (c == "d" || c == "right" || c == "l") return Action::Right;
    if (c == "q" || c == "quit" || c == "exit") return Action::Quit;
    return Action::None;
}

TerminalFrontend::TerminalFrontend(std::istream& input, std::ostream& output, bool quietMode)
    : in(input), out(output), quiet(quietMode) {}

void TerminalFrontend::present(const Game& game) {
    if (quiet) return;

    const FrameView v = game.frame();
    std::vector<std::string> rows(static_cast<size_t>(v.height), std::string(static_cast<size_t>(v.width), ' '));
    auto put = [&](Vec2i p, char c) {
        if (p.x < 0 || p.y < 0 || p.x >= v.width || p.y >= v.height) return;
        rows[static_cast<size_t>(p.y)][static_cast<size_t>(p.x)] = c;
    };

    for (const auto& w : v.walls) put(w.pos, glyphFor(ElementKind::Wall));
    for (const auto& h : v.potions) put(h.pos, glyphFor(ElementKind::HealthPotion));
    for (const auto& e : v.enemies) put(e.pos, e.glyph());
    put(v.player.pos, v.player.glyph());

    for (const auto& r : rows) out << r << "\n";
    out << "HP " << v.hp << "/" << PLAYER_MAX_HP
        << "  ATK " << v.attackLabel << "  DEF " << v.defenceLabel
        << "  KILLS " << v.kills << "  TURN " << v.turns << "\n";

    printNewMessages(game);
}

Action TerminalFrontend::nextAction(const Game&) {
    std::string line;
    if (!std::getline(in, line)) return Action::Quit; // EOF
    return parseCommand(line);
}

void TerminalFrontend::printNewMessages(const Game& game) {
    const auto& msgs = game.messages();
    const uint64_t total = game.messagesPushed();
    const uint64_t first = total - msgs.size(); // serial of msgs[0]

    // The last line shown may have been repeated since; show the new count.
    if (shownUpTo > first && shownUpTo <= total) {
        const Message& last = msgs[static_cast<size_t>(shownUpTo - 1 - first)];
        if (last.repeat > shownRepeat) printLine(out, last);
    }

    // Lines trimmed before they were ever shown are skipped.
    for (uint64_t i = std::max(shownUpTo, first); i < total; ++i) {
        printLine(out, msgs[static_cast<size_t>(i - first)]);
    }

    shownUpTo = total;
    shownRepeat = msgs.empty() ? 0 : msgs.back().repeat;
}
