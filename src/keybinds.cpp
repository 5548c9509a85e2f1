#include "keybinds.hpp"

#include <cctype>
#include <fstream>

namespace {

struct NamedKey {
    const char* name;
    SDL_Keycode key;
};

// Names accepted in bind_ lines, also used for the help text.
const NamedKey kNamedKeys[] = {
    {"up", SDLK_UP},
    {"down", SDLK_DOWN},
    {"left", SDLK_LEFT},
    {"right", SDLK_RIGHT},
    {"escape", SDLK_ESCAPE},
    {"esc", SDLK_ESCAPE},
    {"enter", SDLK_RETURN},
    {"return", SDLK_RETURN},
    {"space", SDLK_SPACE},
    {"tab", SDLK_TAB},
    {"kp_2", SDLK_KP_2},
    {"kp_4", SDLK_KP_4},
    {"kp_6", SDLK_KP_6},
    {"kp_8", SDLK_KP_8},
};

// Lower-cased copy with surrounding blanks removed.
std::string clean(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;

    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[i]))));
    }
    return out;
}

std::optional<SDL_Keycode> keyFromName(const std::string& name) {
    if (name.size() == 1 && std::isgraph(static_cast<unsigned char>(name[0]))) {
        return static_cast<SDL_Keycode>(static_cast<unsigned char>(name[0]));
    }
    for (const NamedKey& nk : kNamedKeys) {
        if (name == nk.name) return nk.key;
    }
    return std::nullopt;
}

std::string nameOfKey(SDL_Keycode key) {
    for (const NamedKey& nk : kNamedKeys) {
        if (nk.key == key) return nk.name;
    }
    if (key > 32 && key < 127) return std::string(1, static_cast<char>(key));
    return "?";
}

} // namespace

KeyBinds KeyBinds::defaults() {
    KeyBinds kb;
    kb.slot(Action::Up) = {SDLK_w, SDLK_UP, SDLK_KP_8};
    kb.slot(Action::Down) = {SDLK_s, SDLK_DOWN, SDLK_KP_2};
    kb.slot(Action::Left) = {SDLK_a, SDLK_LEFT, SDLK_KP_4};
    kb.slot(Action::Right) = {SDLK_d, SDLK_RIGHT, SDLK_KP_6};
    kb.slot(Action::Quit) = {SDLK_ESCAPE, SDLK_q};
    return kb;
}

std::optional<Action> KeyBinds::actionFromBindKey(const std::string& iniKey) {
    const std::string key = clean(iniKey);
    const std::string prefix = "bind_";
    if (key.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    const std::string name = key.substr(prefix.size());

    if (name == "up" || name == "north") return Action::Up;
    if (name == "down" || name == "south") return Action::Down;
    if (name == "left" || name == "west") return Action::Left;
    if (name == "right" || name == "east") return Action::Right;
    if (name == "quit" || name == "exit") return Action::Quit;
    return std::nullopt;
}

std::vector<SDL_Keycode> KeyBinds::parseKeyList(const std::string& value) {
    std::vector<SDL_Keycode> out;
    if (clean(value) == "none") return out;

    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();

        if (const auto k = keyFromName(clean(value.substr(start, comma - start)))) {
            out.push_back(*k);
        }
        start = comma + 1;
    }
    return out;
}

void KeyBinds::loadOverridesFromIni(const std::string& settingsPath) {
    std::ifstream in(settingsPath);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        line = line.substr(0, line.find_first_of("#;"));

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        if (const auto a = actionFromBindKey(line.substr(0, eq))) {
            slot(*a) = parseKeyList(line.substr(eq + 1));
        }
    }
}

std::optional<Action> KeyBinds::mapKey(SDL_Keycode key, Uint16 mods) const {
    if (mods & (KMOD_SHIFT | KMOD_CTRL | KMOD_ALT)) return std::nullopt;

    // Quit first so an overlapping user binding always lets the player leave.
    for (Action a : {Action::Quit, Action::Up, Action::Down, Action::Left, Action::Right}) {
        for (SDL_Keycode k : slot(a)) {
            if (k == key) return a;
        }
    }
    return std::nullopt;
}

std::string KeyBinds::describeAction(Action a) const {
    const auto& list = slot(a);
    if (list.empty()) return "none";

    std::string out;
    for (SDL_Keycode k : list) {
        if (!out.empty()) out += ", ";
        out += nameOfKey(k);
    }
    return out;
}
