#include "keybinds.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

bool maps(const KeyBinds& kb, SDL_Keycode key, Uint16 mods, Action want) {
    const auto a = kb.mapKey(key, mods);
    return a.has_value() && *a == want;
}

void test_defaults() {
    const KeyBinds kb = KeyBinds::defaults();

    expect(maps(kb, SDLK_w, KMOD_NONE, Action::Up), "w moves up");
    expect(maps(kb, SDLK_UP, KMOD_NONE, Action::Up), "Up arrow moves up");
    expect(maps(kb, SDLK_KP_2, KMOD_NONE, Action::Down), "Keypad 2 moves down");
    expect(maps(kb, SDLK_a, KMOD_NONE, Action::Left), "a moves left");
    expect(maps(kb, SDLK_RIGHT, KMOD_NONE, Action::Right), "Right arrow moves right");
    expect(maps(kb, SDLK_ESCAPE, KMOD_NONE, Action::Quit), "Escape quits");
    expect(maps(kb, SDLK_q, KMOD_NONE, Action::Quit), "q quits");

    // Lock keys do not count as modifiers.
    expect(maps(kb, SDLK_w, KMOD_NUM | KMOD_CAPS, Action::Up), "Num/Caps lock are ignored");

    expect(!kb.mapKey(SDLK_x, KMOD_NONE).has_value(), "Unbound key maps to nothing");
    expect(!kb.mapKey(SDLK_w, KMOD_LSHIFT).has_value(), "Shift never matches");
    expect(!kb.mapKey(SDLK_UP, KMOD_LCTRL).has_value(), "Ctrl never matches");

    expect(kb.describeAction(Action::Up) == "w, up, kp_8", "Help text for up");
    expect(kb.describeAction(Action::None) == "none", "No keys for None");
}

void test_parse_helpers() {
    expect(KeyBinds::actionFromBindKey("bind_north") == Action::Up, "north is an alias for up");
    expect(KeyBinds::actionFromBindKey(" BIND_Exit ") == Action::Quit, "Action names are case-insensitive");
    expect(!KeyBinds::actionFromBindKey("bind_jump").has_value(), "Unknown action");
    expect(!KeyBinds::actionFromBindKey("tile_size").has_value(), "Non-bind keys are not actions");

    const auto keys = KeyBinds::parseKeyList(" K, ctrl+up, bogus, , kp_8");
    expect(keys.size() == 2, "Unknown key names are dropped");
    expect(keys.size() == 2 && keys[0] == SDLK_k && keys[1] == SDLK_KP_8, "Names and characters parsed in order");
    expect(KeyBinds::parseKeyList("None").empty(), "'none' unbinds");
}

void test_overrides_from_ini() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "dungeoncrawler_keybinds_test.ini";
    {
        std::ofstream out(path);
        out << "tile_size = 32\n"
            << "bind_up = k, i   # vi style\n"
            << "bind_quit = none\n"
            << "bind_fly = f\n";
    }

    KeyBinds kb = KeyBinds::defaults();
    kb.loadOverridesFromIni(path.string());

    expect(maps(kb, SDLK_k, KMOD_NONE, Action::Up), "Override key bound");
    expect(maps(kb, SDLK_i, KMOD_NONE, Action::Up), "Every listed key is bound");
    expect(!kb.mapKey(SDLK_k, KMOD_RSHIFT).has_value(), "Shifted keys never match");
    expect(!kb.mapKey(SDLK_w, KMOD_NONE).has_value(), "Override replaces the default keys");
    expect(!kb.mapKey(SDLK_ESCAPE, KMOD_NONE).has_value(), "Unbound quit no longer matches");
    expect(maps(kb, SDLK_s, KMOD_NONE, Action::Down), "Untouched actions keep their defaults");
    expect(!kb.mapKey(SDLK_f, KMOD_NONE).has_value(), "Unknown actions are ignored");
    expect(kb.describeAction(Action::Up) == "k, i", "Help text follows the override");
    expect(kb.describeAction(Action::Quit) == "none", "Unbound action described as none");

    std::error_code ec;
    fs::remove(path, ec);

    KeyBinds untouched = KeyBinds::defaults();
    untouched.loadOverridesFromIni(path.string());
    expect(maps(untouched, SDLK_w, KMOD_NONE, Action::Up), "Missing file keeps defaults");
}

} // namespace

int main() {
    std::cout << "Running key binding tests...\n";

    test_defaults();
    test_parse_helpers();
    test_overrides_from_ini();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
