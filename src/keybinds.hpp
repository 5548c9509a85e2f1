#pragma once

#include "sdl.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "game.hpp"

// Keyboard bindings, overridable from the settings file:
//   bind_<action> = key[, key, ...]
//
// A key is a single character (w, k) or one of the names in the key table
// (up, down, left, right, escape, enter, space, tab, kp_2, kp_4, kp_6, kp_8).
// An override replaces every default key of the action; `none` unbinds it.
// Keys pressed with shift, ctrl or alt held never match.
class KeyBinds {
public:
    static KeyBinds defaults();
    void loadOverridesFromIni(const std::string& settingsPath);

    // std::nullopt when no action is bound to the key.
    std::optional<Action> mapKey(SDL_Keycode key, Uint16 mods) const;

    // "w, up, kp_8" style list for the HUD help line.
    std::string describeAction(Action a) const;

    // "bind_up" -> Action::Up. Aliases: north/south/west/east, exit.
    static std::optional<Action> actionFromBindKey(const std::string& iniKey);

    // Unknown key names are skipped.
    static std::vector<SDL_Keycode> parseKeyList(const std::string& value);

private:
    static constexpr size_t kActionSlots = static_cast<size_t>(Action::Quit) + 1;

    std::vector<SDL_Keycode>& slot(Action a) { return keys[static_cast<size_t>(a)]; }
    const std::vector<SDL_Keycode>& slot(Action a) const { return keys[static_cast<size_t>(a)]; }

    std::array<std::vector<SDL_Keycode>, kActionSlots> keys;
};
