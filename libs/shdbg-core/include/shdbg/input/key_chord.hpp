#pragma once

/**
@file
@brief Keyboard chords: a key plus modifiers.
*/

#include <shdbg/core/types.hpp>

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace shdbg::input {

enum class KeyCode : uint8 {
    None,
    Char, ///< Printable ASCII character stored in `KeyChord::ch`
    Space,
    Enter,
    Tab,
    BackTab, ///< Shift+Tab
    Esc,
    Backspace,
    Delete,
    Insert,
    Left,
    Right,
    Up,
    Down,
    Home,
    End,
    PageUp,
    PageDown,
    Function, ///< F1..F12, number stored in `KeyChord::ch`
};

namespace mod {
    inline constexpr uint8 None = 0;
    inline constexpr uint8 Shift = 1u << 0u;
    inline constexpr uint8 Ctrl = 1u << 1u;
    inline constexpr uint8 Alt = 1u << 2u;
} // namespace mod

/// @brief A key press together with its modifiers.
///
/// Letters are stored as typed: Shift+Q is `ch == 'Q'` without the Shift modifier. Ctrl and Alt chords store the
/// lowercase letter.
struct KeyChord {
    KeyCode code = KeyCode::None;
    char ch = 0;
    uint8 modifiers = mod::None;

    auto operator<=>(const KeyChord &) const = default;

    static constexpr KeyChord Key(KeyCode code, uint8 modifiers = mod::None) {
        return {.code = code, .ch = 0, .modifiers = modifiers};
    }

    static constexpr KeyChord Char(char ch, uint8 modifiers = mod::None) {
        return {.code = KeyCode::Char, .ch = ch, .modifiers = modifiers};
    }

    static constexpr KeyChord Fn(uint8 number) {
        return {.code = KeyCode::Function, .ch = static_cast<char>(number), .modifiers = mod::None};
    }
};

/// @brief Parses chords such as "Q", "Shift+Tab", "Ctrl+C", "F5" or "Down".
///
/// Key names are case-insensitive. A single letter without Shift binds the lowercase letter; "Shift+Q" binds the
/// uppercase one.
std::optional<KeyChord> ParseKeyChord(std::string_view text);

/// @brief Returns the chord in the syntax accepted by `ParseKeyChord`.
std::string ToString(const KeyChord &chord);

/// @brief Returns a compact form for on-screen hints, using arrow glyphs for the arrow keys.
std::string ToDisplayString(const KeyChord &chord);

} // namespace shdbg::input
