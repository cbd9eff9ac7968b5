#include <shdbg/input/key_chord.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <vector>

namespace shdbg::input {

namespace {

    struct NamedKey {
        KeyCode code;
        std::string_view name;
        std::string_view display;
    };

    constexpr std::array<NamedKey, 16> kNamedKeys = {{
        {KeyCode::Space, "Space", "Space"},
        {KeyCode::Enter, "Enter", "Enter"},
        {KeyCode::Tab, "Tab", "Tab"},
        {KeyCode::BackTab, "Shift+Tab", "⇧+Tab"},
        {KeyCode::Esc, "Esc", "Esc"},
        {KeyCode::Backspace, "Backspace", "Backspace"},
        {KeyCode::Delete, "Del", "Del"},
        {KeyCode::Insert, "Ins", "Ins"},
        {KeyCode::Left, "Left", "←"},
        {KeyCode::Right, "Right", "→"},
        {KeyCode::Up, "Up", "↑"},
        {KeyCode::Down, "Down", "↓"},
        {KeyCode::Home, "Home", "Home"},
        {KeyCode::End, "End", "End"},
        {KeyCode::PageUp, "PgUp", "PgUp"},
        {KeyCode::PageDown, "PgDown", "PgDown"},
    }};

    // Extra spellings accepted by the parser
    struct KeyAlias {
        std::string_view name;
        KeyCode code;
    };

    constexpr std::array<KeyAlias, 6> kKeyAliases = {{
        {"Return", KeyCode::Enter},
        {"Escape", KeyCode::Esc},
        {"Delete", KeyCode::Delete},
        {"Insert", KeyCode::Insert},
        {"PageUp", KeyCode::PageUp},
        {"PageDown", KeyCode::PageDown},
    }};

    bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
        return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
               });
    }

    std::optional<KeyCode> FindKeyCode(std::string_view name) {
        for (const auto &key : kNamedKeys) {
            if (EqualsIgnoreCase(key.name, name)) {
                return key.code;
            }
        }
        for (const auto &alias : kKeyAliases) {
            if (EqualsIgnoreCase(alias.name, name)) {
                return alias.code;
            }
        }
        return std::nullopt;
    }

    const NamedKey *FindNamedKey(KeyCode code) {
        for (const auto &key : kNamedKeys) {
            if (key.code == code) {
                return &key;
            }
        }
        return nullptr;
    }

    std::string KeyName(const KeyChord &chord, bool display) {
        switch (chord.code) {
        case KeyCode::None: return {};
        case KeyCode::Char:
            if (chord.ch == '+') {
                return "Plus";
            }
            // Lowercase letters are shown the way they're printed on the key cap
            return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(chord.ch))));
        case KeyCode::Function: return fmt::format("F{}", static_cast<int>(chord.ch));
        default:
            if (const NamedKey *key = FindNamedKey(chord.code)) {
                return std::string{display ? key->display : key->name};
            }
            return {};
        }
    }

    std::string Format(const KeyChord &chord, bool display) {
        std::string out{};
        auto append = [&](std::string_view part) {
            if (!out.empty()) {
                out += '+';
            }
            out += part;
        };
        const bool upperLetter = chord.code == KeyCode::Char && std::isupper(static_cast<unsigned char>(chord.ch));
        if ((chord.modifiers & mod::Shift) || upperLetter) {
            append(display ? "⇧" : "Shift");
        }
        if (chord.modifiers & mod::Ctrl) {
            append("Ctrl");
        }
        if (chord.modifiers & mod::Alt) {
            append("Alt");
        }
        append(KeyName(chord, display));
        return out;
    }

} // namespace

std::optional<KeyChord> ParseKeyChord(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    // "Shift+Tab" is its own key
    if (auto code = FindKeyCode(text)) {
        return KeyChord::Key(*code);
    }

    std::vector<std::string_view> parts{};
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t next = text.find('+', pos);
        if (next == std::string_view::npos) {
            next = text.size();
        }
        parts.push_back(text.substr(pos, next - pos));
        pos = next + 1;
    }

    uint8 modifiers = mod::None;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (EqualsIgnoreCase(parts[i], "Shift")) {
            modifiers |= mod::Shift;
        } else if (EqualsIgnoreCase(parts[i], "Ctrl") || EqualsIgnoreCase(parts[i], "Control")) {
            modifiers |= mod::Ctrl;
        } else if (EqualsIgnoreCase(parts[i], "Alt")) {
            modifiers |= mod::Alt;
        } else {
            return std::nullopt;
        }
    }

    const std::string_view key = parts.back();
    if (key.empty()) {
        return std::nullopt;
    }

    if (key.size() == 1 || EqualsIgnoreCase(key, "Plus")) {
        char ch = key.size() == 1 ? key[0] : '+';
        if (!std::isgraph(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        if (std::isalpha(static_cast<unsigned char>(ch))) {
            const bool shifted = (modifiers & mod::Shift) && !(modifiers & (mod::Ctrl | mod::Alt));
            ch = static_cast<char>(shifted ? std::toupper(static_cast<unsigned char>(ch))
                                           : std::tolower(static_cast<unsigned char>(ch)));
            if (shifted) {
                modifiers &= ~mod::Shift;
            }
        }
        return KeyChord::Char(ch, modifiers);
    }

    if ((key[0] == 'F' || key[0] == 'f') && key.size() <= 3) {
        int number = 0;
        const auto [ptr, ec] = std::from_chars(key.data() + 1, key.data() + key.size(), number);
        if (ec == std::errc{} && ptr == key.data() + key.size() && number >= 1 && number <= 12) {
            if (modifiers != mod::None) {
                return std::nullopt;
            }
            return KeyChord::Fn(static_cast<uint8>(number));
        }
        return std::nullopt;
    }

    if (auto code = FindKeyCode(key)) {
        if (*code == KeyCode::Tab && modifiers == mod::Shift) {
            return KeyChord::Key(KeyCode::BackTab);
        }
        return KeyChord::Key(*code, modifiers);
    }
    return std::nullopt;
}

std::string ToString(const KeyChord &chord) {
    return Format(chord, false);
}

std::string ToDisplayString(const KeyChord &chord) {
    return Format(chord, true);
}

} // namespace shdbg::input
