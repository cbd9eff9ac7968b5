#include "theme.hpp"

#include <curses.h>

namespace app::ui {

namespace pair {
    inline constexpr short kAccent = 1;
    inline constexpr short kSelected = 2;
    inline constexpr short kCallSite = 3;
} // namespace pair

std::string_view GetColorName(Color color) {
    switch (color) {
    case Color::Default: return "default";
    case Color::Black: return "black";
    case Color::Red: return "red";
    case Color::Green: return "green";
    case Color::Yellow: return "yellow";
    case Color::Blue: return "blue";
    case Color::Magenta: return "magenta";
    case Color::Cyan: return "cyan";
    case Color::White: return "white";
    }
    return "default";
}

std::optional<Color> ParseColor(std::string_view name) {
    for (Color color : kAllColors) {
        if (GetColorName(color) == name) {
            return color;
        }
    }
    return std::nullopt;
}

static short ToCursesColor(Color color, short defaultColor) {
    switch (color) {
    case Color::Default: return defaultColor;
    case Color::Black: return COLOR_BLACK;
    case Color::Red: return COLOR_RED;
    case Color::Green: return COLOR_GREEN;
    case Color::Yellow: return COLOR_YELLOW;
    case Color::Blue: return COLOR_BLUE;
    case Color::Magenta: return COLOR_MAGENTA;
    case Color::Cyan: return COLOR_CYAN;
    case Color::White: return COLOR_WHITE;
    }
    return defaultColor;
}

void Palette::Install(const Theme &theme) {
    m_hasColors = has_colors() == TRUE && start_color() == OK;
    if (!m_hasColors) {
        return;
    }

    // -1 selects the terminal's own colours; terminals without that support get white on black
    const bool hasDefaults = use_default_colors() == OK;
    const short defaultFg = hasDefaults ? -1 : COLOR_WHITE;
    const short defaultBg = hasDefaults ? -1 : COLOR_BLACK;

    init_pair(pair::kAccent, ToCursesColor(theme.accent, defaultFg), defaultBg);
    init_pair(pair::kSelected, COLOR_BLACK, ToCursesColor(theme.highlight, COLOR_WHITE));
    init_pair(pair::kCallSite, COLOR_BLACK, ToCursesColor(theme.accent, COLOR_WHITE));
}

int Palette::Accent() const {
    return m_hasColors ? COLOR_PAIR(pair::kAccent) : A_BOLD;
}

int Palette::Dim() const {
    return A_DIM;
}

int Palette::Selected() const {
    return m_hasColors ? COLOR_PAIR(pair::kSelected) | A_BOLD : A_REVERSE;
}

int Palette::SelectedInactive() const {
    return A_REVERSE;
}

int Palette::CallSite() const {
    return m_hasColors ? COLOR_PAIR(pair::kCallSite) : A_REVERSE | A_BOLD;
}

} // namespace app::ui
