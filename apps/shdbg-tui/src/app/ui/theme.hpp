#pragma once

#include <shdbg/core/types.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace app::ui {

/// @brief The eight basic terminal colours plus the terminal's default.
enum class Color : uint8 { Default, Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

inline constexpr std::array<Color, 9> kAllColors = {Color::Default, Color::Black,   Color::Red,
                                                    Color::Green,   Color::Yellow,  Color::Blue,
                                                    Color::Magenta, Color::Cyan,    Color::White};

std::string_view GetColorName(Color color);
std::optional<Color> ParseColor(std::string_view name);

/// @brief Colours used by the screens.
struct Theme {
    Color accent = Color::Magenta;   ///< Tab names, key hints, borders of focused panes
    Color highlight = Color::White; ///< Selected rows and the highlighted modal button
};

/// @brief Curses attributes for the theme's roles. Valid once `Palette::Install` succeeded.
class Palette {
public:
    /// @brief Registers the colour pairs with curses. Falls back to monochrome when the terminal has no colours.
    void Install(const Theme &theme);

    int Accent() const;
    int Dim() const;
    int Selected() const;
    int SelectedInactive() const;
    int CallSite() const;

private:
    bool m_hasColors = false;
};

} // namespace app::ui
