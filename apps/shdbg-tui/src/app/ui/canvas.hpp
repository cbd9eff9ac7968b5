#pragma once

#include <curses.h>

#include <cstddef>
#include <string_view>

namespace app::ui {

/// @brief A screen area in character cells.
struct Rect {
    int y = 0;
    int x = 0;
    int height = 0;
    int width = 0;

    bool IsEmpty() const {
        return height <= 0 || width <= 0;
    }

    int Bottom() const {
        return y + height;
    }

    int Right() const {
        return x + width;
    }

    /// @brief Shrinks the rectangle by `margin` cells on every side.
    Rect Inset(int margin) const;

    /// @brief Splits off the top `rows` rows. The remainder is returned through `rest`, which may alias this rectangle.
    Rect TakeTop(int rows, Rect &rest) const;

    /// @brief Splits off the bottom `rows` rows. The remainder is returned through `rest`.
    Rect TakeBottom(int rows, Rect &rest) const;

    /// @brief Returns a rectangle of the given size centred inside this one.
    Rect Centered(int rows, int cols) const;
};

/// @brief Number of terminal columns taken by text in the current locale's encoding.
///
/// Wide characters take two columns and combining marks none. Bytes that do not decode and non-printable
/// characters take one column each.
int TextWidth(std::string_view text);

/// @brief Finds the longest prefix of `text` that fits in `columns` terminal columns.
/// @param[out] width receives the number of columns taken by the prefix
/// @return the length of the prefix in bytes
size_t FitColumns(std::string_view text, int columns, int &width);

/// @brief Thin drawing layer over a curses window.
class Canvas {
public:
    explicit Canvas(WINDOW *window)
        : m_window(window) {}

    Rect Bounds() const;

    /// @brief Prints text at a position, truncated to `maxWidth` columns.
    /// @return the number of columns written
    int Print(int y, int x, std::string_view text, int maxWidth, int attrs = A_NORMAL);

    /// @brief Prints text centred horizontally inside `rect` on row `y`.
    void PrintCentered(int y, const Rect &rect, std::string_view text, int attrs = A_NORMAL);

    /// @brief Fills a row span with spaces using the given attributes.
    void FillRow(int y, int x, int width, int attrs);

    /// @brief Clears the area and draws a border around it, with an optional title on the top edge.
    void Box(const Rect &rect, std::string_view title = {}, int attrs = A_NORMAL);

    void Clear(const Rect &rect);

private:
    WINDOW *m_window;
};

} // namespace app::ui
