#include "canvas.hpp"

#include <algorithm>
#include <cwchar>

#include <wchar.h>

namespace app::ui {

Rect Rect::Inset(int margin) const {
    return {.y = y + margin,
            .x = x + margin,
            .height = std::max(0, height - margin * 2),
            .width = std::max(0, width - margin * 2)};
}

Rect Rect::TakeTop(int rows, Rect &rest) const {
    rows = std::clamp(rows, 0, height);
    const Rect top{.y = y, .x = x, .height = rows, .width = width};
    rest = {.y = y + rows, .x = x, .height = height - rows, .width = width};
    return top;
}

Rect Rect::TakeBottom(int rows, Rect &rest) const {
    rows = std::clamp(rows, 0, height);
    const Rect bottom{.y = y + height - rows, .x = x, .height = rows, .width = width};
    rest = {.y = y, .x = x, .height = height - rows, .width = width};
    return bottom;
}

Rect Rect::Centered(int rows, int cols) const {
    rows = std::min(rows, height);
    cols = std::min(cols, width);
    return {.y = y + (height - rows) / 2, .x = x + (width - cols) / 2, .height = rows, .width = cols};
}

// Decodes the character at the start of `text` and returns its length in bytes.
static size_t NextCharacter(std::string_view text, int &width) {
    std::mbstate_t state{};
    wchar_t ch = 0;
    const size_t length = std::mbrtowc(&ch, text.data(), text.size(), &state);
    if (length == 0 || length == static_cast<size_t>(-1) || length == static_cast<size_t>(-2)) {
        width = 1;
        return 1;
    }
    const int columns = ::wcwidth(ch);
    width = columns < 0 ? 1 : columns;
    return length;
}

int TextWidth(std::string_view text) {
    int total = 0;
    while (!text.empty()) {
        int width = 0;
        text.remove_prefix(NextCharacter(text, width));
        total += width;
    }
    return total;
}

size_t FitColumns(std::string_view text, int columns, int &width) {
    width = 0;
    size_t length = 0;
    while (length < text.size()) {
        int charWidth = 0;
        const size_t charLength = NextCharacter(text.substr(length), charWidth);
        if (width + charWidth > columns) {
            break;
        }
        width += charWidth;
        length += charLength;
    }
    return length;
}

Rect Canvas::Bounds() const {
    int rows = 0;
    int cols = 0;
    getmaxyx(m_window, rows, cols);
    return {.y = 0, .x = 0, .height = rows, .width = cols};
}

int Canvas::Print(int y, int x, std::string_view text, int maxWidth, int attrs) {
    if (maxWidth <= 0 || text.empty()) {
        return 0;
    }

    int columns = 0;
    const size_t length = FitColumns(text, maxWidth, columns);

    wattron(m_window, attrs);
    mvwaddnstr(m_window, y, x, text.data(), static_cast<int>(length));
    wattroff(m_window, attrs);
    return columns;
}

void Canvas::PrintCentered(int y, const Rect &rect, std::string_view text, int attrs) {
    const int width = std::min(TextWidth(text), rect.width);
    Print(y, rect.x + (rect.width - width) / 2, text, rect.width, attrs);
}

void Canvas::FillRow(int y, int x, int width, int attrs) {
    if (width <= 0) {
        return;
    }
    wattron(m_window, attrs);
    mvwhline(m_window, y, x, ' ', width);
    wattroff(m_window, attrs);
}

void Canvas::Box(const Rect &rect, std::string_view title, int attrs) {
    if (rect.height < 2 || rect.width < 2) {
        return;
    }
    Clear(rect);

    const int top = rect.y;
    const int bottom = rect.Bottom() - 1;
    const int left = rect.x;
    const int right = rect.Right() - 1;

    wattron(m_window, attrs);
    mvwhline(m_window, top, left + 1, ACS_HLINE, rect.width - 2);
    mvwhline(m_window, bottom, left + 1, ACS_HLINE, rect.width - 2);
    mvwvline(m_window, top + 1, left, ACS_VLINE, rect.height - 2);
    mvwvline(m_window, top + 1, right, ACS_VLINE, rect.height - 2);
    mvwaddch(m_window, top, left, ACS_ULCORNER);
    mvwaddch(m_window, top, right, ACS_URCORNER);
    mvwaddch(m_window, bottom, left, ACS_LLCORNER);
    mvwaddch(m_window, bottom, right, ACS_LRCORNER);
    wattroff(m_window, attrs);

    if (!title.empty() && rect.width > 4) {
        Print(top, left + 2, title, rect.width - 4, attrs | A_BOLD);
    }
}

void Canvas::Clear(const Rect &rect) {
    for (int row = rect.y; row < rect.Bottom(); ++row) {
        FillRow(row, rect.x, rect.width, A_NORMAL);
    }
}

} // namespace app::ui
