#include "views.hpp"

#include <shdbg/env/environment.hpp>

#include <fmt/format.h>

#include <algorithm>

using namespace shdbg;
using namespace shdbg::session;

namespace app::ui {

static int BorderAttrs(ViewContext &ctx, bool focused) {
    return focused ? ctx.palette.Accent() : ctx.palette.Dim();
}

static int SelectionAttrs(ViewContext &ctx, bool focused) {
    return focused ? ctx.palette.Selected() : ctx.palette.SelectedInactive();
}

static void DrawVariableList(ViewContext &ctx, const Session &session, const Rect &area) {
    auto &canvas = ctx.canvas;
    const auto &view = session.varsView;
    const bool focused = view.focus == VarsView::Focus::List;
    const auto &vars = session.environment.Variables();
    canvas.Box(area, fmt::format(" Variables ({}) ", vars.size()), BorderAttrs(ctx, focused));

    const Rect inner = area.Inset(1);
    if (vars.empty()) {
        canvas.Print(inner.y, inner.x + 1, "<empty environment>", inner.width - 1, ctx.palette.Dim());
        return;
    }

    const auto window = trace::CenterOnLine(vars.size(), static_cast<uint32>(view.selectedVar + 1), inner.height);
    for (size_t i = 0; i < window.count; ++i) {
        const size_t index = window.first + i;
        const int y = inner.y + static_cast<int>(i);
        const int attrs = index == view.selectedVar ? SelectionAttrs(ctx, focused) : A_NORMAL;
        canvas.FillRow(y, inner.x, inner.width, attrs);
        canvas.Print(y, inner.x + 1, vars[index].name, inner.width - 1, attrs);
    }
}

// Wraps the raw value at the pane width.
static void DrawRawValue(ViewContext &ctx, std::string_view value, const Rect &inner) {
    auto &canvas = ctx.canvas;
    const int width = inner.width - 1;
    if (width <= 0) {
        return;
    }
    if (value.empty()) {
        canvas.Print(inner.y, inner.x + 1, "<empty>", width, ctx.palette.Dim());
        return;
    }
    for (int y = inner.y; y < inner.Bottom() && !value.empty(); ++y) {
        int columns = 0;
        const size_t length = FitColumns(value, width, columns);
        if (length == 0) {
            // The next character is wider than the pane
            canvas.Print(y, inner.x + 1, "?", width, ctx.palette.Dim());
            int skipped = 0;
            value.remove_prefix(std::max<size_t>(FitColumns(value, 2, skipped), 1));
            continue;
        }
        canvas.Print(y, inner.x + 1, value.substr(0, length), width);
        value.remove_prefix(length);
    }
}

static void DrawSplitValue(ViewContext &ctx, const VarsView &view, std::string_view value, const Rect &inner,
                           bool focused) {
    auto &canvas = ctx.canvas;
    const auto items = env::SplitValue(value);
    const auto window = trace::CenterOnLine(items.size(), static_cast<uint32>(view.selectedItem + 1), inner.height);
    const int gutter = static_cast<int>(fmt::format("{}", items.size()).size());
    for (size_t i = 0; i < window.count; ++i) {
        const size_t index = window.first + i;
        const int y = inner.y + static_cast<int>(i);
        const bool selected = focused && index == view.selectedItem;
        const int attrs = selected ? ctx.palette.Selected() : A_NORMAL;
        canvas.FillRow(y, inner.x, inner.width, attrs);
        const int written = canvas.Print(y, inner.x + 1, fmt::format("{:>{}} ", index, gutter), inner.width - 1,
                                         selected ? attrs : ctx.palette.Dim());
        const std::string_view item = items[index];
        canvas.Print(y, inner.x + 1 + written, item.empty() ? "<empty>" : item, inner.width - 1 - written,
                     item.empty() && !selected ? ctx.palette.Dim() : attrs);
    }
}

static void DrawVariableDetail(ViewContext &ctx, const Session &session, const Rect &area) {
    auto &canvas = ctx.canvas;
    const auto &view = session.varsView;
    const bool focused = view.focus == VarsView::Focus::Detail;
    const bool split = view.detail == VarsView::Detail::Split;
    const auto &vars = session.environment.Variables();

    if (view.selectedVar >= vars.size()) {
        canvas.Box(area, " Value ", BorderAttrs(ctx, focused));
        return;
    }
    const auto &var = vars[view.selectedVar];
    canvas.Box(area, fmt::format(" {} [{}] ", var.name, split ? "split" : "raw"), BorderAttrs(ctx, focused));

    const Rect inner = area.Inset(1);
    if (split) {
        DrawSplitValue(ctx, view, var.value, inner, focused);
    } else {
        DrawRawValue(ctx, var.value, inner);
    }
}

void DrawVarsScreen(ViewContext &ctx, const Session &session, const Rect &area) {
    ctx.canvas.Clear(area);

    const int listWidth = std::clamp(area.width / 3, std::min(area.width, 24), std::max(24, area.width / 2));
    const Rect list{.y = area.y, .x = area.x, .height = area.height, .width = listWidth};
    const Rect detail{.y = area.y, .x = area.x + listWidth, .height = area.height, .width = area.width - listWidth};

    DrawVariableList(ctx, session, list);
    DrawVariableDetail(ctx, session, detail);
}

} // namespace app::ui
