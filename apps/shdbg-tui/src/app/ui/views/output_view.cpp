#include "views.hpp"

#include <string_view>

using namespace shdbg::session;

namespace app::ui {

// Prints multi-line text inside a box, one row per line.
static void DrawCodeBox(ViewContext &ctx, const Rect &area, std::string_view title, std::string_view code) {
    auto &canvas = ctx.canvas;
    canvas.Box(area, title, ctx.palette.Accent());

    const Rect inner = area.Inset(1);
    int y = inner.y;
    if (code.empty()) {
        canvas.Print(y, inner.x + 1, "<nothing>", inner.width - 1, ctx.palette.Dim());
        return;
    }
    while (!code.empty() && y < inner.Bottom()) {
        const size_t end = code.find('\n');
        canvas.Print(y++, inner.x + 1, code.substr(0, end), inner.width - 1);
        code = end == std::string_view::npos ? std::string_view{} : code.substr(end + 1);
    }
}

void DrawOutputScreen(ViewContext &ctx, const Session & /*session*/, const Rect &area) {
    auto &canvas = ctx.canvas;
    Rect rest = area.Inset(1);
    const Rect desc = rest.TakeTop(2, rest);
    canvas.Clear(area);
    canvas.Print(desc.y, desc.x, "These commands will be evaluated by your shell when the debugger exits.",
                 desc.width);

    const int half = rest.height / 2;
    const Rect onContinue = rest.TakeTop(half, rest);
    DrawCodeBox(ctx, onContinue, " On continue ", ctx.output.onContinue);
    DrawCodeBox(ctx, rest, " On terminate ", ctx.output.onExit);
}

} // namespace app::ui
