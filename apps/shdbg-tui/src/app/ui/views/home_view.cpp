#include "views.hpp"

#include <shdbg/session/trace_mode.hpp>
#include <shdbg/version.hpp>

#include <fmt/format.h>

#include <array>
#include <string_view>

using namespace shdbg;
using namespace shdbg::session;

namespace app::ui {

static constexpr std::array<std::string_view, 8> kDescription = {
    "The script is suspended at a tracepoint. Inspect its state, then continue it or terminate it.",
    "",
    "The debugger has capabilities separated out into different tabs:",
    "- Home: you are here",
    "- Vars: inspect the environment variables of the script",
    "- Trace: see the call stack and the source around each call site",
    "- Output: see the commands the shell will run when the debugger exits",
    "",
};

void DrawHomeScreen(ViewContext &ctx, const Session &session, const Rect &area) {
    auto &canvas = ctx.canvas;
    canvas.Box(area);

    const Rect inner = area.Inset(2);
    if (inner.IsEmpty()) {
        return;
    }

    int y = inner.y;
    canvas.PrintCentered(y++, inner, fmt::format("shdbg {}", version::string), ctx.palette.Accent() | A_BOLD);
    canvas.PrintCentered(y++, inner, "Tracepoint debugger for shell scripts", A_NORMAL);
    y++;

    auto field = [&](std::string_view label, std::string_view value) {
        if (y >= inner.Bottom()) {
            return;
        }
        const int labelWidth = canvas.Print(y, inner.x, fmt::format("{:<12}", label), inner.width, ctx.palette.Dim());
        canvas.Print(y, inner.x + labelWidth, value, inner.width - labelWidth);
        ++y;
    };

    field("Tracepoint", session.tracepoint);
    field("Shell", shell::GetDialectName(session.dialect));
    field("Mode", DescribeTraceMode(session.mode));
    if (session.callStack.empty()) {
        field("Called from", "<no frames>");
    } else {
        const auto &caller = session.callStack.front();
        field("Called from", fmt::format("{} ({}:{})", caller.function, caller.file.string(), caller.line));
    }
    field("Frames", fmt::format("{}", session.callStack.size()));
    y++;

    for (std::string_view line : kDescription) {
        if (y >= inner.Bottom()) {
            break;
        }
        canvas.Print(y++, inner.x, line, inner.width);
    }
}

} // namespace app::ui
