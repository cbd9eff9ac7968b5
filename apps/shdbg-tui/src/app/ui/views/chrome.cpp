#include "views.hpp"

#include <shdbg/version.hpp>

#include <fmt/format.h>

#include <algorithm>

using namespace shdbg;
using namespace shdbg::session;

namespace app::ui {

void DrawHeader(ViewContext &ctx, const Session &session, const Rect &area) {
    auto &canvas = ctx.canvas;
    canvas.Box(area);
    canvas.PrintCentered(area.y, area, fmt::format(" shdbg-{} ", version::string), A_BOLD);

    const Rect inner = area.Inset(1);
    int x = inner.x + 1;
    for (size_t i = 0; Screen screen : kAllScreens) {
        if (i++ > 0) {
            x += canvas.Print(inner.y, x, " | ", inner.Right() - x, ctx.palette.Dim());
        }
        const int attrs = screen == session.screen ? ctx.palette.Selected() : ctx.palette.Accent();
        x += canvas.Print(inner.y, x, fmt::format(" {} ", GetScreenName(screen)), inner.Right() - x, attrs);
    }
}

void DrawFooter(ViewContext &ctx, const Session &session, const Rect &area) {
    auto &canvas = ctx.canvas;
    canvas.Box(area);

    const auto hints = ctx.bindings.Hints(session.screen, session.exitState);
    int width = 0;
    for (const auto &hint : hints) {
        width += TextWidth(hint.keys) + static_cast<int>(hint.description.size()) + 5;
    }

    const Rect inner = area.Inset(1);
    int x = inner.x + std::max(0, (inner.width - width) / 2);
    for (const auto &hint : hints) {
        x += canvas.Print(inner.y, x, " [", inner.Right() - x, ctx.palette.Dim());
        x += canvas.Print(inner.y, x, hint.keys, inner.Right() - x, ctx.palette.Accent());
        x += canvas.Print(inner.y, x, ": ", inner.Right() - x, ctx.palette.Dim());
        x += canvas.Print(inner.y, x, hint.description, inner.Right() - x);
        x += canvas.Print(inner.y, x, "]", inner.Right() - x, ctx.palette.Dim());
    }
}

void DrawExitModal(ViewContext &ctx, const exit_state::PresentModal &modal, const Rect &area) {
    auto &canvas = ctx.canvas;
    canvas.Clear(area);

    const Rect popup = area.Centered(6, 36);
    canvas.Box(popup);

    const Rect inner = popup.Inset(1);
    canvas.PrintCentered(inner.y, inner, "Exit and terminate the script?");

    const bool okSelected = modal.highlighted == ExitOption::Ok;
    const int okAttrs = okSelected ? ctx.palette.Selected() : A_NORMAL;
    const int cancelAttrs = okSelected ? A_NORMAL : ctx.palette.Selected();

    const int half = inner.width / 2;
    const Rect okArea{.y = inner.y + 2, .x = inner.x, .height = 1, .width = half};
    const Rect cancelArea{.y = inner.y + 2, .x = inner.x + half, .height = 1, .width = inner.width - half};
    canvas.PrintCentered(okArea.y, okArea, "[   Ok   ]", okAttrs);
    canvas.PrintCentered(cancelArea.y, cancelArea, "[ Cancel ]", cancelAttrs);
}

void DrawUI(ViewContext &ctx, const Session &session) {
    Rect body = ctx.canvas.Bounds().Inset(1);
    const Rect header = body.TakeTop(3, body);
    const Rect footer = body.TakeBottom(3, body);

    DrawHeader(ctx, session, header);
    DrawFooter(ctx, session, footer);

    // The modal replaces the active screen until it is dismissed
    if (const auto *modal = std::get_if<exit_state::PresentModal>(&session.exitState)) {
        DrawExitModal(ctx, *modal, body);
        return;
    }

    switch (session.screen) {
    case Screen::Home: DrawHomeScreen(ctx, session, body); break;
    case Screen::Vars: DrawVarsScreen(ctx, session, body); break;
    case Screen::Trace: DrawTraceScreen(ctx, session, body); break;
    case Screen::Output: DrawOutputScreen(ctx, session, body); break;
    }
}

} // namespace app::ui
