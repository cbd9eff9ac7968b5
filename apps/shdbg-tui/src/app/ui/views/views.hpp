#pragma once

#include <app/ui/canvas.hpp>
#include <app/ui/theme.hpp>

#include <shdbg/input/key_bindings.hpp>
#include <shdbg/session/session.hpp>
#include <shdbg/trace/source_cache.hpp>

#include <string>

namespace app::ui {

/// @brief The shell code the debugger would print for each way of leaving it.
struct OutputPreview {
    std::string onContinue;
    std::string onExit;
};

/// @brief Everything the screens need besides the session itself.
struct ViewContext {
    Canvas &canvas;
    const Palette &palette;
    const shdbg::input::KeyBindings &bindings;
    shdbg::trace::SourceCache &sources;
    const OutputPreview &output;
};

void DrawHeader(ViewContext &ctx, const shdbg::session::Session &session, const Rect &area);
void DrawFooter(ViewContext &ctx, const shdbg::session::Session &session, const Rect &area);

void DrawHomeScreen(ViewContext &ctx, const shdbg::session::Session &session, const Rect &area);
void DrawVarsScreen(ViewContext &ctx, const shdbg::session::Session &session, const Rect &area);
void DrawTraceScreen(ViewContext &ctx, const shdbg::session::Session &session, const Rect &area);
void DrawOutputScreen(ViewContext &ctx, const shdbg::session::Session &session, const Rect &area);

/// @brief Draws the exit confirmation on top of everything else.
void DrawExitModal(ViewContext &ctx, const shdbg::session::exit_state::PresentModal &modal, const Rect &area);

/// @brief Draws the whole UI: header, active screen, footer and, when shown, the exit modal.
void DrawUI(ViewContext &ctx, const shdbg::session::Session &session);

} // namespace app::ui
