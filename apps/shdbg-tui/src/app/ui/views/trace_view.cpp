#include "views.hpp"

#include <shdbg/trace/source_cache.hpp>

#include <fmt/format.h>

#include <algorithm>

using namespace shdbg;
using namespace shdbg::session;

namespace app::ui {

static void DrawFrameList(ViewContext &ctx, const Session &session, const Rect &area) {
    auto &canvas = ctx.canvas;
    canvas.Box(area, " Call stack ", ctx.palette.Accent());

    const Rect inner = area.Inset(1);
    const auto &stack = session.callStack;
    if (stack.empty()) {
        canvas.Print(inner.y, inner.x + 1, "<no frames>", inner.width - 1, ctx.palette.Dim());
        return;
    }

    const size_t selected = session.traceView.selectedFrame;
    const auto window = trace::CenterOnLine(stack.size(), static_cast<uint32>(selected + 1), inner.height);
    for (size_t i = 0; i < window.count; ++i) {
        const size_t index = window.first + i;
        const auto &frame = stack[index];
        const int y = inner.y + static_cast<int>(i);
        const int attrs = index == selected ? ctx.palette.Selected() : A_NORMAL;
        canvas.FillRow(y, inner.x, inner.width, attrs);
        canvas.Print(y, inner.x + 1, fmt::format("#{:<2} {}", index, frame.function), inner.width - 1, attrs);
    }
}

static void DrawSource(ViewContext &ctx, const trace::Frame &frame, const Rect &area) {
    auto &canvas = ctx.canvas;
    canvas.Box(area, fmt::format(" {} ", frame.file.filename().string()), ctx.palette.Accent());

    const Rect inner = area.Inset(1);
    const trace::SourceLines *lines = ctx.sources.Get(frame.file);
    if (lines == nullptr || lines->empty()) {
        canvas.Print(inner.y, inner.x + 1, "<source unavailable>", inner.width - 1, ctx.palette.Dim());
        return;
    }

    const auto window = trace::CenterOnLine(lines->size(), frame.line, inner.height);
    const int gutter = static_cast<int>(fmt::format("{}", window.first + window.count).size());
    for (size_t i = 0; i < window.count; ++i) {
        const size_t index = window.first + i;
        const int y = inner.y + static_cast<int>(i);
        const bool callSite = index + 1 == frame.line;
        const int attrs = callSite ? ctx.palette.CallSite() : A_NORMAL;
        if (callSite) {
            canvas.FillRow(y, inner.x, inner.width, attrs);
        }
        const int written =
            canvas.Print(y, inner.x, fmt::format("{:>{}} ", index + 1, gutter), inner.width,
                         callSite ? attrs : ctx.palette.Dim());
        canvas.Print(y, inner.x + written, (*lines)[index], inner.width - written, attrs);
    }
}

static void DrawCallSite(ViewContext &ctx, const trace::Frame &frame, const Rect &area) {
    auto &canvas = ctx.canvas;
    canvas.Box(area, " Call site ", ctx.palette.Accent());

    const Rect inner = area.Inset(1);
    int y = inner.y;
    auto field = [&](std::string_view label, std::string_view value) {
        if (y >= inner.Bottom()) {
            return;
        }
        const int labelWidth =
            canvas.Print(y, inner.x + 1, fmt::format("{:<10}", label), inner.width - 1, ctx.palette.Dim());
        canvas.Print(y, inner.x + 1 + labelWidth, value, inner.width - 1 - labelWidth);
        ++y;
    };
    field("Function", frame.function);
    field("File", frame.file.string());
    field("Line", fmt::format("{}", frame.line));
}

void DrawTraceScreen(ViewContext &ctx, const Session &session, const Rect &area) {
    ctx.canvas.Clear(area);

    const int listWidth = std::clamp(area.width * 2 / 5, std::min(area.width, 20), std::max(20, area.width / 2));
    const Rect list{.y = area.y, .x = area.x, .height = area.height, .width = listWidth};
    Rect detail{.y = area.y, .x = area.x + listWidth, .height = area.height, .width = area.width - listWidth};

    DrawFrameList(ctx, session, list);

    const auto &stack = session.callStack;
    if (stack.empty()) {
        ctx.canvas.Box(detail, " Call site ", ctx.palette.Accent());
        return;
    }
    const auto &frame = stack[std::min(session.traceView.selectedFrame, stack.size() - 1)];
    const Rect info = detail.TakeTop(5, detail);
    DrawCallSite(ctx, frame, info);
    DrawSource(ctx, frame, detail);
}

} // namespace app::ui
