#include "tracepoint_handler.hpp"

#include <shdbg/env/environment.hpp>
#include <shdbg/trace/stack_normalizer.hpp>

#include <shdbg/util/dev_log.hpp>

#include <fmt/format.h>

#include <utility>

using namespace shdbg;

namespace app {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // tracepoint

    struct tracepoint {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Tracepoint";
    };

} // namespace grp

std::string PresentResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::Unavailable: return errorMessage;
    case Type::InputClosed: return "Terminal input was closed before a decision was made";
    }
    return "Unknown";
}

TracepointResult HandleTracepoint(const TracepointRequest &request, SessionPresenter &presenter, std::FILE *out) {
    const session::StopDecision stop = session::Resolve(request.mode, request.tracepoint);
    if (!stop.stop) {
        devlog::debug<grp::tracepoint>("Not stopping at '{}' ({})", request.tracepoint,
                                       session::DescribeTraceMode(request.mode));
        return TracepointResult::NotStopped();
    }

    auto normalized = trace::NormalizeStack(request.dialect, request.callStack);
    if (!normalized.malformed.empty()) {
        devlog::info<grp::tracepoint>("Dropped {} malformed stack records", normalized.malformed.size());
    }

    session::Session state{};
    state.dialect = request.dialect;
    state.tracepoint = request.tracepoint;
    state.callStack = std::move(normalized.frames);
    state.mode = request.mode;
    state.stop = stop;
    state.environment = env::Environment::Capture();

    auto preview = [&](resume::ExitDecision decision) {
        auto result = resume::GenerateResumeCode(state.dialect, decision, stop, request.resumeOptions);
        return result ? result.code : fmt::format("<{}>", result.string());
    };
    ui::OutputPreview output{
        .onContinue = preview(resume::ExitDecision::Resume),
        .onExit = preview(resume::ExitDecision::Terminate),
    };

    const PresentResult presentResult = presenter.Present(state, std::move(output));
    if (!presentResult) {
        return TracepointResult::PresentFailed(presentResult.string());
    }

    auto codeResult = resume::GenerateResumeCode(state.dialect, presentResult.decision, stop, request.resumeOptions);
    if (!codeResult) {
        return TracepointResult::CodeGenerationFailed(codeResult.string());
    }

    devlog::debug<grp::tracepoint>("Emitting {} code ({} bytes)", resume::GetExitDecisionName(presentResult.decision),
                                   codeResult.code.size());
    fmt::print(out, "{}", codeResult.code);
    std::fflush(out);
    return TracepointResult::Emitted();
}

} // namespace app
