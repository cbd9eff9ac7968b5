#pragma once

#include <app/ui/views/views.hpp>

#include <shdbg/resume/resume_code.hpp>
#include <shdbg/session/session.hpp>
#include <shdbg/session/trace_mode.hpp>
#include <shdbg/shell/dialect.hpp>

#include <cstdio>
#include <string>

namespace app {

/// @brief Everything needed to act on one tracepoint hit.
struct TracepointRequest {
    shdbg::shell::Dialect dialect = shdbg::shell::Dialect::Bash;
    std::string tracepoint;
    std::string callStack; ///< Raw stack as captured by the shell snippet
    shdbg::session::TraceMode mode;
    shdbg::resume::ResumeOptions resumeOptions;
};

struct PresentResult {
    enum class Type { Success, Unavailable, InputClosed };

    Type type;
    shdbg::resume::ExitDecision decision = shdbg::resume::ExitDecision::Resume;
    std::string errorMessage;

    static PresentResult Success(shdbg::resume::ExitDecision decision) {
        return {.type = Type::Success, .decision = decision, .errorMessage = {}};
    }

    static PresentResult Unavailable(std::string errorMessage) {
        return {.type = Type::Unavailable, .decision = {}, .errorMessage = std::move(errorMessage)};
    }

    static PresentResult InputClosed() {
        return {.type = Type::InputClosed, .decision = {}, .errorMessage = {}};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

/// @brief Shows a stopped session to the user.
class SessionPresenter {
public:
    virtual ~SessionPresenter() = default;

    /// @brief Runs the session until the user decides whether to resume or terminate the script.
    /// Everything the presenter sets up must be torn down before returning.
    virtual PresentResult Present(shdbg::session::Session &state, ui::OutputPreview output) = 0;
};

struct TracepointResult {
    enum class Type { NotStopped, Emitted, PresentFailed, CodeGenerationFailed };

    Type type;
    std::string errorMessage;

    static TracepointResult NotStopped() {
        return {.type = Type::NotStopped, .errorMessage = {}};
    }

    static TracepointResult Emitted() {
        return {.type = Type::Emitted, .errorMessage = {}};
    }

    static TracepointResult PresentFailed(std::string errorMessage) {
        return {.type = Type::PresentFailed, .errorMessage = std::move(errorMessage)};
    }

    static TracepointResult CodeGenerationFailed(std::string errorMessage) {
        return {.type = Type::CodeGenerationFailed, .errorMessage = std::move(errorMessage)};
    }

    explicit operator bool() const {
        return type == Type::NotStopped || type == Type::Emitted;
    }

    const std::string &string() const {
        return errorMessage;
    }
};

/// @brief Decides whether to stop at a tracepoint and, if so, presents the session and writes the resume code.
///
/// Nothing is written to `out` unless the session ends with a decision; then exactly the generated resume code is
/// written, which may be empty.
///
/// @param[in] request the tracepoint hit and how to resume from it
/// @param[in] presenter the UI showing the session
/// @param[in] out receives the resume code for the shell to evaluate
TracepointResult HandleTracepoint(const TracepointRequest &request, SessionPresenter &presenter, std::FILE *out);

} // namespace app
