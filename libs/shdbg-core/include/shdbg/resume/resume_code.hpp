#pragma once

/**
@file
@brief Generates the shell code the wrapper evaluates after the debugger exits.

Whatever is returned here is `eval`ed verbatim by the calling script, so a failed generation must produce no text at
all rather than a partial command.
*/

#include <shdbg/session/trace_mode.hpp>
#include <shdbg/shell/dialect.hpp>

#include <shdbg/core/types.hpp>

#include <fmt/format.h>

#include <string>
#include <utility>

namespace shdbg::resume {

/// @brief What the user decided to do with the suspended script.
enum class ExitDecision : uint8 {
    Resume,    ///< Continue running the script
    Terminate, ///< Stop the script immediately
};

const char *GetExitDecisionName(ExitDecision decision);

/// @brief Exit status used by the generated terminate directive unless configured otherwise.
inline constexpr int kDefaultTerminateExitCode = 1;

struct ResumeCodeResult {
    enum class Type { Success, NotStopped, InvalidExitCode };

    Type type;
    std::string code;  ///< Generated shell code; empty unless `type` is `Success`
    std::string error; ///< Error description; empty on success

    static ResumeCodeResult Success(std::string code) {
        return {.type = Type::Success, .code = std::move(code), .error = {}};
    }

    static ResumeCodeResult NotStopped() {
        return {.type = Type::NotStopped,
                .code = {},
                .error = "Cannot generate resume code for a tracepoint that did not stop"};
    }

    static ResumeCodeResult InvalidExitCode(int exitCode) {
        return {.type = Type::InvalidExitCode,
                .code = {},
                .error = fmt::format("Terminate exit code {} is out of range 0..255", exitCode)};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    const std::string &string() const {
        return error;
    }
};

/// @brief Generation parameters.
struct ResumeOptions {
    int terminateExitCode = kDefaultTerminateExitCode;
};

/// @brief Generates the code for the given decision.
///
/// - `Terminate` emits an unconditional `exit` that ends the calling script.
/// - `Resume` emits nothing, or the command that unsets `SHDBG_TRACEPOINT` if the stop decision asks to clear it.
///
/// @param[in] dialect the dialect of the calling shell
/// @param[in] decision the user's decision
/// @param[in] stop the stop decision made when the debugger started; must have stopped
/// @param[in] options generation parameters
ResumeCodeResult GenerateResumeCode(shell::Dialect dialect, ExitDecision decision, const session::StopDecision &stop,
                                    const ResumeOptions &options = {});

/// @brief Returns the command that unsets the session variable in the given dialect.
std::string UnsetVariableCommand(shell::Dialect dialect);

} // namespace shdbg::resume
