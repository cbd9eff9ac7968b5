#pragma once

/**
@file
@brief Interpretation of the `SHDBG_TRACEPOINT` session variable.

The variable is the only state shared between tracepoint hits of one script run. Every hit runs in a fresh process
that reads the variable on startup; changes are made by the code the debugger prints on exit, which the wrapper
evaluates in the calling shell before the script continues.
*/

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace shdbg::session {

/// @brief Name of the environment variable that arms tracepoints.
inline constexpr std::string_view kTracepointVariable = "SHDBG_TRACEPOINT";

/// @brief Variable value that stops at every tracepoint.
inline constexpr std::string_view kTraceAllValue = "all";

/// @brief Variable value that stops at the next tracepoint only.
inline constexpr std::string_view kTraceNextValue = "next";

namespace mode {

    struct Disabled {
        bool operator==(const Disabled &) const = default;
    };

    struct Named {
        std::string name;
        bool operator==(const Named &) const = default;
    };

    struct Next {
        bool operator==(const Next &) const = default;
    };

    struct All {
        bool operator==(const All &) const = default;
    };

} // namespace mode

/// @brief The resolved trace mode of a script run.
using TraceMode = std::variant<mode::Disabled, mode::Named, mode::Next, mode::All>;

/// @brief How the session variable must change when the script resumes.
enum class ModeTransition {
    Keep,  ///< Leave the variable alone
    Clear, ///< Unset the variable so later tracepoints in the run do not stop
};

struct StopDecision {
    bool stop = false;
    ModeTransition transition = ModeTransition::Keep;

    bool operator==(const StopDecision &) const = default;
};

/// @brief Builds the trace mode from the raw variable value. `std::nullopt` means the variable is not set.
TraceMode ParseTraceMode(std::optional<std::string_view> raw);

/// @brief Reads `SHDBG_TRACEPOINT` from the process environment and parses it.
TraceMode ReadTraceModeFromEnvironment();

/// @brief Decides whether the tracepoint with the given name stops under the given mode.
StopDecision Resolve(const TraceMode &mode, std::string_view tracepoint);

/// @brief Returns a short human-readable description of the mode, e.g. "next" or "named 'foo'".
std::string DescribeTraceMode(const TraceMode &mode);

} // namespace shdbg::session
