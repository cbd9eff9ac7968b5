#include <shdbg/session/trace_mode.hpp>

#include <shdbg/util/dev_log.hpp>

#include <fmt/format.h>

#include <cstdlib>

namespace shdbg::session {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // session

    struct session {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Session";
    };

} // namespace grp

TraceMode ParseTraceMode(std::optional<std::string_view> raw) {
    if (!raw || raw->empty()) {
        return mode::Disabled{};
    }
    if (*raw == kTraceAllValue) {
        return mode::All{};
    }
    if (*raw == kTraceNextValue) {
        return mode::Next{};
    }
    return mode::Named{std::string{*raw}};
}

TraceMode ReadTraceModeFromEnvironment() {
    const std::string variable{kTracepointVariable};
    const char *value = std::getenv(variable.c_str());
    if (value == nullptr) {
        return ParseTraceMode(std::nullopt);
    }
    return ParseTraceMode(std::string_view{value});
}

StopDecision Resolve(const TraceMode &mode, std::string_view tracepoint) {
    struct Visitor {
        std::string_view tracepoint;

        StopDecision operator()(const mode::Disabled &) const {
            return {.stop = false, .transition = ModeTransition::Keep};
        }
        StopDecision operator()(const mode::Named &named) const {
            return {.stop = named.name == tracepoint, .transition = ModeTransition::Keep};
        }
        StopDecision operator()(const mode::Next &) const {
            return {.stop = true, .transition = ModeTransition::Clear};
        }
        StopDecision operator()(const mode::All &) const {
            return {.stop = true, .transition = ModeTransition::Keep};
        }
    };

    const StopDecision decision = std::visit(Visitor{tracepoint}, mode);
    devlog::debug<grp::session>("Tracepoint '{}' under mode {}: {}", tracepoint, DescribeTraceMode(mode),
                                decision.stop ? "stop" : "continue");
    return decision;
}

std::string DescribeTraceMode(const TraceMode &mode) {
    struct Visitor {
        std::string operator()(const mode::Disabled &) const {
            return "disabled";
        }
        std::string operator()(const mode::Named &named) const {
            return fmt::format("named '{}'", named.name);
        }
        std::string operator()(const mode::Next &) const {
            return "next";
        }
        std::string operator()(const mode::All &) const {
            return "all";
        }
    };
    return std::visit(Visitor{}, mode);
}

} // namespace shdbg::session
