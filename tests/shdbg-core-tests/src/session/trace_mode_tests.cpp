#include <catch2/catch_test_macros.hpp>

#include <shdbg/session/trace_mode.hpp>

#include <shdbg/resume/resume_code.hpp>

#include <cstdlib>
#include <optional>
#include <string>

using namespace shdbg;
using namespace shdbg::session;

namespace trace_mode_tests {

TEST_CASE("Session variable values map to trace modes", "[session][trace-mode]") {
    CHECK(ParseTraceMode(std::nullopt) == TraceMode{mode::Disabled{}});
    CHECK(ParseTraceMode("") == TraceMode{mode::Disabled{}});
    CHECK(ParseTraceMode("all") == TraceMode{mode::All{}});
    CHECK(ParseTraceMode("next") == TraceMode{mode::Next{}});
    CHECK(ParseTraceMode("myfunction") == TraceMode{mode::Named{"myfunction"}});

    // Matching is exact
    CHECK(ParseTraceMode("ALL") == TraceMode{mode::Named{"ALL"}});
    CHECK(ParseTraceMode(" next") == TraceMode{mode::Named{" next"}});
}

TEST_CASE("Stop decisions follow the trace mode", "[session][trace-mode]") {
    const StopDecision noStop{.stop = false, .transition = ModeTransition::Keep};
    const StopDecision stopKeep{.stop = true, .transition = ModeTransition::Keep};
    const StopDecision stopClear{.stop = true, .transition = ModeTransition::Clear};

    CHECK(Resolve(mode::Disabled{}, "start") == noStop);
    CHECK(Resolve(mode::All{}, "start") == stopKeep);
    CHECK(Resolve(mode::Next{}, "start") == stopClear);
    CHECK(Resolve(mode::Named{"start"}, "start") == stopKeep);
    CHECK(Resolve(mode::Named{"start"}, "end") == noStop);
    CHECK(Resolve(mode::Named{"start"}, "Start") == noStop);
}

TEST_CASE("Tracing everything stops at every tracepoint without changing the mode", "[session][trace-mode]") {
    const TraceMode mode = ParseTraceMode("all");

    for (const char *tracepoint : {"start", "end"}) {
        CAPTURE(tracepoint);
        const StopDecision decision = Resolve(mode, tracepoint);
        CHECK(decision.stop);
        CHECK(decision.transition == ModeTransition::Keep);

        for (auto dialect : shell::kAllDialects) {
            CAPTURE(shell::GetDialectName(dialect));
            auto result = resume::GenerateResumeCode(dialect, resume::ExitDecision::Resume, decision);
            REQUIRE(result);
            CHECK(result.code.find(kTracepointVariable) == std::string::npos);
        }
    }
}

// Plays the part of the calling shell: evaluates the resume code against the current variable value
std::optional<std::string> ApplyResumeCode(shell::Dialect dialect, const StopDecision &decision,
                                           std::optional<std::string> value) {
    auto result = resume::GenerateResumeCode(dialect, resume::ExitDecision::Resume, decision);
    REQUIRE(result);
    if (result.code == resume::UnsetVariableCommand(dialect)) {
        return std::nullopt;
    }
    CHECK(result.code.empty());
    return value;
}

TEST_CASE("Stepping to the next tracepoint disarms tracing afterwards", "[session][trace-mode]") {
    for (auto dialect : shell::kAllDialects) {
        CAPTURE(shell::GetDialectName(dialect));
        std::optional<std::string> variable{"next"};

        const StopDecision first = Resolve(ParseTraceMode(variable), "start");
        CHECK(first.stop);
        CHECK(first.transition == ModeTransition::Clear);

        variable = ApplyResumeCode(dialect, first, variable);
        CHECK_FALSE(variable.has_value());

        const TraceMode after = ParseTraceMode(variable);
        CHECK(after == TraceMode{mode::Disabled{}});
        CHECK_FALSE(Resolve(after, "start").stop);
        CHECK_FALSE(Resolve(after, "end").stop);
    }
}

TEST_CASE("Tracing all or a named tracepoint stays armed across stops", "[session][trace-mode]") {
    for (auto dialect : shell::kAllDialects) {
        CAPTURE(shell::GetDialectName(dialect));

        {
            std::optional<std::string> variable{"all"};
            const StopDecision first = Resolve(ParseTraceMode(variable), "start");
            REQUIRE(first.stop);
            variable = ApplyResumeCode(dialect, first, variable);
            REQUIRE(variable == "all");

            const StopDecision second = Resolve(ParseTraceMode(variable), "end");
            CHECK(second.stop);
            CHECK(second.transition == ModeTransition::Keep);
        }

        {
            std::optional<std::string> variable{"start"};
            const StopDecision first = Resolve(ParseTraceMode(variable), "start");
            REQUIRE(first.stop);
            variable = ApplyResumeCode(dialect, first, variable);
            REQUIRE(variable == "start");

            CHECK_FALSE(Resolve(ParseTraceMode(variable), "end").stop);
            const StopDecision again = Resolve(ParseTraceMode(variable), "start");
            CHECK(again.stop);
            CHECK(again.transition == ModeTransition::Keep);
        }
    }
}

TEST_CASE("Trace modes are read from the environment", "[session][trace-mode]") {
    const std::string name{kTracepointVariable};

    ::setenv(name.c_str(), "next", 1);
    CHECK(ReadTraceModeFromEnvironment() == TraceMode{mode::Next{}});

    ::setenv(name.c_str(), "deploy", 1);
    CHECK(ReadTraceModeFromEnvironment() == TraceMode{mode::Named{"deploy"}});

    ::setenv(name.c_str(), "", 1);
    CHECK(ReadTraceModeFromEnvironment() == TraceMode{mode::Disabled{}});

    ::unsetenv(name.c_str());
    CHECK(ReadTraceModeFromEnvironment() == TraceMode{mode::Disabled{}});
}

TEST_CASE("Trace modes have readable descriptions", "[session][trace-mode]") {
    CHECK(DescribeTraceMode(mode::Disabled{}) == "disabled");
    CHECK(DescribeTraceMode(mode::All{}) == "all");
    CHECK(DescribeTraceMode(mode::Next{}) == "next");
    CHECK(DescribeTraceMode(mode::Named{"foo"}) == "named 'foo'");
}

} // namespace trace_mode_tests
