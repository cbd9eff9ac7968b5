#include <catch2/catch_test_macros.hpp>

#include <shdbg/resume/resume_code.hpp>

using namespace shdbg;
using namespace shdbg::resume;

namespace resume_code_tests {

inline constexpr session::StopDecision kStopKeep{.stop = true, .transition = session::ModeTransition::Keep};
inline constexpr session::StopDecision kStopClear{.stop = true, .transition = session::ModeTransition::Clear};
inline constexpr session::StopDecision kNoStop{.stop = false, .transition = session::ModeTransition::Keep};

TEST_CASE("Terminating emits an exit directive in every dialect", "[resume]") {
    for (auto dialect : shell::kAllDialects) {
        CAPTURE(shell::GetDialectName(dialect));

        auto result = GenerateResumeCode(dialect, ExitDecision::Terminate, kStopKeep);
        REQUIRE(result);
        CHECK(result.code == "exit 1\n");

        // Terminating ends the run, so the trace mode does not matter
        auto cleared = GenerateResumeCode(dialect, ExitDecision::Terminate, kStopClear);
        REQUIRE(cleared);
        CHECK(cleared.code == "exit 1\n");
    }
}

TEST_CASE("The terminate exit code is configurable", "[resume]") {
    auto result = GenerateResumeCode(shell::Dialect::Zsh, ExitDecision::Terminate, kStopKeep, {.terminateExitCode = 0});
    REQUIRE(result);
    CHECK(result.code == "exit 0\n");

    result = GenerateResumeCode(shell::Dialect::Fish, ExitDecision::Terminate, kStopKeep, {.terminateExitCode = 130});
    REQUIRE(result);
    CHECK(result.code == "exit 130\n");

    for (int code : {-1, 256, 1000}) {
        CAPTURE(code);
        auto invalid =
            GenerateResumeCode(shell::Dialect::Bash, ExitDecision::Terminate, kStopKeep, {.terminateExitCode = code});
        CHECK_FALSE(invalid);
        CHECK(invalid.type == ResumeCodeResult::Type::InvalidExitCode);
        CHECK(invalid.code.empty());
    }
}

TEST_CASE("Resuming leaves the session variable alone unless the mode is cleared", "[resume]") {
    for (auto dialect : shell::kAllDialects) {
        CAPTURE(shell::GetDialectName(dialect));
        auto result = GenerateResumeCode(dialect, ExitDecision::Resume, kStopKeep);
        REQUIRE(result);
        CHECK(result.code.empty());
    }

    auto bash = GenerateResumeCode(shell::Dialect::Bash, ExitDecision::Resume, kStopClear);
    REQUIRE(bash);
    CHECK(bash.code == "unset SHDBG_TRACEPOINT\n");

    auto zsh = GenerateResumeCode(shell::Dialect::Zsh, ExitDecision::Resume, kStopClear);
    REQUIRE(zsh);
    CHECK(zsh.code == "unset SHDBG_TRACEPOINT\n");

    auto fish = GenerateResumeCode(shell::Dialect::Fish, ExitDecision::Resume, kStopClear);
    REQUIRE(fish);
    CHECK(fish.code == "set -e SHDBG_TRACEPOINT\n");
}

TEST_CASE("No code is generated for tracepoints that did not stop", "[resume]") {
    for (auto decision : {ExitDecision::Resume, ExitDecision::Terminate}) {
        CAPTURE(GetExitDecisionName(decision));
        auto result = GenerateResumeCode(shell::Dialect::Bash, decision, kNoStop);
        CHECK_FALSE(result);
        CHECK(result.type == ResumeCodeResult::Type::NotStopped);
        CHECK_FALSE(result.string().empty());
    }
}

} // namespace resume_code_tests
