#include <catch2/catch_test_macros.hpp>

#include <app/tracepoint_handler.hpp>

#include <cstdio>
#include <string>
#include <utility>

using namespace app;
using namespace shdbg;

namespace tracepoint_handler_tests {

// Answers every presentation with a fixed result and remembers what it was shown
class FixedPresenter final : public SessionPresenter {
public:
    explicit FixedPresenter(PresentResult result)
        : m_result(std::move(result)) {}

    PresentResult Present(session::Session &state, ui::OutputPreview output) override {
        ++presentCount;
        shownTracepoint = state.tracepoint;
        shownFrames = state.callStack.size();
        shownOutput = std::move(output);
        return m_result;
    }

    int presentCount = 0;
    std::string shownTracepoint;
    size_t shownFrames = 0;
    ui::OutputPreview shownOutput;

private:
    PresentResult m_result;
};

// Collects everything written to the output stream
struct CapturedOutput {
    std::FILE *file = std::tmpfile();

    ~CapturedOutput() {
        if (file != nullptr) {
            std::fclose(file);
        }
    }

    std::string Contents() const {
        std::fflush(file);
        std::rewind(file);
        std::string contents{};
        char buffer[256];
        size_t count = 0;
        while ((count = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
            contents.append(buffer, count);
        }
        return contents;
    }
};

TracepointRequest MakeRequest(shell::Dialect dialect, std::string tracepoint, session::TraceMode mode) {
    return {
        .dialect = dialect,
        .tracepoint = std::move(tracepoint),
        .callStack = "/opt/shdbg.bash:31:shdbg_tracepoint\n/home/user/run.sh:8:main\n",
        .mode = std::move(mode),
        .resumeOptions = {},
    };
}

TEST_CASE("Tracepoints that do not stop write nothing", "[tracepoint]") {
    CapturedOutput out{};
    REQUIRE(out.file != nullptr);
    FixedPresenter presenter{PresentResult::Success(resume::ExitDecision::Terminate)};

    SECTION("tracing disabled") {
        auto result = HandleTracepoint(MakeRequest(shell::Dialect::Bash, "start", session::mode::Disabled{}),
                                       presenter, out.file);
        CHECK(result);
        CHECK(result.type == TracepointResult::Type::NotStopped);
    }

    SECTION("another tracepoint is traced") {
        auto result = HandleTracepoint(MakeRequest(shell::Dialect::Zsh, "start", session::mode::Named{"end"}),
                                       presenter, out.file);
        CHECK(result);
        CHECK(result.type == TracepointResult::Type::NotStopped);
    }

    CHECK(presenter.presentCount == 0);
    CHECK(out.Contents().empty());
}

TEST_CASE("Only the resume code is written after a stop", "[tracepoint]") {
    CapturedOutput out{};
    REQUIRE(out.file != nullptr);

    SECTION("continuing from a single step clears the trace variable") {
        FixedPresenter presenter{PresentResult::Success(resume::ExitDecision::Resume)};
        auto result =
            HandleTracepoint(MakeRequest(shell::Dialect::Bash, "start", session::mode::Next{}), presenter, out.file);
        CHECK(result.type == TracepointResult::Type::Emitted);
        CHECK(presenter.presentCount == 1);
        CHECK(presenter.shownTracepoint == "start");
        CHECK(presenter.shownFrames == 1);
        CHECK(out.Contents() == "unset SHDBG_TRACEPOINT\n");
    }

    SECTION("continuing while tracing everything writes nothing") {
        FixedPresenter presenter{PresentResult::Success(resume::ExitDecision::Resume)};
        auto result =
            HandleTracepoint(MakeRequest(shell::Dialect::Fish, "start", session::mode::All{}), presenter, out.file);
        CHECK(result.type == TracepointResult::Type::Emitted);
        CHECK(presenter.presentCount == 1);
        CHECK(out.Contents().empty());
    }

    SECTION("exiting uses the configured exit code") {
        FixedPresenter presenter{PresentResult::Success(resume::ExitDecision::Terminate)};
        auto request = MakeRequest(shell::Dialect::Fish, "deploy", session::mode::Named{"deploy"});
        request.resumeOptions.terminateExitCode = 3;
        auto result = HandleTracepoint(request, presenter, out.file);
        CHECK(result.type == TracepointResult::Type::Emitted);
        CHECK(out.Contents() == "exit 3\n");
    }
}

TEST_CASE("The session shows the code each decision would produce", "[tracepoint]") {
    CapturedOutput out{};
    REQUIRE(out.file != nullptr);
    FixedPresenter presenter{PresentResult::Success(resume::ExitDecision::Resume)};

    auto request = MakeRequest(shell::Dialect::Fish, "start", session::mode::Next{});
    request.resumeOptions.terminateExitCode = 7;
    REQUIRE(HandleTracepoint(request, presenter, out.file));

    CHECK(presenter.shownOutput.onContinue == "set -e SHDBG_TRACEPOINT\n");
    CHECK(presenter.shownOutput.onExit == "exit 7\n");
}

TEST_CASE("Sessions without a decision write nothing", "[tracepoint]") {
    CapturedOutput out{};
    REQUIRE(out.file != nullptr);

    SECTION("no terminal") {
        FixedPresenter presenter{PresentResult::Unavailable("Cannot open /dev/tty")};
        auto result =
            HandleTracepoint(MakeRequest(shell::Dialect::Bash, "start", session::mode::All{}), presenter, out.file);
        CHECK_FALSE(result);
        CHECK(result.type == TracepointResult::Type::PresentFailed);
        CHECK(result.string() == "Cannot open /dev/tty");
    }

    SECTION("input closed") {
        FixedPresenter presenter{PresentResult::InputClosed()};
        auto result =
            HandleTracepoint(MakeRequest(shell::Dialect::Zsh, "start", session::mode::Next{}), presenter, out.file);
        CHECK_FALSE(result);
        CHECK(result.type == TracepointResult::Type::PresentFailed);
    }

    CHECK(out.Contents().empty());
}

} // namespace tracepoint_handler_tests
