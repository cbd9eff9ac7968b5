#include "app.hpp"

#include "tracepoint_handler.hpp"
#include "ui/terminal.hpp"

#include <shdbg/session/render_loop.hpp>
#include <shdbg/session/trace_mode.hpp>

#include <shdbg/util/dev_log.hpp>
#include <shdbg/util/scope_guard.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <utility>

using namespace shdbg;

namespace app {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "App";
    };

} // namespace grp

// Fatal errors are reported directly so that they show up regardless of the log configuration.
template <typename... TArgs>
static void ReportError(fmt::format_string<TArgs...> fmtStr, TArgs &&...args) {
    fmt::print(stderr, "shdbg: {}\n", fmt::format(fmtStr, std::forward<TArgs>(args)...));
}

App::App() {
    m_logSink.Install();
}

namespace {

    // Presents the session on the controlling terminal. Log output is held back while curses owns the screen.
    class TerminalPresenter final : public SessionPresenter {
    public:
        TerminalPresenter(const Settings &settings, LogSink &logSink)
            : m_settings(settings)
            , m_logSink(logSink) {}

        PresentResult Present(session::Session &state, ui::OutputPreview output) override {
            ui::Terminal terminal{m_settings.keyBindings, m_settings.theme, std::move(output)};
            if (auto openResult = terminal.Open(); !openResult) {
                return PresentResult::Unavailable(openResult.string());
            }

            m_logSink.SetHoldBack(true);
            util::ScopeGuard restoreTerminal{[&] {
                terminal.Close();
                m_logSink.SetHoldBack(false);
            }};

            auto runResult = session::RunSession(state, m_settings.keyBindings, terminal);
            if (!runResult) {
                return PresentResult::InputClosed();
            }
            return PresentResult::Success(runResult.decision);
        }

    private:
        const Settings &m_settings;
        LogSink &m_logSink;
    };

} // namespace

int App::Run(const CommandLineOptions &options) {
    m_options = options;

    if (!LoadSettings()) {
        return exit_status::kConfigError;
    }
    ConfigureLogging();

    const TracepointRequest request{
        .dialect = m_options.dialect,
        .tracepoint = m_options.tracepoint,
        .callStack = m_options.callStack,
        .mode = session::ReadTraceModeFromEnvironment(),
        .resumeOptions = {.terminateExitCode = m_settings.session.terminateExitCode},
    };
    TerminalPresenter presenter{m_settings, m_logSink};

    auto result = HandleTracepoint(request, presenter, stdout);
    if (!result) {
        ReportError("{}", result.string());
        return exit_status::kFatal;
    }
    return exit_status::kSuccess;
}

bool App::LoadSettings() {
    std::filesystem::path path = m_options.configPath;
    if (path.empty()) {
        path = DefaultSettingsPath();
    }
    if (path.empty()) {
        devlog::debug<grp::base>("No settings location available; using defaults");
        return true;
    }

    auto result = m_settings.Load(path);
    if (!result) {
        ReportError("{}: {}", path.string(), result.string());
        return false;
    }
    return true;
}

void App::ConfigureLogging() {
    devlog::SetMinLevel(m_settings.logging.level);

    const auto &file = m_settings.logging.file;
    if (!file.empty() && !m_logSink.OpenFile(file)) {
        devlog::warn<grp::base>("Could not open log file {}; logging to standard error", file.string());
    }
}

} // namespace app
