#include <shdbg/resume/resume_code.hpp>

#include <shdbg/util/dev_log.hpp>
#include <shdbg/util/unreachable.hpp>

#include <fmt/format.h>

namespace shdbg::resume {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // resume

    struct resume {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Resume";
    };

} // namespace grp

const char *GetExitDecisionName(ExitDecision decision) {
    switch (decision) {
    case ExitDecision::Resume: return "resume";
    case ExitDecision::Terminate: return "terminate";
    }
    return "unknown";
}

std::string UnsetVariableCommand(shell::Dialect dialect) {
    switch (dialect) {
    case shell::Dialect::Bash: [[fallthrough]];
    case shell::Dialect::Zsh: return fmt::format("unset {}\n", session::kTracepointVariable);
    case shell::Dialect::Fish: return fmt::format("set -e {}\n", session::kTracepointVariable);
    }
    util::unreachable();
}

ResumeCodeResult GenerateResumeCode(shell::Dialect dialect, ExitDecision decision, const session::StopDecision &stop,
                                    const ResumeOptions &options) {
    if (!stop.stop) {
        return ResumeCodeResult::NotStopped();
    }

    switch (decision) {
    case ExitDecision::Terminate:
        // `exit` takes the same form in every supported dialect
        if (options.terminateExitCode < 0 || options.terminateExitCode > 255) {
            return ResumeCodeResult::InvalidExitCode(options.terminateExitCode);
        }
        devlog::debug<grp::resume>("Terminating {} script with exit code {}", shell::GetDialectName(dialect),
                                   options.terminateExitCode);
        return ResumeCodeResult::Success(fmt::format("exit {}\n", options.terminateExitCode));
    case ExitDecision::Resume:
        switch (stop.transition) {
        case session::ModeTransition::Keep: return ResumeCodeResult::Success({});
        case session::ModeTransition::Clear:
            devlog::debug<grp::resume>("Disarming {} for the rest of the run", session::kTracepointVariable);
            return ResumeCodeResult::Success(UnsetVariableCommand(dialect));
        }
        break;
    }
    util::unreachable();
}

} // namespace shdbg::resume
