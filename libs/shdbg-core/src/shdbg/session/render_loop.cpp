#include <shdbg/session/render_loop.hpp>

#include <shdbg/util/dev_log.hpp>

namespace shdbg::session {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // loop

    struct loop {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Loop";
    };

} // namespace grp

std::string RunResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::InputClosed: return "Terminal input was closed before a decision was made";
    }
    return "Unknown";
}

RunResult RunSession(Session &session, const input::KeyBindings &bindings, Frontend &frontend) {
    devlog::debug<grp::loop>("Entering session loop at tracepoint '{}' with {} frames", session.tracepoint,
                             session.callStack.size());

    while (true) {
        frontend.Draw(session);

        const InputEvent input = frontend.ReadInput();
        switch (input.type) {
        case InputEvent::Type::Closed:
            devlog::error<grp::loop>("Input closed while suspended at tracepoint '{}'", session.tracepoint);
            return RunResult::InputClosed();
        case InputEvent::Type::Resize: continue;
        case InputEvent::Type::Key: break;
        }

        const auto event = input::Route(bindings, session.screen, session.exitState, input.chord);
        if (!event) {
            continue;
        }

        const Transition transition = Reduce(session, *event);
        if (transition.exit) {
            devlog::debug<grp::loop>("Leaving session loop: {}", resume::GetExitDecisionName(transition.decision));
            return RunResult::Success(transition.decision);
        }
    }
}

} // namespace shdbg::session
