#include <shdbg/session/reducer.hpp>

#include <shdbg/util/dev_log.hpp>

#include <algorithm>

namespace shdbg::session {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // reducer

    struct reducer {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Reducer";
    };

} // namespace grp

namespace {

    constexpr Transition kStay{.exit = false, .decision = resume::ExitDecision::Resume};

    size_t StepUp(size_t index) {
        return index > 0 ? index - 1 : 0;
    }

    size_t StepDown(size_t index, size_t count) {
        return count == 0 ? 0 : std::min(index + 1, count - 1);
    }

    Transition ReduceModal(Session &session, exit_state::PresentModal &modal, const Event &event) {
        const auto *nav = std::get_if<NavEvent>(&event);
        if (nav == nullptr) {
            return kStay;
        }

        switch (*nav) {
        case NavEvent::Left: [[fallthrough]];
        case NavEvent::Right:
            modal.highlighted = modal.highlighted == ExitOption::Ok ? ExitOption::Cancel : ExitOption::Ok;
            return kStay;
        case NavEvent::Up: [[fallthrough]];
        case NavEvent::Down: return kStay;
        case NavEvent::Select:
            if (modal.highlighted == ExitOption::Ok) {
                session.exitState = exit_state::None{};
                devlog::info<grp::reducer>("Termination confirmed at tracepoint '{}'", session.tracepoint);
                return {.exit = true, .decision = resume::ExitDecision::Terminate};
            }
            session.exitState = exit_state::None{};
            return kStay;
        }
        return kStay;
    }

    Transition ReduceApp(Session &session, AppEvent event) {
        switch (event) {
        case AppEvent::ExitRequested:
            session.exitState = exit_state::PresentModal{.highlighted = ExitOption::Cancel};
            return kStay;
        case AppEvent::ContinueRequested:
            devlog::info<grp::reducer>("Continuing from tracepoint '{}'", session.tracepoint);
            return {.exit = true, .decision = resume::ExitDecision::Resume};
        case AppEvent::NextTab: session.screen = NextTab(session.screen); return kStay;
        case AppEvent::PrevTab: session.screen = PrevTab(session.screen); return kStay;
        }
        return kStay;
    }

    void ReduceTrace(Session &session, TraceEvent event) {
        if (session.screen != Screen::Trace) {
            return;
        }
        auto &view = session.traceView;
        switch (event) {
        case TraceEvent::NextFrame: view.selectedFrame = StepDown(view.selectedFrame, session.callStack.size()); break;
        case TraceEvent::PrevFrame: view.selectedFrame = StepUp(view.selectedFrame); break;
        }
    }

    void ReduceVars(Session &session, VarsEvent event) {
        if (session.screen != Screen::Vars) {
            return;
        }
        auto &view = session.varsView;
        const auto &vars = session.environment.Variables();

        auto splitCount = [&]() -> size_t {
            if (view.selectedVar >= vars.size()) {
                return 0;
            }
            return env::SplitValue(vars[view.selectedVar].value).size();
        };

        switch (event) {
        case VarsEvent::NextItem:
            if (view.focus == VarsView::Focus::List) {
                view.selectedVar = StepDown(view.selectedVar, vars.size());
                view.selectedItem = 0;
            } else if (view.detail == VarsView::Detail::Split) {
                view.selectedItem = StepDown(view.selectedItem, splitCount());
            }
            break;
        case VarsEvent::PrevItem:
            if (view.focus == VarsView::Focus::List) {
                view.selectedVar = StepUp(view.selectedVar);
                view.selectedItem = 0;
            } else if (view.detail == VarsView::Detail::Split) {
                view.selectedItem = StepUp(view.selectedItem);
            }
            break;
        case VarsEvent::FocusList: view.focus = VarsView::Focus::List; break;
        case VarsEvent::FocusDetail: view.focus = VarsView::Focus::Detail; break;
        case VarsEvent::RawDetail: view.detail = VarsView::Detail::Raw; break;
        case VarsEvent::SplitDetail:
            view.detail = VarsView::Detail::Split;
            view.selectedItem = 0;
            break;
        }
    }

} // namespace

Transition Reduce(Session &session, const Event &event) {
    devlog::trace<grp::reducer>("Reducing {} on {}", GetEventName(event), GetScreenName(session.screen));

    // The modal owns all input while it is shown
    if (auto *modal = std::get_if<exit_state::PresentModal>(&session.exitState)) {
        return ReduceModal(session, *modal, event);
    }

    if (const auto *app = std::get_if<AppEvent>(&event)) {
        return ReduceApp(session, *app);
    }
    if (const auto *trace = std::get_if<TraceEvent>(&event)) {
        ReduceTrace(session, *trace);
    } else if (const auto *vars = std::get_if<VarsEvent>(&event)) {
        ReduceVars(session, *vars);
    }
    return kStay;
}

} // namespace shdbg::session
