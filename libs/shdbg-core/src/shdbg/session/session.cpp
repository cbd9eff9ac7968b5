#include <shdbg/session/events.hpp>
#include <shdbg/session/session.hpp>

#include <shdbg/util/unreachable.hpp>

namespace shdbg::session {

const char *GetScreenName(Screen screen) {
    switch (screen) {
    case Screen::Home: return "Home";
    case Screen::Vars: return "Vars";
    case Screen::Trace: return "Trace";
    case Screen::Output: return "Output";
    }
    util::unreachable();
}

size_t GetTabIndex(Screen screen) {
    return static_cast<size_t>(screen);
}

Screen NextTab(Screen screen) {
    return kAllScreens[(GetTabIndex(screen) + 1) % kAllScreens.size()];
}

Screen PrevTab(Screen screen) {
    return kAllScreens[(GetTabIndex(screen) + kAllScreens.size() - 1) % kAllScreens.size()];
}

const char *GetEventName(const Event &event) {
    struct Visitor {
        const char *operator()(AppEvent event) const {
            switch (event) {
            case AppEvent::ExitRequested: return "App(ExitRequested)";
            case AppEvent::ContinueRequested: return "App(ContinueRequested)";
            case AppEvent::NextTab: return "App(NextTab)";
            case AppEvent::PrevTab: return "App(PrevTab)";
            }
            return "App(?)";
        }
        const char *operator()(NavEvent event) const {
            switch (event) {
            case NavEvent::Up: return "Nav(Up)";
            case NavEvent::Down: return "Nav(Down)";
            case NavEvent::Left: return "Nav(Left)";
            case NavEvent::Right: return "Nav(Right)";
            case NavEvent::Select: return "Nav(Select)";
            }
            return "Nav(?)";
        }
        const char *operator()(TraceEvent event) const {
            switch (event) {
            case TraceEvent::NextFrame: return "Trace(NextFrame)";
            case TraceEvent::PrevFrame: return "Trace(PrevFrame)";
            }
            return "Trace(?)";
        }
        const char *operator()(VarsEvent event) const {
            switch (event) {
            case VarsEvent::NextItem: return "Vars(NextItem)";
            case VarsEvent::PrevItem: return "Vars(PrevItem)";
            case VarsEvent::FocusList: return "Vars(FocusList)";
            case VarsEvent::FocusDetail: return "Vars(FocusDetail)";
            case VarsEvent::RawDetail: return "Vars(RawDetail)";
            case VarsEvent::SplitDetail: return "Vars(SplitDetail)";
            }
            return "Vars(?)";
        }
    };
    return std::visit(Visitor{}, event);
}

} // namespace shdbg::session
