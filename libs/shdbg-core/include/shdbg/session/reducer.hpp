#pragma once

/**
@file
@brief The session state machine.

| State                 | Event                      | Result                                          |
|-----------------------|----------------------------|-------------------------------------------------|
| None                  | App(ExitRequested)         | PresentModal{Cancel}                            |
| None                  | App(ContinueRequested)     | exit, resume                                    |
| None                  | App(NextTab/PrevTab)       | cycle screens                                   |
| None                  | Trace/Vars events          | move selection on the active screen             |
| PresentModal          | Nav(Left/Right)            | toggle Ok/Cancel                                |
| PresentModal          | Nav(Up/Down)               | nothing                                         |
| PresentModal{Ok}      | Nav(Select)                | None, exit, terminate                           |
| PresentModal{Cancel}  | Nav(Select)                | None                                            |

Every other combination leaves the session unchanged.
*/

#include <shdbg/session/events.hpp>
#include <shdbg/session/session.hpp>

#include <shdbg/resume/resume_code.hpp>

namespace shdbg::session {

/// @brief Outcome of applying one event.
struct Transition {
    bool exit = false;                                          ///< The debugger should exit
    resume::ExitDecision decision = resume::ExitDecision::Resume; ///< Valid when `exit` is set

    bool operator==(const Transition &) const = default;
};

/// @brief Applies an event to the session. Never fails; unhandled combinations are identity transitions.
Transition Reduce(Session &session, const Event &event);

} // namespace shdbg::session
