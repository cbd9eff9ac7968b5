#pragma once

/**
@file
@brief Semantic UI events produced by the key router and consumed by the reducer.
*/

#include <shdbg/core/types.hpp>

#include <variant>

namespace shdbg::session {

/// @brief Application-wide actions, available while no modal is presented.
enum class AppEvent : uint8 {
    ExitRequested,     ///< Ask to terminate the script (opens the confirmation modal)
    ContinueRequested, ///< Resume the script
    NextTab,
    PrevTab,
};

/// @brief Navigation inside the exit modal.
enum class NavEvent : uint8 { Up, Down, Left, Right, Select };

/// @brief Actions of the Trace screen.
enum class TraceEvent : uint8 { NextFrame, PrevFrame };

/// @brief Actions of the Vars screen.
enum class VarsEvent : uint8 {
    NextItem,
    PrevItem,
    FocusList,
    FocusDetail,
    RawDetail,
    SplitDetail,
};

using Event = std::variant<AppEvent, NavEvent, TraceEvent, VarsEvent>;

const char *GetEventName(const Event &event);

} // namespace shdbg::session
