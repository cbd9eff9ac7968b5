#pragma once

/**
@file
@brief State of one debugger invocation.
*/

#include <shdbg/session/trace_mode.hpp>

#include <shdbg/env/environment.hpp>
#include <shdbg/shell/dialect.hpp>
#include <shdbg/trace/frame.hpp>

#include <shdbg/core/types.hpp>

#include <array>
#include <string>
#include <variant>

namespace shdbg::session {

/// @brief Top-level views, in tab order.
enum class Screen : uint8 { Home, Vars, Trace, Output };

inline constexpr std::array<Screen, 4> kAllScreens = {Screen::Home, Screen::Vars, Screen::Trace, Screen::Output};

const char *GetScreenName(Screen screen);

/// @brief Returns the position of the screen in the tab bar.
size_t GetTabIndex(Screen screen);

Screen NextTab(Screen screen);
Screen PrevTab(Screen screen);

enum class ExitOption : uint8 { Ok, Cancel };

namespace exit_state {

    struct None {
        bool operator==(const None &) const = default;
    };

    /// @brief The exit confirmation modal is shown and owns all navigation input.
    struct PresentModal {
        ExitOption highlighted = ExitOption::Cancel;
        bool operator==(const PresentModal &) const = default;
    };

} // namespace exit_state

using ExitState = std::variant<exit_state::None, exit_state::PresentModal>;

inline bool IsPresentingModal(const ExitState &state) {
    return std::holds_alternative<exit_state::PresentModal>(state);
}

/// @brief View state of the Trace screen.
struct TraceView {
    size_t selectedFrame = 0;
};

/// @brief View state of the Vars screen.
struct VarsView {
    enum class Focus : uint8 { List, Detail };
    enum class Detail : uint8 { Raw, Split };

    size_t selectedVar = 0;
    size_t selectedItem = 0; ///< Selected segment in the split detail view
    Focus focus = Focus::List;
    Detail detail = Detail::Raw;
};

/// @brief Everything the UI knows about the current tracepoint hit.
///
/// Created once when the debugger starts and mutated only by `Reduce`.
struct Session {
    Screen screen = Screen::Home;
    ExitState exitState = exit_state::None{};

    shell::Dialect dialect = shell::Dialect::Bash;
    std::string tracepoint;
    trace::CallStack callStack;
    TraceMode mode{};
    StopDecision stop;
    env::Environment environment;

    TraceView traceView;
    VarsView varsView;
};

} // namespace shdbg::session
