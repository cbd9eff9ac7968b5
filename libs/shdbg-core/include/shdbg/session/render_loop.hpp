#pragma once

/**
@file
@brief The synchronous draw/poll loop driving one debugger session.
*/

#include <shdbg/input/key_bindings.hpp>
#include <shdbg/input/key_chord.hpp>

#include <shdbg/session/reducer.hpp>
#include <shdbg/session/session.hpp>

#include <shdbg/resume/resume_code.hpp>

#include <optional>
#include <string>

namespace shdbg::session {

/// @brief An input event delivered by the front end.
struct InputEvent {
    enum class Type { Key, Resize, Closed };

    Type type = Type::Closed;
    input::KeyChord chord{};

    static InputEvent Key(const input::KeyChord &chord) {
        return {.type = Type::Key, .chord = chord};
    }

    static InputEvent Resize() {
        return {.type = Type::Resize, .chord = {}};
    }

    static InputEvent Closed() {
        return {.type = Type::Closed, .chord = {}};
    }
};

/// @brief Draws the session and delivers input. Implemented by the terminal UI and by tests.
class Frontend {
public:
    virtual ~Frontend() = default;

    /// @brief Redraws the whole UI for the current session state.
    virtual void Draw(const Session &session) = 0;

    /// @brief Blocks until the next input event arrives.
    virtual InputEvent ReadInput() = 0;
};

struct RunResult {
    enum class Type { Success, InputClosed };

    Type type;
    resume::ExitDecision decision = resume::ExitDecision::Resume;

    static RunResult Success(resume::ExitDecision decision) {
        return {.type = Type::Success, .decision = decision};
    }

    static RunResult InputClosed() {
        return {.type = Type::InputClosed, .decision = resume::ExitDecision::Resume};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

/// @brief Runs the session until the user decides to resume or terminate the script.
///
/// Each iteration draws the session, blocks on the next input event, routes key chords through the bindings and
/// applies the resulting event. Unbound keys and resize notifications only cause a redraw.
///
/// @param[in,out] session the session state
/// @param[in] bindings the key bindings; must have passed `KeyBindings::Validate`
/// @param[in] frontend the UI
RunResult RunSession(Session &session, const input::KeyBindings &bindings, Frontend &frontend);

} // namespace shdbg::session
