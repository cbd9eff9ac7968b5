#pragma once

/**
@file
@brief Key bindings and the router that turns key chords into semantic events.
*/

#include <shdbg/input/key_chord.hpp>

#include <shdbg/session/events.hpp>
#include <shdbg/session/session.hpp>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace shdbg::input {

/// @brief Thrown when a chord is bound twice within the same keymap.
class DuplicateKeyBindingError : public std::logic_error {
public:
    DuplicateKeyBindingError(const KeyChord &chord, const session::Event &existing, const session::Event &added);

    const KeyChord &Chord() const {
        return m_chord;
    }

private:
    KeyChord m_chord;
};

/// @brief Chord-to-event table for one combination of screen and exit state.
class KeyMap {
public:
    /// @brief Binds a chord to an event.
    ///
    /// Several chords may lead to the same event, but a chord may only be bound once.
    ///
    /// @throws DuplicateKeyBindingError if the chord is already bound
    void Insert(const KeyChord &chord, session::Event event);

    std::optional<session::Event> Lookup(const KeyChord &chord) const;

    bool Contains(const KeyChord &chord) const {
        return m_map.contains(chord);
    }

    size_t Size() const {
        return m_map.size();
    }

private:
    std::map<KeyChord, session::Event> m_map;
};

/// @brief Bindings available on every screen while no modal is shown.
struct GlobalKeyBindings {
    KeyChord exit = KeyChord::Char('q');
    KeyChord cont = KeyChord::Char('c');
    KeyChord nextTab = KeyChord::Key(KeyCode::Tab);
    KeyChord prevTab = KeyChord::Key(KeyCode::BackTab);
};

struct TraceKeyBindings {
    KeyChord nextFrame = KeyChord::Key(KeyCode::Down);
    KeyChord prevFrame = KeyChord::Key(KeyCode::Up);
};

struct VarsKeyBindings {
    KeyChord nextItem = KeyChord::Key(KeyCode::Down);
    KeyChord prevItem = KeyChord::Key(KeyCode::Up);
    KeyChord focusList = KeyChord::Key(KeyCode::Left);
    KeyChord focusDetail = KeyChord::Key(KeyCode::Right);
    KeyChord rawDetail = KeyChord::Char('r');
    KeyChord splitDetail = KeyChord::Char('s');
};

/// @brief Fixed modal navigation keys. The modal is a focus trap and cannot be remapped.
inline constexpr KeyChord kModalLeft = KeyChord::Key(KeyCode::Left);
inline constexpr KeyChord kModalRight = KeyChord::Key(KeyCode::Right);
inline constexpr KeyChord kModalSelect = KeyChord::Key(KeyCode::Enter);

/// @brief A key hint shown in the footer.
struct KeyHint {
    std::string keys;
    std::string_view description;

    bool operator==(const KeyHint &) const = default;
};

/// @brief The complete set of configured key bindings.
struct KeyBindings {
    GlobalKeyBindings global;
    TraceKeyBindings trace;
    VarsKeyBindings vars;

    /// @brief Builds the keymap that applies to the given screen and exit state.
    ///
    /// While the exit modal is presented only the modal navigation keys are mapped. Otherwise the global bindings
    /// and the bindings of the active screen apply, and no navigation events can be produced.
    ///
    /// @throws DuplicateKeyBindingError if two bindings in the same scope share a chord
    KeyMap CurrentKeymap(session::Screen screen, const session::ExitState &exitState) const;

    /// @brief Returns the hints for the footer in display order.
    std::vector<KeyHint> Hints(session::Screen screen, const session::ExitState &exitState) const;

    /// @brief Builds every keymap once so that conflicting bindings are reported up front.
    /// @throws DuplicateKeyBindingError on the first conflict
    void Validate() const;
};

/// @brief Maps a chord to an event given the current state. Returns `std::nullopt` for unbound chords.
std::optional<session::Event> Route(const KeyBindings &bindings, session::Screen screen,
                                    const session::ExitState &exitState, const KeyChord &chord);

} // namespace shdbg::input
