#include <catch2/catch_test_macros.hpp>

#include <shdbg/input/key_bindings.hpp>

#include <string>
#include <vector>

using namespace shdbg;
using namespace shdbg::input;
using namespace shdbg::session;

namespace key_bindings_tests {

const ExitState kNoModal = exit_state::None{};
const ExitState kModal = exit_state::PresentModal{};

// Every chord the default bindings and the modal know about, plus a few unbound ones.
const std::vector<KeyChord> kProbeChords = {
    KeyChord::Char('q'),           KeyChord::Char('c'),           KeyChord::Char('r'),
    KeyChord::Char('s'),           KeyChord::Char('x'),           KeyChord::Char('Q'),
    KeyChord::Key(KeyCode::Tab),   KeyChord::Key(KeyCode::BackTab), KeyChord::Key(KeyCode::Up),
    KeyChord::Key(KeyCode::Down),  KeyChord::Key(KeyCode::Left),  KeyChord::Key(KeyCode::Right),
    KeyChord::Key(KeyCode::Enter), KeyChord::Key(KeyCode::Esc),   KeyChord::Fn(1),
};

TEST_CASE("Global bindings apply on every screen", "[input][key-bindings]") {
    const KeyBindings bindings{};

    for (Screen screen : kAllScreens) {
        CAPTURE(GetScreenName(screen));
        CHECK(Route(bindings, screen, kNoModal, KeyChord::Char('q')) == Event{AppEvent::ExitRequested});
        CHECK(Route(bindings, screen, kNoModal, KeyChord::Char('c')) == Event{AppEvent::ContinueRequested});
        CHECK(Route(bindings, screen, kNoModal, KeyChord::Key(KeyCode::Tab)) == Event{AppEvent::NextTab});
        CHECK(Route(bindings, screen, kNoModal, KeyChord::Key(KeyCode::BackTab)) == Event{AppEvent::PrevTab});
    }
}

TEST_CASE("Screen bindings apply only on their screen", "[input][key-bindings]") {
    const KeyBindings bindings{};
    const KeyChord down = KeyChord::Key(KeyCode::Down);

    CHECK(Route(bindings, Screen::Trace, kNoModal, down) == Event{TraceEvent::NextFrame});
    CHECK(Route(bindings, Screen::Trace, kNoModal, KeyChord::Key(KeyCode::Up)) == Event{TraceEvent::PrevFrame});
    CHECK(Route(bindings, Screen::Vars, kNoModal, down) == Event{VarsEvent::NextItem});
    CHECK(Route(bindings, Screen::Vars, kNoModal, KeyChord::Key(KeyCode::Left)) == Event{VarsEvent::FocusList});
    CHECK(Route(bindings, Screen::Vars, kNoModal, KeyChord::Key(KeyCode::Right)) == Event{VarsEvent::FocusDetail});
    CHECK(Route(bindings, Screen::Vars, kNoModal, KeyChord::Char('r')) == Event{VarsEvent::RawDetail});
    CHECK(Route(bindings, Screen::Vars, kNoModal, KeyChord::Char('s')) == Event{VarsEvent::SplitDetail});

    CHECK_FALSE(Route(bindings, Screen::Home, kNoModal, down).has_value());
    CHECK_FALSE(Route(bindings, Screen::Output, kNoModal, down).has_value());
    CHECK_FALSE(Route(bindings, Screen::Trace, kNoModal, KeyChord::Char('r')).has_value());
}

TEST_CASE("The exit modal traps all input", "[input][key-bindings]") {
    const KeyBindings bindings{};

    for (Screen screen : kAllScreens) {
        CAPTURE(GetScreenName(screen));
        CHECK(Route(bindings, screen, kModal, KeyChord::Key(KeyCode::Left)) == Event{NavEvent::Left});
        CHECK(Route(bindings, screen, kModal, KeyChord::Key(KeyCode::Right)) == Event{NavEvent::Right});
        CHECK(Route(bindings, screen, kModal, KeyChord::Key(KeyCode::Enter)) == Event{NavEvent::Select});

        for (const auto &chord : kProbeChords) {
            CAPTURE(ToString(chord));
            auto event = Route(bindings, screen, kModal, chord);
            if (event) {
                CHECK(std::holds_alternative<NavEvent>(*event));
            }
        }
    }
}

TEST_CASE("Navigation events are never produced outside the modal", "[input][key-bindings]") {
    const KeyBindings bindings{};

    for (Screen screen : kAllScreens) {
        for (const auto &chord : kProbeChords) {
            CAPTURE(GetScreenName(screen), ToString(chord));
            auto event = Route(bindings, screen, kNoModal, chord);
            if (event) {
                CHECK_FALSE(std::holds_alternative<NavEvent>(*event));
            }
        }
    }
}

TEST_CASE("Rebound keys replace the defaults", "[input][key-bindings]") {
    KeyBindings bindings{};
    bindings.global.exit = KeyChord::Char('x');
    bindings.trace.nextFrame = KeyChord::Char('j');
    REQUIRE_NOTHROW(bindings.Validate());

    CHECK(Route(bindings, Screen::Home, kNoModal, KeyChord::Char('x')) == Event{AppEvent::ExitRequested});
    CHECK_FALSE(Route(bindings, Screen::Home, kNoModal, KeyChord::Char('q')).has_value());
    CHECK(Route(bindings, Screen::Trace, kNoModal, KeyChord::Char('j')) == Event{TraceEvent::NextFrame});
    CHECK_FALSE(Route(bindings, Screen::Trace, kNoModal, KeyChord::Key(KeyCode::Down)).has_value());

    // The same chord may be reused on different screens
    bindings.vars.nextItem = KeyChord::Char('j');
    CHECK_NOTHROW(bindings.Validate());
}

TEST_CASE("Conflicting bindings are reported", "[input][key-bindings]") {
    KeyBindings bindings{};
    bindings.trace.nextFrame = KeyChord::Char('q');

    CHECK_THROWS_AS(bindings.Validate(), DuplicateKeyBindingError);
    CHECK_THROWS_AS(bindings.CurrentKeymap(Screen::Trace, kNoModal), DuplicateKeyBindingError);
    CHECK_NOTHROW(bindings.CurrentKeymap(Screen::Home, kNoModal));

    try {
        bindings.Validate();
        FAIL("expected a conflict");
    } catch (const DuplicateKeyBindingError &error) {
        CHECK(error.Chord() == KeyChord::Char('q'));
        CHECK(std::string{error.what()} == "Key Q is bound to both App(ExitRequested) and Trace(NextFrame)");
    }
}

TEST_CASE("Keymaps reject duplicate chords", "[input][key-bindings]") {
    KeyMap keymap{};
    keymap.Insert(KeyChord::Char('a'), AppEvent::NextTab);
    keymap.Insert(KeyChord::Char('b'), AppEvent::NextTab);

    CHECK(keymap.Size() == 2);
    CHECK(keymap.Contains(KeyChord::Char('a')));
    CHECK_THROWS_AS(keymap.Insert(KeyChord::Char('a'), AppEvent::PrevTab), DuplicateKeyBindingError);
    CHECK(keymap.Lookup(KeyChord::Char('a')) == Event{AppEvent::NextTab});
}

TEST_CASE("Footer hints follow the active screen", "[input][key-bindings]") {
    const KeyBindings bindings{};

    auto home = bindings.Hints(Screen::Home, kNoModal);
    REQUIRE(home.size() == 4);
    CHECK(home[0] == KeyHint{"C", "Continue"});
    CHECK(home[1] == KeyHint{"Q", "Terminate"});
    CHECK(home[2] == KeyHint{"Tab", "Next Tab"});
    CHECK(home[3] == KeyHint{"⇧+Tab", "Prev Tab"});

    auto trace = bindings.Hints(Screen::Trace, kNoModal);
    REQUIRE(trace.size() == 5);
    CHECK(trace[4] == KeyHint{"↑↓", "Frames"});

    auto vars = bindings.Hints(Screen::Vars, kNoModal);
    CHECK(vars.size() == 7);

    auto modal = bindings.Hints(Screen::Vars, kModal);
    REQUIRE(modal.size() == 2);
    CHECK(modal[0] == KeyHint{"←→", "Choose"});
    CHECK(modal[1] == KeyHint{"Enter", "Confirm"});
}

} // namespace key_bindings_tests
