#include <shdbg/input/key_bindings.hpp>

#include <shdbg/util/dev_log.hpp>

#include <fmt/format.h>

namespace shdbg::input {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // input

    struct input {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Input";
    };

} // namespace grp

using namespace session;

DuplicateKeyBindingError::DuplicateKeyBindingError(const KeyChord &chord, const Event &existing, const Event &added)
    : std::logic_error(fmt::format("Key {} is bound to both {} and {}", ToString(chord), GetEventName(existing),
                                   GetEventName(added)))
    , m_chord(chord) {}

void KeyMap::Insert(const KeyChord &chord, Event event) {
    auto [it, inserted] = m_map.try_emplace(chord, event);
    if (!inserted) {
        throw DuplicateKeyBindingError(chord, it->second, event);
    }
}

std::optional<Event> KeyMap::Lookup(const KeyChord &chord) const {
    if (auto it = m_map.find(chord); it != m_map.end()) {
        return it->second;
    }
    return std::nullopt;
}

KeyMap KeyBindings::CurrentKeymap(Screen screen, const ExitState &exitState) const {
    KeyMap keymap{};

    if (IsPresentingModal(exitState)) {
        keymap.Insert(kModalLeft, NavEvent::Left);
        keymap.Insert(kModalRight, NavEvent::Right);
        keymap.Insert(kModalSelect, NavEvent::Select);
        return keymap;
    }

    keymap.Insert(global.exit, AppEvent::ExitRequested);
    keymap.Insert(global.cont, AppEvent::ContinueRequested);
    keymap.Insert(global.nextTab, AppEvent::NextTab);
    keymap.Insert(global.prevTab, AppEvent::PrevTab);

    switch (screen) {
    case Screen::Home: break;
    case Screen::Vars:
        keymap.Insert(vars.nextItem, VarsEvent::NextItem);
        keymap.Insert(vars.prevItem, VarsEvent::PrevItem);
        keymap.Insert(vars.focusList, VarsEvent::FocusList);
        keymap.Insert(vars.focusDetail, VarsEvent::FocusDetail);
        keymap.Insert(vars.rawDetail, VarsEvent::RawDetail);
        keymap.Insert(vars.splitDetail, VarsEvent::SplitDetail);
        break;
    case Screen::Trace:
        keymap.Insert(trace.nextFrame, TraceEvent::NextFrame);
        keymap.Insert(trace.prevFrame, TraceEvent::PrevFrame);
        break;
    case Screen::Output: break;
    }
    return keymap;
}

std::vector<KeyHint> KeyBindings::Hints(Screen screen, const ExitState &exitState) const {
    if (IsPresentingModal(exitState)) {
        return {
            {fmt::format("{}{}", ToDisplayString(kModalLeft), ToDisplayString(kModalRight)), "Choose"},
            {ToDisplayString(kModalSelect), "Confirm"},
        };
    }

    std::vector<KeyHint> hints{
        {ToDisplayString(global.cont), "Continue"},
        {ToDisplayString(global.exit), "Terminate"},
        {ToDisplayString(global.nextTab), "Next Tab"},
        {ToDisplayString(global.prevTab), "Prev Tab"},
    };
    switch (screen) {
    case Screen::Home: break;
    case Screen::Vars:
        hints.push_back({fmt::format("{}{}{}{}", ToDisplayString(vars.prevItem), ToDisplayString(vars.nextItem),
                                     ToDisplayString(vars.focusList), ToDisplayString(vars.focusDetail)),
                         "Nav"});
        hints.push_back({ToDisplayString(vars.rawDetail), "Raw"});
        hints.push_back({ToDisplayString(vars.splitDetail), "Split"});
        break;
    case Screen::Trace:
        hints.push_back(
            {fmt::format("{}{}", ToDisplayString(trace.prevFrame), ToDisplayString(trace.nextFrame)), "Frames"});
        break;
    case Screen::Output: break;
    }
    return hints;
}

void KeyBindings::Validate() const {
    for (Screen screen : kAllScreens) {
        (void)CurrentKeymap(screen, exit_state::None{});
    }
    (void)CurrentKeymap(Screen::Home, exit_state::PresentModal{});
}

std::optional<Event> Route(const KeyBindings &bindings, Screen screen, const ExitState &exitState,
                           const KeyChord &chord) {
    auto event = bindings.CurrentKeymap(screen, exitState).Lookup(chord);
    if (event) {
        devlog::trace<grp::input>("{} on {} -> {}", ToString(chord), GetScreenName(screen), GetEventName(*event));
    } else {
        devlog::trace<grp::input>("{} on {} is unbound", ToString(chord), GetScreenName(screen));
    }
    return event;
}

} // namespace shdbg::input
