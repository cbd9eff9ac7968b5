#include "key_translator.hpp"

#include <curses.h>

using namespace shdbg;
using namespace shdbg::input;
using session::InputEvent;

namespace app::ui {

inline constexpr unsigned int kEsc = 27;
inline constexpr unsigned int kDel = 127;

static std::optional<InputEvent> TranslateKeyCode(unsigned int key) {
    switch (key) {
    case KEY_RESIZE: return InputEvent::Resize();
    case KEY_UP: return InputEvent::Key(KeyChord::Key(KeyCode::Up));
    case KEY_DOWN: return InputEvent::Key(KeyChord::Key(KeyCode::Down));
    case KEY_LEFT: return InputEvent::Key(KeyChord::Key(KeyCode::Left));
    case KEY_RIGHT: return InputEvent::Key(KeyChord::Key(KeyCode::Right));
    case KEY_SLEFT: return InputEvent::Key(KeyChord::Key(KeyCode::Left, mod::Shift));
    case KEY_SRIGHT: return InputEvent::Key(KeyChord::Key(KeyCode::Right, mod::Shift));
    case KEY_SR: return InputEvent::Key(KeyChord::Key(KeyCode::Up, mod::Shift));
    case KEY_SF: return InputEvent::Key(KeyChord::Key(KeyCode::Down, mod::Shift));
    case KEY_BTAB: return InputEvent::Key(KeyChord::Key(KeyCode::BackTab));
    case KEY_HOME: return InputEvent::Key(KeyChord::Key(KeyCode::Home));
    case KEY_END: return InputEvent::Key(KeyChord::Key(KeyCode::End));
    case KEY_PPAGE: return InputEvent::Key(KeyChord::Key(KeyCode::PageUp));
    case KEY_NPAGE: return InputEvent::Key(KeyChord::Key(KeyCode::PageDown));
    case KEY_DC: return InputEvent::Key(KeyChord::Key(KeyCode::Delete));
    case KEY_IC: return InputEvent::Key(KeyChord::Key(KeyCode::Insert));
    case KEY_BACKSPACE: return InputEvent::Key(KeyChord::Key(KeyCode::Backspace));
    case KEY_ENTER: return InputEvent::Key(KeyChord::Key(KeyCode::Enter));
    default: break;
    }

    for (uint8 number = 1; number <= 12; ++number) {
        if (key == static_cast<unsigned int>(KEY_F(number))) {
            return InputEvent::Key(KeyChord::Fn(number));
        }
    }
    return std::nullopt;
}

static std::optional<InputEvent> TranslateChar(unsigned int key) {
    switch (key) {
    case '\t': return InputEvent::Key(KeyChord::Key(KeyCode::Tab));
    case '\n': [[fallthrough]];
    case '\r': return InputEvent::Key(KeyChord::Key(KeyCode::Enter));
    case '\b': [[fallthrough]];
    case kDel: return InputEvent::Key(KeyChord::Key(KeyCode::Backspace));
    case kEsc: return InputEvent::Key(KeyChord::Key(KeyCode::Esc));
    case ' ': return InputEvent::Key(KeyChord::Key(KeyCode::Space));
    default: break;
    }

    // Ctrl+A .. Ctrl+Z arrive as control codes 1..26
    if (key >= 1 && key <= 26) {
        return InputEvent::Key(KeyChord::Char(static_cast<char>('a' + key - 1), mod::Ctrl));
    }
    if (key > ' ' && key < kDel) {
        return InputEvent::Key(KeyChord::Char(static_cast<char>(key)));
    }
    return std::nullopt;
}

std::optional<InputEvent> TranslateKey(int status, unsigned int key) {
    if (status == KEY_CODE_YES) {
        return TranslateKeyCode(key);
    }
    if (status == OK) {
        return TranslateChar(key);
    }
    return std::nullopt;
}

KeyChord WithAlt(KeyChord chord) {
    if (chord.code == KeyCode::Char) {
        const bool upper = chord.ch >= 'A' && chord.ch <= 'Z';
        if (upper) {
            chord.ch = static_cast<char>(chord.ch - 'A' + 'a');
            chord.modifiers |= mod::Shift;
        }
    }
    chord.modifiers |= mod::Alt;
    return chord;
}

} // namespace app::ui
