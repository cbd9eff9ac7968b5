#pragma once

#include <shdbg/session/render_loop.hpp>

#include <optional>

namespace app::ui {

/// @brief Converts the result of `wget_wch` into an input event.
///
/// @param[in] status the return value of `wget_wch` (`OK` or `KEY_CODE_YES`)
/// @param[in] key the character or key code stored by `wget_wch`
/// @return the event, or `std::nullopt` for keys that cannot be expressed as a chord
std::optional<shdbg::session::InputEvent> TranslateKey(int status, unsigned int key);

/// @brief Adds the Alt modifier to a chord read right after an Esc byte.
shdbg::input::KeyChord WithAlt(shdbg::input::KeyChord chord);

} // namespace app::ui
