#pragma once

#include <app/ui/theme.hpp>
#include <app/ui/views/views.hpp>

#include <shdbg/input/key_bindings.hpp>
#include <shdbg/session/render_loop.hpp>
#include <shdbg/trace/source_cache.hpp>

#include <curses.h>

#include <cstdio>
#include <string>

namespace app::ui {

struct TerminalOpenResult {
    enum class Type { Success, DeviceUnavailable, NotATerminal, CursesInitFailed };

    Type type;
    std::string errorMessage;

    static TerminalOpenResult Success() {
        return {.type = Type::Success, .errorMessage = {}};
    }

    static TerminalOpenResult DeviceUnavailable(std::string_view device, int error);

    static TerminalOpenResult NotATerminal(std::string_view device);

    static TerminalOpenResult CursesInitFailed(std::string_view device);

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

/// @brief curses front end drawing on the controlling terminal.
///
/// Standard output carries the generated shell code, so the UI talks to the terminal device directly.
class Terminal final : public shdbg::session::Frontend {
public:
    Terminal(const shdbg::input::KeyBindings &bindings, const Theme &theme, OutputPreview output);
    ~Terminal() override;

    Terminal(const Terminal &) = delete;
    Terminal &operator=(const Terminal &) = delete;

    /// @brief Opens the terminal device and initializes curses on it.
    TerminalOpenResult Open(const char *device = "/dev/tty");

    /// @brief Restores the terminal. Safe to call more than once.
    void Close();

    bool IsOpen() const {
        return m_screen != nullptr;
    }

    void Draw(const shdbg::session::Session &session) override;
    shdbg::session::InputEvent ReadInput() override;

private:
    const shdbg::input::KeyBindings &m_bindings;
    Theme m_theme;
    Palette m_palette;
    OutputPreview m_output;
    shdbg::trace::SourceCache m_sources;

    std::FILE *m_device = nullptr;
    SCREEN *m_screen = nullptr;
};

} // namespace app::ui
