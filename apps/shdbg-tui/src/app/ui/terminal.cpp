#include "terminal.hpp"

#include "key_translator.hpp"

#include <shdbg/util/dev_log.hpp>
#include <shdbg/util/scope_guard.hpp>

#include <fmt/format.h>

#include <curses.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

using namespace shdbg;
using session::InputEvent;

namespace app::ui {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // terminal

    struct terminal {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Terminal";
    };

} // namespace grp

// Milliseconds to wait for the rest of an escape sequence
inline constexpr int kEscDelay = 25;

TerminalOpenResult TerminalOpenResult::DeviceUnavailable(std::string_view device, int error) {
    return {.type = Type::DeviceUnavailable, .errorMessage = fmt::format("{}: {}", device, std::strerror(error))};
}

TerminalOpenResult TerminalOpenResult::NotATerminal(std::string_view device) {
    return {.type = Type::NotATerminal, .errorMessage = fmt::format("{} is not a terminal", device)};
}

TerminalOpenResult TerminalOpenResult::CursesInitFailed(std::string_view device) {
    return {.type = Type::CursesInitFailed,
            .errorMessage = fmt::format("could not initialize curses on {}; check TERM", device)};
}

std::string TerminalOpenResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::DeviceUnavailable: return fmt::format("Cannot open the terminal: {}", errorMessage);
    case Type::NotATerminal: return fmt::format("No interactive terminal: {}", errorMessage);
    case Type::CursesInitFailed: return fmt::format("Terminal setup failed: {}", errorMessage);
    }
    return "Unknown error";
}

Terminal::Terminal(const input::KeyBindings &bindings, const Theme &theme, OutputPreview output)
    : m_bindings(bindings)
    , m_theme(theme)
    , m_output(std::move(output)) {}

Terminal::~Terminal() {
    Close();
}

TerminalOpenResult Terminal::Open(const char *device) {
    if (IsOpen()) {
        return TerminalOpenResult::Success();
    }

    std::FILE *file = std::fopen(device, "r+");
    if (file == nullptr) {
        return TerminalOpenResult::DeviceUnavailable(device, errno);
    }
    util::ScopeGuard closeFile{[&] { std::fclose(file); }};

    if (isatty(fileno(file)) == 0) {
        return TerminalOpenResult::NotATerminal(device);
    }

    SCREEN *scr = newterm(nullptr, file, file);
    if (scr == nullptr) {
        return TerminalOpenResult::CursesInitFailed(device);
    }
    set_term(scr);

    cbreak();
    noecho();
    nonl();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(kEscDelay);
    m_palette.Install(m_theme);

    closeFile.Cancel();
    m_device = file;
    m_screen = scr;
    devlog::debug<grp::terminal>("Opened {} ({}x{})", device, COLS, LINES);
    return TerminalOpenResult::Success();
}

void Terminal::Close() {
    if (m_screen != nullptr) {
        endwin();
        delscreen(m_screen);
        m_screen = nullptr;
    }
    if (m_device != nullptr) {
        std::fclose(m_device);
        m_device = nullptr;
    }
}

void Terminal::Draw(const session::Session &session) {
    werase(stdscr);
    Canvas canvas{stdscr};
    ViewContext ctx{
        .canvas = canvas,
        .palette = m_palette,
        .bindings = m_bindings,
        .sources = m_sources,
        .output = m_output,
    };
    DrawUI(ctx, session);
    wnoutrefresh(stdscr);
    doupdate();
}

InputEvent Terminal::ReadInput() {
    while (true) {
        wint_t key = 0;
        errno = 0;
        const int status = wget_wch(stdscr, &key);
        if (status == ERR) {
            // Interrupted reads are retried; anything else means the terminal went away
            if (errno == EINTR) {
                continue;
            }
            return InputEvent::Closed();
        }

        auto event = TranslateKey(status, static_cast<unsigned int>(key));
        if (!event) {
            devlog::trace<grp::terminal>("Ignoring untranslatable key {:#x}", static_cast<unsigned int>(key));
            continue;
        }

        // Esc followed quickly by another key is an Alt chord
        if (event->type == InputEvent::Type::Key && event->chord.code == input::KeyCode::Esc) {
            nodelay(stdscr, TRUE);
            wint_t next = 0;
            const int nextStatus = wget_wch(stdscr, &next);
            nodelay(stdscr, FALSE);
            if (nextStatus != ERR) {
                if (auto nextEvent = TranslateKey(nextStatus, static_cast<unsigned int>(next));
                    nextEvent && nextEvent->type == InputEvent::Type::Key) {
                    return InputEvent::Key(WithAlt(nextEvent->chord));
                }
            }
        }
        return *event;
    }
}

} // namespace app::ui
