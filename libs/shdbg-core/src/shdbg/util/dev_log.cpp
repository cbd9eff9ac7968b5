#include <shdbg/util/dev_log.hpp>

namespace devlog {

namespace {
    FnSink g_sink = nullptr;
    void *g_sinkUserData = nullptr;
    Level g_minLevel = level::warn;
} // namespace

void SetSink(FnSink sink, void *userData) {
    g_sink = sink;
    g_sinkUserData = userData;
}

void SetMinLevel(Level level) {
    g_minLevel = level;
}

Level GetMinLevel() {
    return g_minLevel;
}

std::string_view LevelName(Level lvl) {
    switch (lvl) {
    case level::trace: return "trace";
    case level::debug: return "debug";
    case level::info: return "info";
    case level::warn: return "warn";
    case level::error: return "error";
    default: return "off";
    }
}

bool TryParseLevel(std::string_view name, Level &lvl) {
    for (Level candidate = level::trace; candidate <= level::off; ++candidate) {
        if (LevelName(candidate) == name) {
            lvl = candidate;
            return true;
        }
    }
    return false;
}

namespace detail {

    void Emit(Level level, std::string_view group, std::string_view message) {
        if (g_sink != nullptr) {
            g_sink(level, group, message, g_sinkUserData);
        }
    }

} // namespace detail

} // namespace devlog
