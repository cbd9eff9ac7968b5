#pragma once

/**
@file
@brief Grouped development log.

Log groups are plain structs with three static members:

```cpp
struct group {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "Group";
};
```

Messages from disabled groups or below the group's level are compiled out. The remaining messages are formatted with
fmt and handed to the installed sink, filtered by the runtime minimum level.
*/

#include <shdbg/core/types.hpp>

#include <fmt/format.h>

#include <string_view>
#include <utility>

namespace devlog {

using Level = uint8;

namespace level {
    inline constexpr Level trace = 0;
    inline constexpr Level debug = 1;
    inline constexpr Level info = 2;
    inline constexpr Level warn = 3;
    inline constexpr Level error = 4;
    inline constexpr Level off = 5;
} // namespace level

/// @brief Receives every message that passes the group and runtime level filters.
using FnSink = void (*)(Level level, std::string_view group, std::string_view message, void *userData);

/// @brief Installs the log sink. Passing `nullptr` discards all messages.
void SetSink(FnSink sink, void *userData);

/// @brief Sets the runtime minimum level. Defaults to `level::warn`.
void SetMinLevel(Level level);

Level GetMinLevel();

/// @brief Returns the lowercase name of the level ("trace", "debug", ...).
std::string_view LevelName(Level level);

/// @brief Parses a level name as returned by `LevelName`. Returns `false` if the name is not recognized.
bool TryParseLevel(std::string_view name, Level &level);

namespace detail {
    void Emit(Level level, std::string_view group, std::string_view message);
} // namespace detail

template <typename TGroup, typename... TArgs>
void log(Level lvl, fmt::format_string<TArgs...> fmtStr, TArgs &&...args) {
    if constexpr (TGroup::enabled) {
        if (lvl >= TGroup::level && lvl >= GetMinLevel()) {
            detail::Emit(lvl, TGroup::name, fmt::format(fmtStr, std::forward<TArgs>(args)...));
        }
    }
}

template <typename TGroup, typename... TArgs>
void trace(fmt::format_string<TArgs...> fmtStr, TArgs &&...args) {
    log<TGroup>(level::trace, fmtStr, std::forward<TArgs>(args)...);
}

template <typename TGroup, typename... TArgs>
void debug(fmt::format_string<TArgs...> fmtStr, TArgs &&...args) {
    log<TGroup>(level::debug, fmtStr, std::forward<TArgs>(args)...);
}

template <typename TGroup, typename... TArgs>
void info(fmt::format_string<TArgs...> fmtStr, TArgs &&...args) {
    log<TGroup>(level::info, fmtStr, std::forward<TArgs>(args)...);
}

template <typename TGroup, typename... TArgs>
void warn(fmt::format_string<TArgs...> fmtStr, TArgs &&...args) {
    log<TGroup>(level::warn, fmtStr, std::forward<TArgs>(args)...);
}

template <typename TGroup, typename... TArgs>
void error(fmt::format_string<TArgs...> fmtStr, TArgs &&...args) {
    log<TGroup>(level::error, fmtStr, std::forward<TArgs>(args)...);
}

} // namespace devlog
