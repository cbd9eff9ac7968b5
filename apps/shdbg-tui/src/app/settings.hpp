#pragma once

#include <app/ui/theme.hpp>

#include <shdbg/input/key_bindings.hpp>
#include <shdbg/resume/resume_code.hpp>
#include <shdbg/util/dev_log.hpp>

#include <toml++/toml.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace app {

struct SettingsLoadResult {
    enum class Type { Success, TOMLParseError, UnsupportedConfigVersion, InvalidValue, ConflictingKeyBindings };

    Type type;
    std::string errorMessage;

    static SettingsLoadResult Success() {
        return {.type = Type::Success, .errorMessage = {}};
    }

    static SettingsLoadResult TOMLParseError(const toml::parse_error &error);

    static SettingsLoadResult UnsupportedConfigVersion(int version);

    static SettingsLoadResult InvalidValue(std::string_view key, std::string_view reason);

    static SettingsLoadResult ConflictingKeyBindings(const shdbg::input::DuplicateKeyBindingError &error) {
        return {.type = Type::ConflictingKeyBindings, .errorMessage = error.what()};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

/// @brief User settings, loaded from a TOML file.
///
/// Every value has a default; keys missing from the file keep it.
struct Settings {
    Settings();

    void ResetToDefaults();

    /// @brief Loads settings from the given path. A missing file yields the defaults.
    SettingsLoadResult Load(const std::filesystem::path &path);

    std::filesystem::path path;

    struct Session {
        int terminateExitCode;
    } session;

    struct Logging {
        devlog::Level level;
        std::filesystem::path file; ///< Empty to log to standard error
    } logging;

    shdbg::input::KeyBindings keyBindings;

    ui::Theme theme;
};

/// @brief Determines where the settings file lives.
///
/// `SHDBG_CONFIG` wins when set and non-empty. Otherwise the file is `shdbg/config.toml` under `XDG_CONFIG_HOME`, or
/// under `~/.config` when that is unset. Returns an empty path if no location can be derived.
std::filesystem::path DefaultSettingsPath();

} // namespace app
