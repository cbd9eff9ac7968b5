#include "settings.hpp"

#include <shdbg/util/inline.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <utility>

using namespace std::literals;
using namespace shdbg;

namespace app {

// Increment this version when making breaking changes to the settings file structure.
inline constexpr int kConfigVersion = 1;

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // settings

    struct settings {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Settings";
    };

} // namespace grp

// -------------------------------------------------------------------------------------------------
// Load results

SettingsLoadResult SettingsLoadResult::TOMLParseError(const toml::parse_error &error) {
    const auto &begin = error.source().begin;
    return {.type = Type::TOMLParseError,
            .errorMessage = fmt::format("{} (line {}, column {})", error.description(), begin.line, begin.column)};
}

SettingsLoadResult SettingsLoadResult::UnsupportedConfigVersion(int version) {
    return {.type = Type::UnsupportedConfigVersion,
            .errorMessage = fmt::format("configuration version {} is newer than the supported version {}", version,
                                        kConfigVersion)};
}

SettingsLoadResult SettingsLoadResult::InvalidValue(std::string_view key, std::string_view reason) {
    return {.type = Type::InvalidValue, .errorMessage = fmt::format("{}: {}", key, reason)};
}

std::string SettingsLoadResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::TOMLParseError: return fmt::format("TOML parse error: {}", errorMessage);
    case Type::UnsupportedConfigVersion: return fmt::format("Unsupported configuration: {}", errorMessage);
    case Type::InvalidValue: return fmt::format("Invalid value for {}", errorMessage);
    case Type::ConflictingKeyBindings: return fmt::format("Conflicting key bindings: {}", errorMessage);
    }
    return "Unknown error";
}

// -------------------------------------------------------------------------------------------------
// Parsers
//
// Each parser leaves the value untouched when the key is absent and reports a value of the right type that cannot
// be interpreted. Values of the wrong TOML type are reported as well.

struct ParseContext {
    std::string_view table;
    SettingsLoadResult result = SettingsLoadResult::Success();

    void Fail(const char *name, std::string_view reason) {
        if (result) {
            result = SettingsLoadResult::InvalidValue(fmt::format("{}.{}", table, name), reason);
        }
    }
};

FORCE_INLINE static void Parse(ParseContext &ctx, toml::node_view<toml::node> &node, const char *name, int &value) {
    toml::node_view view{node[name]};
    if (!view) {
        return;
    }
    if (auto opt = view.value<sint64>()) {
        if (*opt < 0 || *opt > 255) {
            ctx.Fail(name, fmt::format("{} is outside the range 0..255", *opt));
            return;
        }
        value = static_cast<int>(*opt);
    } else {
        ctx.Fail(name, "expected an integer");
    }
}

FORCE_INLINE static void Parse(ParseContext &ctx, toml::node_view<toml::node> &node, const char *name,
                               std::filesystem::path &value) {
    toml::node_view view{node[name]};
    if (!view) {
        return;
    }
    if (auto opt = view.value<std::filesystem::path::string_type>()) {
        value = *opt;
    } else {
        ctx.Fail(name, "expected a string");
    }
}

// Parses a string value through a converter returning std::optional.
template <typename T, typename FnConvert>
FORCE_INLINE static void ParseString(ParseContext &ctx, toml::node_view<toml::node> &node, const char *name, T &value,
                                     FnConvert &&convert) {
    toml::node_view view{node[name]};
    if (!view) {
        return;
    }
    auto str = view.value<std::string_view>();
    if (!str) {
        ctx.Fail(name, "expected a string");
        return;
    }
    if (auto opt = convert(*str)) {
        value = *opt;
    } else {
        ctx.Fail(name, fmt::format("unrecognized value \"{}\"", *str));
    }
}

FORCE_INLINE static void Parse(ParseContext &ctx, toml::node_view<toml::node> &node, const char *name,
                               input::KeyChord &value) {
    ParseString(ctx, node, name, value, [](std::string_view text) { return input::ParseKeyChord(text); });
}

FORCE_INLINE static void Parse(ParseContext &ctx, toml::node_view<toml::node> &node, const char *name,
                               ui::Color &value) {
    ParseString(ctx, node, name, value, [](std::string_view text) { return ui::ParseColor(text); });
}

FORCE_INLINE static void ParseLevel(ParseContext &ctx, toml::node_view<toml::node> &node, const char *name,
                                    devlog::Level &value) {
    ParseString(ctx, node, name, value, [](std::string_view text) -> std::optional<devlog::Level> {
        devlog::Level level{};
        if (devlog::TryParseLevel(text, level)) {
            return level;
        }
        return std::nullopt;
    });
}

// -------------------------------------------------------------------------------------------------
// Implementation

Settings::Settings() {
    ResetToDefaults();
}

void Settings::ResetToDefaults() {
    session.terminateExitCode = resume::kDefaultTerminateExitCode;

    logging.level = devlog::level::warn;
    logging.file.clear();

    keyBindings = {};
    theme = {};
}

SettingsLoadResult Settings::Load(const std::filesystem::path &path) {
    // Use defaults if configuration file does not exist
    if (!std::filesystem::is_regular_file(path)) {
        ResetToDefaults();
        this->path = path;
        devlog::debug<grp::settings>("No settings file at {}; using defaults", path.string());
        return SettingsLoadResult::Success();
    }

    auto parseResult = toml::parse_file(path.native());
    if (parseResult.failed()) {
        return SettingsLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    // Parse into a fresh copy so that a failure leaves the current settings untouched
    Settings loaded{};

    int configVersion = kConfigVersion;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return SettingsLoadResult::UnsupportedConfigVersion(configVersion);
    }

    ParseContext ctx{};

    if (auto tblSession = data["Session"]) {
        ctx.table = "Session";
        Parse(ctx, tblSession, "TerminateExitCode", loaded.session.terminateExitCode);
    }

    if (auto tblLogging = data["Logging"]) {
        ctx.table = "Logging";
        ParseLevel(ctx, tblLogging, "Level", loaded.logging.level);
        Parse(ctx, tblLogging, "File", loaded.logging.file);
    }

    if (auto tblKeyBindings = data["KeyBindings"]) {
        if (auto tblGlobal = tblKeyBindings["Global"]) {
            auto &binds = loaded.keyBindings.global;
            ctx.table = "KeyBindings.Global";
            Parse(ctx, tblGlobal, "Exit", binds.exit);
            Parse(ctx, tblGlobal, "Continue", binds.cont);
            Parse(ctx, tblGlobal, "NextTab", binds.nextTab);
            Parse(ctx, tblGlobal, "PrevTab", binds.prevTab);
        }
        if (auto tblTrace = tblKeyBindings["Trace"]) {
            auto &binds = loaded.keyBindings.trace;
            ctx.table = "KeyBindings.Trace";
            Parse(ctx, tblTrace, "NextFrame", binds.nextFrame);
            Parse(ctx, tblTrace, "PrevFrame", binds.prevFrame);
        }
        if (auto tblVars = tblKeyBindings["Vars"]) {
            auto &binds = loaded.keyBindings.vars;
            ctx.table = "KeyBindings.Vars";
            Parse(ctx, tblVars, "NextItem", binds.nextItem);
            Parse(ctx, tblVars, "PrevItem", binds.prevItem);
            Parse(ctx, tblVars, "FocusList", binds.focusList);
            Parse(ctx, tblVars, "FocusDetail", binds.focusDetail);
            Parse(ctx, tblVars, "RawDetail", binds.rawDetail);
            Parse(ctx, tblVars, "SplitDetail", binds.splitDetail);
        }
    }

    if (auto tblTheme = data["Theme"]) {
        ctx.table = "Theme";
        Parse(ctx, tblTheme, "Accent", loaded.theme.accent);
        Parse(ctx, tblTheme, "Highlight", loaded.theme.highlight);
    }

    if (!ctx.result) {
        return ctx.result;
    }

    try {
        loaded.keyBindings.Validate();
    } catch (const input::DuplicateKeyBindingError &error) {
        return SettingsLoadResult::ConflictingKeyBindings(error);
    }

    loaded.path = path;
    *this = std::move(loaded);
    devlog::debug<grp::settings>("Loaded settings from {}", path.string());
    return SettingsLoadResult::Success();
}

std::filesystem::path DefaultSettingsPath() {
    if (const char *configPath = std::getenv("SHDBG_CONFIG"); configPath != nullptr && *configPath != '\0') {
        return configPath;
    }

    std::filesystem::path base{};
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        base = std::filesystem::path{home} / ".config";
    } else {
        return {};
    }
    return base / "shdbg" / "config.toml";
}

} // namespace app
