#include "cmdline_opts.hpp"

#include <fmt/format.h>

#include <optional>

using namespace shdbg;

namespace app {

ParseResult ParseResult::UnknownOption(std::string_view option) {
    return {.type = Type::UnknownOption, .errorMessage = fmt::format("unknown option '{}'", option)};
}

ParseResult ParseResult::MissingValue(std::string_view option) {
    return {.type = Type::MissingValue, .errorMessage = fmt::format("option '{}' requires a value", option)};
}

ParseResult ParseResult::InvalidDialect(std::string_view name) {
    return {.type = Type::InvalidDialect,
            .errorMessage = fmt::format("unsupported shell '{}'; expected bash, zsh or fish", name)};
}

ParseResult ParseResult::MissingOption(std::string_view option) {
    return {.type = Type::MissingOption, .errorMessage = fmt::format("missing required option '{}'", option)};
}

std::string ParseResult::string() const {
    return type == Type::Success ? "Success" : errorMessage;
}

ParseResult ParseCommandLine(std::span<const std::string_view> args, CommandLineOptions &options) {
    bool hasShell = false;
    bool hasTracepoint = false;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
            continue;
        }
        if (arg == "-V" || arg == "--version") {
            options.showVersion = true;
            continue;
        }

        std::string_view name = arg;
        std::optional<std::string_view> inlineValue{};
        if (auto eq = arg.find('='); arg.starts_with("--") && eq != std::string_view::npos) {
            name = arg.substr(0, eq);
            inlineValue = arg.substr(eq + 1);
        }

        auto takeValue = [&]() -> std::optional<std::string_view> {
            if (inlineValue) {
                return inlineValue;
            }
            if (i + 1 < args.size()) {
                return args[++i];
            }
            return std::nullopt;
        };

        if (name == "--shell") {
            auto value = takeValue();
            if (!value) {
                return ParseResult::MissingValue(name);
            }
            auto dialect = shell::ParseDialect(*value);
            if (!dialect) {
                return ParseResult::InvalidDialect(*value);
            }
            options.dialect = *dialect;
            hasShell = true;
        } else if (name == "--tracepoint") {
            auto value = takeValue();
            if (!value) {
                return ParseResult::MissingValue(name);
            }
            options.tracepoint = *value;
            hasTracepoint = true;
        } else if (name == "--call-stack") {
            auto value = takeValue();
            if (!value) {
                return ParseResult::MissingValue(name);
            }
            options.callStack = *value;
        } else if (name == "--config") {
            auto value = takeValue();
            if (!value) {
                return ParseResult::MissingValue(name);
            }
            options.configPath = *value;
        } else {
            return ParseResult::UnknownOption(arg);
        }
    }

    if (options.showHelp || options.showVersion) {
        return ParseResult::Success();
    }
    if (!hasShell) {
        return ParseResult::MissingOption("--shell");
    }
    if (!hasTracepoint) {
        return ParseResult::MissingOption("--tracepoint");
    }
    return ParseResult::Success();
}

std::string UsageText(std::string_view program) {
    return fmt::format(R"(Usage: {0} --shell <bash|zsh|fish> --tracepoint <name> [--call-stack <text>] [--config <path>]
       {0} --help | --version

Suspends a shell script at a tracepoint and shows an interactive debugger on the terminal.
The shell code printed on standard output must be evaluated by the calling shell.

Options:
  --shell <dialect>     Shell that invoked the debugger: bash, zsh or fish
  --tracepoint <name>   Name of the tracepoint that was hit
  --call-stack <text>   Call stack captured by the shell, in its native format
  --config <path>       Settings file (default: $SHDBG_CONFIG, then $XDG_CONFIG_HOME/shdbg/config.toml)
  -h, --help            Show this help and exit
  -V, --version         Show the version and exit

Environment:
  SHDBG_TRACEPOINT      Selects where to stop: a tracepoint name, "next" or "all"
)",
                       program);
}

} // namespace app
