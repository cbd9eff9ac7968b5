#pragma once

#include <shdbg/shell/dialect.hpp>

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace app {

struct CommandLineOptions {
    shdbg::shell::Dialect dialect = shdbg::shell::Dialect::Bash;
    std::string tracepoint;
    std::string callStack;           ///< Raw stack text in the dialect's native format; may be empty
    std::filesystem::path configPath; ///< Empty to use the default location
    bool showHelp = false;
    bool showVersion = false;
};

struct ParseResult {
    enum class Type { Success, UnknownOption, MissingValue, InvalidDialect, MissingOption };

    Type type;
    std::string errorMessage;

    static ParseResult Success() {
        return {.type = Type::Success, .errorMessage = {}};
    }

    static ParseResult UnknownOption(std::string_view option);

    static ParseResult MissingValue(std::string_view option);

    static ParseResult InvalidDialect(std::string_view name);

    static ParseResult MissingOption(std::string_view option);

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

/// @brief Parses the command line arguments, excluding the program name.
///
/// Options take their value either from the next argument (`--shell bash`) or inline (`--shell=bash`).
/// `--shell` and `--tracepoint` are required unless `--help` or `--version` is given.
ParseResult ParseCommandLine(std::span<const std::string_view> args, CommandLineOptions &options);

/// @brief Returns the usage text printed by `--help`.
std::string UsageText(std::string_view program);

} // namespace app
