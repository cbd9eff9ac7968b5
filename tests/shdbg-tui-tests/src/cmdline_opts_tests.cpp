#include <catch2/catch_test_macros.hpp>

#include <app/cmdline_opts.hpp>

#include <string_view>
#include <vector>

using namespace app;
using shdbg::shell::Dialect;

namespace cmdline_opts_tests {

ParseResult Parse(std::vector<std::string_view> args, CommandLineOptions &options) {
    return ParseCommandLine(args, options);
}

TEST_CASE("Separate and inline option values are accepted", "[cmdline]") {
    CommandLineOptions options{};
    const auto result = Parse({"--shell", "zsh", "--tracepoint=start", "--call-stack", "/run.zsh:3:main",
                               "--config=/etc/shdbg.toml"},
                              options);

    REQUIRE(result);
    CHECK(options.dialect == Dialect::Zsh);
    CHECK(options.tracepoint == "start");
    CHECK(options.callStack == "/run.zsh:3:main");
    CHECK(options.configPath == "/etc/shdbg.toml");
    CHECK_FALSE(options.showHelp);
    CHECK_FALSE(options.showVersion);
}

TEST_CASE("The call stack is optional and may be empty", "[cmdline]") {
    CommandLineOptions options{};
    REQUIRE(Parse({"--shell=fish", "--tracepoint", "end", "--call-stack="}, options));
    CHECK(options.dialect == Dialect::Fish);
    CHECK(options.callStack.empty());
    CHECK(options.configPath.empty());
}

TEST_CASE("Inline values keep later equals signs", "[cmdline]") {
    CommandLineOptions options{};
    REQUIRE(Parse({"--shell=bash", "--tracepoint=a=b"}, options));
    CHECK(options.tracepoint == "a=b");
}

TEST_CASE("Help and version do not require other options", "[cmdline]") {
    CommandLineOptions help{};
    REQUIRE(Parse({"-h"}, help));
    CHECK(help.showHelp);

    CommandLineOptions version{};
    REQUIRE(Parse({"--version"}, version));
    CHECK(version.showVersion);
}

TEST_CASE("Required options are reported when missing", "[cmdline]") {
    CommandLineOptions options{};

    auto result = Parse({}, options);
    CHECK(result.type == ParseResult::Type::MissingOption);
    CHECK(result.string() == "missing required option '--shell'");

    result = Parse({"--shell", "bash"}, options);
    CHECK(result.type == ParseResult::Type::MissingOption);
    CHECK(result.string() == "missing required option '--tracepoint'");
}

TEST_CASE("Invalid command lines are rejected", "[cmdline]") {
    CommandLineOptions options{};

    auto result = Parse({"--shell", "tcsh", "--tracepoint", "x"}, options);
    CHECK(result.type == ParseResult::Type::InvalidDialect);
    CHECK(result.string() == "unsupported shell 'tcsh'; expected bash, zsh or fish");

    result = Parse({"--shell", "bash", "--tracepoint"}, options);
    CHECK(result.type == ParseResult::Type::MissingValue);
    CHECK(result.string() == "option '--tracepoint' requires a value");

    result = Parse({"--shell", "bash", "--verbose"}, options);
    CHECK(result.type == ParseResult::Type::UnknownOption);
    CHECK(result.string() == "unknown option '--verbose'");

    result = Parse({"positional"}, options);
    CHECK(result.type == ParseResult::Type::UnknownOption);
}

TEST_CASE("Usage text names the program", "[cmdline]") {
    const std::string usage = UsageText("shdbg");
    CHECK(usage.starts_with("Usage: shdbg --shell"));
    CHECK(usage.find("SHDBG_TRACEPOINT") != std::string::npos);
}

} // namespace cmdline_opts_tests
