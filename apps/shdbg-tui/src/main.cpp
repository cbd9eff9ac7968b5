#include <app/app.hpp>
#include <app/cmdline_opts.hpp>

#include <shdbg/version.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <clocale>
#include <cstdio>
#include <exception>
#include <string_view>
#include <vector>

int main(int argc, char **argv) {
    std::setlocale(LC_ALL, "");

    const std::string_view program = argc > 0 ? argv[0] : "shdbg";
    std::vector<std::string_view> args(argv + std::min(argc, 1), argv + argc);

    app::CommandLineOptions options{};
    if (auto result = app::ParseCommandLine(args, options); !result) {
        fmt::print(stderr, "shdbg: {}\n\n{}", result.string(), app::UsageText(program));
        return app::exit_status::kConfigError;
    }
    if (options.showHelp) {
        fmt::print("{}", app::UsageText(program));
        return app::exit_status::kSuccess;
    }
    if (options.showVersion) {
        fmt::print("shdbg {}\n", shdbg::version::string);
        return app::exit_status::kSuccess;
    }

    try {
        app::App app{};
        return app.Run(options);
    } catch (const std::exception &e) {
        fmt::print(stderr, "shdbg: unhandled exception: {}\n", e.what());
        return app::exit_status::kFatal;
    }
}
