#pragma once

#include "cmdline_opts.hpp"

#include "log_sink.hpp"
#include "settings.hpp"

namespace app {

namespace exit_status {
    inline constexpr int kSuccess = 0;
    inline constexpr int kFatal = 1;       ///< No terminal, input lost, or code generation failed
    inline constexpr int kConfigError = 2; ///< Bad command line or settings file
} // namespace exit_status

class App {
public:
    App();

    /// @brief Runs one debugger invocation.
    /// @return the process exit status
    int Run(const CommandLineOptions &options);

private:
    CommandLineOptions m_options;
    Settings m_settings;
    LogSink m_logSink;

    bool LoadSettings();
    void ConfigureLogging();
};

} // namespace app
