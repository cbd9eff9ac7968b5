#pragma once

#include <shdbg/util/dev_log.hpp>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace app {

/// @brief Formats a log line as `[level] [Group] message`.
std::string FormatLogLine(devlog::Level level, std::string_view group, std::string_view message);

/// @brief devlog sink writing to a log file or to standard error.
///
/// Standard error shares the terminal with the UI, so lines meant for it can be held back while the UI is active and
/// written once the terminal is restored. Lines going to a log file are never held back.
class LogSink {
public:
    LogSink() = default;
    LogSink(const LogSink &) = delete;
    LogSink &operator=(const LogSink &) = delete;

    /// @brief Uninstalls the sink and flushes held back lines.
    ~LogSink();

    /// @brief Makes this sink the destination of devlog messages.
    void Install();

    /// @brief Detaches the sink from devlog.
    void Uninstall();

    /// @brief Appends to the given file instead of writing to standard error.
    /// @return `false` if the file cannot be opened, in which case standard error remains the destination
    bool OpenFile(const std::filesystem::path &path);

    /// @brief Enables or disables holding back lines destined for standard error. Disabling flushes them.
    void SetHoldBack(bool holdBack);

    bool IsHoldingBack() const {
        return m_holdBack;
    }

    /// @brief Lines currently held back.
    const std::vector<std::string> &HeldBackLines() const {
        return m_heldBack;
    }

private:
    struct FileCloser {
        void operator()(std::FILE *file) const {
            std::fclose(file);
        }
    };

    std::unique_ptr<std::FILE, FileCloser> m_file;
    std::vector<std::string> m_heldBack;
    bool m_holdBack = false;
    bool m_installed = false;

    static void Write(devlog::Level level, std::string_view group, std::string_view message, void *userData);

    void WriteLine(std::string line);
    void Flush();
};

} // namespace app
