#include "log_sink.hpp"

#include <fmt/format.h>

#include <utility>

namespace app {

std::string FormatLogLine(devlog::Level level, std::string_view group, std::string_view message) {
    return fmt::format("[{}] [{}] {}", devlog::LevelName(level), group, message);
}

LogSink::~LogSink() {
    Uninstall();
    Flush();
}

void LogSink::Install() {
    devlog::SetSink(&LogSink::Write, this);
    m_installed = true;
}

void LogSink::Uninstall() {
    if (m_installed) {
        devlog::SetSink(nullptr, nullptr);
        m_installed = false;
    }
}

bool LogSink::OpenFile(const std::filesystem::path &path) {
    std::FILE *file = std::fopen(path.c_str(), "a");
    if (file == nullptr) {
        return false;
    }
    m_file.reset(file);
    return true;
}

void LogSink::SetHoldBack(bool holdBack) {
    m_holdBack = holdBack;
    if (!holdBack) {
        Flush();
    }
}

void LogSink::Write(devlog::Level level, std::string_view group, std::string_view message, void *userData) {
    auto &sink = *static_cast<LogSink *>(userData);
    sink.WriteLine(FormatLogLine(level, group, message));
}

void LogSink::WriteLine(std::string line) {
    if (m_file) {
        fmt::print(m_file.get(), "{}\n", line);
        std::fflush(m_file.get());
    } else if (m_holdBack) {
        m_heldBack.push_back(std::move(line));
    } else {
        fmt::print(stderr, "{}\n", line);
    }
}

void LogSink::Flush() {
    for (const auto &line : m_heldBack) {
        fmt::print(stderr, "{}\n", line);
    }
    m_heldBack.clear();
}

} // namespace app
