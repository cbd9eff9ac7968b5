#pragma once

/**
@file
@brief Lazily loaded script sources for the call-site view.
*/

#include <shdbg/core/types.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shdbg::trace {

using SourceLines = std::vector<std::string>;

/// @brief Loads source files on first request and keeps them for the rest of the session.
class SourceCache {
public:
    /// @brief Returns the lines of the file, or `nullptr` if it could not be read.
    ///
    /// Failures are remembered; an unreadable file is not retried.
    const SourceLines *Get(const std::filesystem::path &file);

    size_t Size() const {
        return m_files.size();
    }

private:
    std::map<std::filesystem::path, std::optional<SourceLines>> m_files;
};

/// @brief Reads a text file into lines, dropping line terminators and expanding tabs to four spaces.
std::optional<SourceLines> ReadSourceLines(const std::filesystem::path &file);

/// @brief A range of source lines to display.
struct SourceWindow {
    size_t first = 0; ///< Zero-based index of the first line shown
    size_t count = 0; ///< Number of lines shown

    bool operator==(const SourceWindow &) const = default;
};

/// @brief Picks the lines to show so that the one-based `line` is as close to the vertical centre as the file allows.
///
/// Lines past the end of the file are clamped to the last line.
SourceWindow CenterOnLine(size_t lineCount, uint32 line, size_t height);

} // namespace shdbg::trace
