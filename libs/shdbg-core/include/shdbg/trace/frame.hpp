#pragma once

/**
@file
@brief Canonical call stack model shared by every shell dialect.
*/

#include <shdbg/core/types.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace shdbg::trace {

/// @brief Function name reported for code running at the top level of a script.
inline constexpr std::string_view kTopLevelFunction = "<script>";

/// @brief One location in the shell's call stack.
struct Frame {
    std::filesystem::path file; ///< Absolute path of the file, or the path as reported if it could not be resolved
    uint32 line = 0;            ///< 1-based line number of the call site
    std::string function;       ///< Enclosing function, or `kTopLevelFunction`

    bool IsTopLevel() const {
        return function == kTopLevelFunction;
    }

    bool operator==(const Frame &) const = default;
};

/// @brief Frames ordered innermost-first. Index 0 is the immediate caller of the tracepoint.
using CallStack = std::vector<Frame>;

} // namespace shdbg::trace
