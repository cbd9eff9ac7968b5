#pragma once

/**
@file
@brief Shell dialects supported by the debugger.
*/

#include <shdbg/core/types.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace shdbg::shell {

/// @brief A shell dialect the debugger can be invoked from and generate code for.
enum class Dialect : uint8 { Bash, Zsh, Fish };

inline constexpr std::array<Dialect, 3> kAllDialects = {Dialect::Bash, Dialect::Zsh, Dialect::Fish};

/// @brief Returns the dialect's command line name ("bash", "zsh" or "fish").
std::string_view GetDialectName(Dialect dialect);

/// @brief Parses a dialect from its command line name. Matching is exact.
std::optional<Dialect> ParseDialect(std::string_view name);

} // namespace shdbg::shell
