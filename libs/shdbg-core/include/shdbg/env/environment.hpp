#pragma once

/**
@file
@brief Snapshot of the environment the debugger was started with.
*/

#include <string>
#include <string_view>
#include <vector>

namespace shdbg::env {

struct Variable {
    std::string name;
    std::string value;

    bool operator==(const Variable &) const = default;
};

/// @brief Environment variables sorted by name.
class Environment {
public:
    Environment() = default;

    /// @brief Builds a snapshot from `NAME=value` entries. Entries without `=` are ignored; later duplicates win.
    explicit Environment(const std::vector<std::string_view> &entries);

    /// @brief Captures the current process environment.
    static Environment Capture();

    const std::vector<Variable> &Variables() const {
        return m_variables;
    }

    size_t Size() const {
        return m_variables.size();
    }

    bool IsEmpty() const {
        return m_variables.empty();
    }

    /// @brief Returns the variable with the given name, or `nullptr`.
    const Variable *Find(std::string_view name) const;

private:
    std::vector<Variable> m_variables;
};

/// @brief Splits a list-like value on `:` the way `PATH` is read. Empty segments are kept.
std::vector<std::string> SplitValue(std::string_view value);

} // namespace shdbg::env
