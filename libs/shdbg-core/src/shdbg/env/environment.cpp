#include <shdbg/env/environment.hpp>

#include <algorithm>

extern char **environ;

namespace shdbg::env {

Environment::Environment(const std::vector<std::string_view> &entries) {
    for (std::string_view entry : entries) {
        const size_t eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            continue;
        }
        std::string name{entry.substr(0, eq)};
        std::string value{entry.substr(eq + 1)};
        auto it = std::find_if(m_variables.begin(), m_variables.end(),
                               [&](const Variable &var) { return var.name == name; });
        if (it != m_variables.end()) {
            it->value = std::move(value);
        } else {
            m_variables.push_back({std::move(name), std::move(value)});
        }
    }
    std::sort(m_variables.begin(), m_variables.end(),
              [](const Variable &lhs, const Variable &rhs) { return lhs.name < rhs.name; });
}

Environment Environment::Capture() {
    std::vector<std::string_view> entries{};
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        entries.emplace_back(*entry);
    }
    return Environment{entries};
}

const Variable *Environment::Find(std::string_view name) const {
    auto it = std::lower_bound(m_variables.begin(), m_variables.end(), name,
                               [](const Variable &var, std::string_view key) { return var.name < key; });
    if (it != m_variables.end() && it->name == name) {
        return &*it;
    }
    return nullptr;
}

std::vector<std::string> SplitValue(std::string_view value) {
    std::vector<std::string> items{};
    size_t pos = 0;
    while (true) {
        const size_t next = value.find(':', pos);
        if (next == std::string_view::npos) {
            items.emplace_back(value.substr(pos));
            break;
        }
        items.emplace_back(value.substr(pos, next - pos));
        pos = next + 1;
    }
    return items;
}

} // namespace shdbg::env
