#pragma once

#include <utility>

namespace util {

/// @brief Runs a function when the guard goes out of scope unless cancelled.
template <typename Fn>
class ScopeGuard {
public:
    explicit ScopeGuard(Fn &&fn)
        : m_fn(std::move(fn)) {}

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;

    ~ScopeGuard() {
        if (m_active) {
            m_fn();
        }
    }

    void Cancel() {
        m_active = false;
    }

private:
    Fn m_fn;
    bool m_active = true;
};

} // namespace util
