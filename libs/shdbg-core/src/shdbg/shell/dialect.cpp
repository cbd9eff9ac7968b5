#include <shdbg/shell/dialect.hpp>

#include <shdbg/util/unreachable.hpp>

namespace shdbg::shell {

std::string_view GetDialectName(Dialect dialect) {
    switch (dialect) {
    case Dialect::Bash: return "bash";
    case Dialect::Zsh: return "zsh";
    case Dialect::Fish: return "fish";
    }
    util::unreachable();
}

std::optional<Dialect> ParseDialect(std::string_view name) {
    for (Dialect dialect : kAllDialects) {
        if (GetDialectName(dialect) == name) {
            return dialect;
        }
    }
    return std::nullopt;
}

} // namespace shdbg::shell
