#include <shdbg/trace/source_cache.hpp>

#include <shdbg/util/dev_log.hpp>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace shdbg::trace {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // source

    struct source {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Trace-Source";
    };

} // namespace grp

inline constexpr size_t kTabWidth = 4;

const SourceLines *SourceCache::Get(const std::filesystem::path &file) {
    auto it = m_files.find(file);
    if (it == m_files.end()) {
        it = m_files.emplace(file, ReadSourceLines(file)).first;
        if (it->second) {
            devlog::debug<grp::source>("Loaded {} lines from {}", it->second->size(), file.string());
        } else {
            devlog::info<grp::source>("Could not read source file {}", file.string());
        }
    }
    return it->second ? &*it->second : nullptr;
}

std::optional<SourceLines> ReadSourceLines(const std::filesystem::path &file) {
    std::error_code error{};
    if (!std::filesystem::is_regular_file(file, error)) {
        return std::nullopt;
    }

    std::ifstream in{file, std::ios::binary};
    if (!in) {
        return std::nullopt;
    }

    SourceLines lines{};
    std::string raw{};
    while (std::getline(in, raw)) {
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        std::string &line = lines.emplace_back();
        line.reserve(raw.size());
        for (char ch : raw) {
            if (ch == '\t') {
                line.append(kTabWidth - line.size() % kTabWidth, ' ');
            } else {
                line.push_back(ch);
            }
        }
    }
    if (in.bad()) {
        return std::nullopt;
    }
    return lines;
}

SourceWindow CenterOnLine(size_t lineCount, uint32 line, size_t height) {
    if (lineCount == 0 || height == 0) {
        return {};
    }
    const size_t count = std::min(lineCount, height);
    const size_t index = std::min<size_t>(line > 0 ? line - 1 : 0, lineCount - 1);
    const size_t first = std::min(index - std::min(index, count / 2), lineCount - count);
    return {.first = first, .count = count};
}

} // namespace shdbg::trace
