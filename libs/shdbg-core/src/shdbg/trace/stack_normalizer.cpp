#include <shdbg/trace/stack_normalizer.hpp>

#include <shdbg/util/dev_log.hpp>
#include <shdbg/util/unreachable.hpp>

#include <algorithm>
#include <charconv>
#include <optional>

namespace shdbg::trace {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // trace

    struct trace {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Trace";
    };

} // namespace grp

namespace {

    // bash: record 0 is the call to the stack capture helper inside shdbg_tracepoint.
    // zsh: the wrapper reads funcfiletrace inline, so the first record is already the caller.
    // fish: record 0 is the command substitution running `status stack-trace`.
    constexpr TraceFormat kBashFormat{.delimiter = '\n', .helperFrames = 1};
    constexpr TraceFormat kZshFormat{.delimiter = '\n', .helperFrames = 0};
    constexpr TraceFormat kFishFormat{.delimiter = ';', .helperFrames = 1};

    constexpr std::string_view kWhitespace = " \t\r\n";

    constexpr std::string_view kFishFunctionPrefix = "in function '";
    constexpr std::string_view kFishSourcingPrefix = "from sourcing file ";
    constexpr std::string_view kFishScopePrefix = "in ";
    constexpr std::string_view kFishCallPrefix = "called ";
    constexpr std::string_view kFishCallSitePrefix = "called on line ";
    constexpr std::string_view kFishCallSiteFile = " of file ";

    std::string_view Trim(std::string_view text) {
        const size_t start = text.find_first_not_of(kWhitespace);
        if (start == std::string_view::npos) {
            return {};
        }
        const size_t end = text.find_last_not_of(kWhitespace);
        return text.substr(start, end - start + 1);
    }

    // Splits on the delimiter, trimming every piece and dropping empty ones.
    std::vector<std::string_view> SplitRecords(std::string_view raw, char delimiter) {
        std::vector<std::string_view> records{};
        size_t pos = 0;
        while (pos <= raw.size()) {
            size_t next = raw.find(delimiter, pos);
            if (next == std::string_view::npos) {
                next = raw.size();
            }
            const std::string_view record = Trim(raw.substr(pos, next - pos));
            if (!record.empty()) {
                records.push_back(record);
            }
            pos = next + 1;
        }
        return records;
    }

    bool ParseLineNumber(std::string_view text, uint32 &line) {
        if (text.empty()) {
            return false;
        }
        uint32 value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
            return false;
        }
        line = value;
        return true;
    }

    // -------------------------------------------------------------------------
    // fish

    struct FishRecord {
        size_t index;
        std::string text;
        std::optional<std::string> scope;
        std::string_view callSite;
    };

    std::optional<std::string> ParseFishScope(std::string_view header) {
        if (header.starts_with(kFishFunctionPrefix)) {
            const std::string_view rest = header.substr(kFishFunctionPrefix.size());
            return std::string{rest.substr(0, rest.find('\''))};
        }
        if (header.starts_with(kFishSourcingPrefix)) {
            return std::string{kTopLevelFunction};
        }
        if (header.starts_with(kFishScopePrefix)) {
            // Other scopes ("in command substitution", "in event handler ...") are named after their description
            return fmt::format("<{}>", header.substr(kFishScopePrefix.size()));
        }
        return std::nullopt;
    }

    bool TryDecodeFishCallSite(std::string_view callSite, std::string &function, Frame &frame,
                               MalformedReason &reason) {
        if (callSite.empty()) {
            reason = MalformedReason::MissingFields;
            return false;
        }
        std::string_view rest = callSite.substr(kFishCallSitePrefix.size());
        const size_t fileSep = rest.find(kFishCallSiteFile);
        if (fileSep == std::string_view::npos) {
            reason = MalformedReason::MissingFields;
            return false;
        }
        uint32 line = 0;
        if (!ParseLineNumber(rest.substr(0, fileSep), line)) {
            reason = MalformedReason::InvalidLine;
            return false;
        }
        const std::string_view path = Trim(rest.substr(fileSep + kFishCallSiteFile.size()));
        if (path.empty()) {
            reason = MalformedReason::EmptyPath;
            return false;
        }
        frame.file = ResolvePath(path);
        frame.line = line;
        frame.function = std::move(function);
        return true;
    }

    NormalizeResult NormalizeFish(std::string_view raw, const TraceFormat &format) {
        NormalizeResult result{};

        // Group lines into records. Every scope header opens a record; a call site line attaches to the record
        // right before it. Other fragments continue a header still waiting for its call site, or else stand alone and
        // are reported as malformed.
        std::vector<FishRecord> records{};
        for (std::string_view line : SplitRecords(raw, format.delimiter)) {
            if (line.starts_with(kFishCallPrefix)) {
                if (!records.empty() && records.back().scope && records.back().callSite.empty()) {
                    auto &record = records.back();
                    record.callSite = line;
                    record.text = fmt::format("{}{}{}", record.text, format.delimiter, line);
                    continue;
                }
                records.push_back({records.size(), std::string{line}, std::nullopt, line});
                continue;
            }
            auto scope = ParseFishScope(line);
            if (!scope && !records.empty() && records.back().scope && records.back().callSite.empty()) {
                // An argument containing the delimiter split its header; glue the fragment back on
                auto &record = records.back();
                record.text = fmt::format("{}{}{}", record.text, format.delimiter, line);
                continue;
            }
            records.push_back({records.size(), std::string{line}, std::move(scope), {}});
        }

        for (size_t i = format.helperFrames; i < records.size(); ++i) {
            auto &record = records[i];
            if (!record.scope) {
                result.malformed.push_back({record.index, record.text, MalformedReason::OrphanLine});
                continue;
            }
            if (!record.callSite.empty() && !record.callSite.starts_with(kFishCallSitePrefix)) {
                // Entry points such as "called during startup" have no location
                continue;
            }

            // The call site is inside whatever scope the next header describes
            std::string function{kTopLevelFunction};
            for (size_t j = i + 1; j < records.size(); ++j) {
                if (records[j].scope) {
                    function = *records[j].scope;
                    break;
                }
            }

            Frame frame{};
            MalformedReason reason{};
            if (TryDecodeFishCallSite(record.callSite, function, frame, reason)) {
                result.frames.push_back(std::move(frame));
            } else {
                result.malformed.push_back({record.index, record.text, reason});
            }
        }
        return result;
    }

    // -------------------------------------------------------------------------
    // bash and zsh

    NormalizeResult NormalizeColonRecords(std::string_view raw, const TraceFormat &format) {
        NormalizeResult result{};
        const auto records = SplitRecords(raw, format.delimiter);
        for (size_t i = format.helperFrames; i < records.size(); ++i) {
            Frame frame{};
            MalformedReason reason{};
            if (TryDecodeColonRecord(records[i], frame, reason)) {
                result.frames.push_back(std::move(frame));
            } else {
                result.malformed.push_back({i, std::string{records[i]}, reason});
            }
        }
        return result;
    }

} // namespace

const TraceFormat &GetTraceFormat(shell::Dialect dialect) {
    switch (dialect) {
    case shell::Dialect::Bash: return kBashFormat;
    case shell::Dialect::Zsh: return kZshFormat;
    case shell::Dialect::Fish: return kFishFormat;
    }
    util::unreachable();
}

const char *GetMalformedReasonName(MalformedReason reason) {
    switch (reason) {
    case MalformedReason::MissingFields: return "missing fields";
    case MalformedReason::InvalidLine: return "invalid line number";
    case MalformedReason::EmptyPath: return "empty file path";
    case MalformedReason::OrphanLine: return "unexpected line";
    }
    return "unknown";
}

bool TryDecodeColonRecord(std::string_view record, Frame &frame, MalformedReason &reason) {
    // The line number is the first all-digit field, so colons in the function name are kept
    size_t sep = record.find(':');
    if (sep == std::string_view::npos) {
        reason = MalformedReason::MissingFields;
        return false;
    }
    while (sep != std::string_view::npos) {
        const size_t lineEnd = record.find(':', sep + 1);
        if (lineEnd == std::string_view::npos) {
            break;
        }
        const std::string_view lineText = record.substr(sep + 1, lineEnd - sep - 1);
        uint32 line = 0;
        if (ParseLineNumber(lineText, line)) {
            const std::string_view path = record.substr(0, sep);
            if (path.empty()) {
                reason = MalformedReason::EmptyPath;
                return false;
            }
            const std::string_view function = Trim(record.substr(lineEnd + 1));
            frame.file = ResolvePath(path);
            frame.line = line;
            frame.function = function.empty() ? std::string{kTopLevelFunction} : std::string{function};
            return true;
        }
        sep = lineEnd;
    }

    // Two colons but no usable number between any pair of them means the line field is broken; fewer means the
    // record was cut short.
    const size_t colons = std::count(record.begin(), record.end(), ':');
    reason = colons >= 2 ? MalformedReason::InvalidLine : MalformedReason::MissingFields;
    return false;
}

std::filesystem::path ResolvePath(std::string_view raw) {
    std::filesystem::path path{raw};
    if (path.is_absolute()) {
        return path.lexically_normal();
    }
    std::error_code error{};
    auto canonical = std::filesystem::canonical(path, error);
    if (error) {
        return path;
    }
    return canonical;
}

NormalizeResult NormalizeStack(shell::Dialect dialect, std::string_view raw) {
    const TraceFormat &format = GetTraceFormat(dialect);
    NormalizeResult result = dialect == shell::Dialect::Fish ? NormalizeFish(raw, format)
                                                             : NormalizeColonRecords(raw, format);

    for (const auto &malformed : result.malformed) {
        devlog::warn<grp::trace>("Dropping malformed {} stack record #{} ({}): {}", shell::GetDialectName(dialect),
                                 malformed.index, GetMalformedReasonName(malformed.reason), malformed.text);
    }
    devlog::debug<grp::trace>("Normalized {} stack: {} frames, {} dropped", shell::GetDialectName(dialect),
                              result.frames.size(), result.malformed.size());
    return result;
}

} // namespace shdbg::trace
