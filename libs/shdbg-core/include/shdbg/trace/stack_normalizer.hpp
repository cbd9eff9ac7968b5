#pragma once

/**
@file
@brief Converts the native stack traces captured by the shell wrappers into a `CallStack`.

Each dialect has its own wire format:

- bash and zsh: one record per line, `<path>:<line>:<function>`
- fish: the output of `status stack-trace` joined with `;`. A record is a scope header (`in function 'f' ...`,
  `from sourcing file ...`, `in command substitution`) followed by its call site (`called on line N of file P`).
  A call site belongs to the scope named by the next record's header.

The first few records of every trace belong to the wrapper itself (the tracepoint function and the helper that
captures the trace) and are skipped by a fixed per-dialect count.
*/

#include <shdbg/trace/frame.hpp>

#include <shdbg/shell/dialect.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace shdbg::trace {

/// @brief Wire format parameters of a dialect's stack trace.
struct TraceFormat {
    char delimiter;     ///< Record separator
    size_t helperFrames; ///< Number of leading records that belong to the wrapper
};

/// @brief Returns the trace format used by the wrapper of the given dialect.
const TraceFormat &GetTraceFormat(shell::Dialect dialect);

/// @brief Why a record could not be decoded.
enum class MalformedReason : uint8 {
    MissingFields, ///< Fewer than three fields, or a fish scope without a call site
    InvalidLine,   ///< Line number is not a positive integer
    EmptyPath,     ///< File path is empty
    OrphanLine,    ///< fish line that is neither a scope header nor a call site following one
};

const char *GetMalformedReasonName(MalformedReason reason);

/// @brief A record that was dropped from the call stack.
struct MalformedFrame {
    size_t index;     ///< Position of the record in the native trace, including helper records
    std::string text; ///< Raw record text
    MalformedReason reason;
};

struct NormalizeResult {
    CallStack frames;
    std::vector<MalformedFrame> malformed;
};

/// @brief Builds a call stack from a raw trace.
///
/// Malformed records are dropped and reported in `NormalizeResult::malformed`; the remaining records are kept in
/// order. Empty input produces an empty call stack.
///
/// @param[in] dialect the dialect that produced the trace
/// @param[in] raw the trace text exactly as passed by the wrapper
NormalizeResult NormalizeStack(shell::Dialect dialect, std::string_view raw);

/// @brief Decodes a single bash/zsh record.
/// @return `true` if the record is well-formed, in which case `frame` is filled in
bool TryDecodeColonRecord(std::string_view record, Frame &frame, MalformedReason &reason);

/// @brief Resolves a file path reported by the shell.
///
/// Absolute paths are normalized lexically. Relative paths are made canonical if the file exists and are returned
/// unchanged otherwise.
std::filesystem::path ResolvePath(std::string_view path);

} // namespace shdbg::trace
