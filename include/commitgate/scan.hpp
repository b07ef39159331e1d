#pragma once
#include "commitgate/diff.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace commitgate {

struct StagedFile;

enum class AdvisoryKind : std::uint8_t { DebugStatement, TodoMarker, LargeFile, ShortMessage };

struct Finding {
  AdvisoryKind kind;
  std::string path;         // empty for the commit message
  std::size_t line_no = 0;  // 0 when not line-based
  std::string detail;       // matched pattern, size, or message length
};

std::string_view advisory_name(AdvisoryKind kind);

// True if `path` ends with `ext` (".go"); an empty ext matches every path.
bool has_extension(std::string_view path, std::string_view ext);

// Fixed-substring matching over added lines of files with the source extension.
// One finding per (line, first matching pattern).
std::vector<Finding> scan_debug_statements(const std::vector<diff::FileDelta> &deltas,
                                           const std::vector<std::string> &patterns,
                                           std::string_view ext);
std::vector<Finding> scan_todo_markers(const std::vector<diff::FileDelta> &deltas,
                                       const std::vector<std::string> &patterns,
                                       std::string_view ext);

// Size strictly above `limit` warns.
std::vector<Finding> check_file_sizes(const std::vector<StagedFile> &files, std::uint64_t limit);

// Number of UTF-8 code points (continuation bytes are not counted).
std::size_t utf8_length(std::string_view text);

// Drop '#' comment lines and trailing whitespace, as git does when it
// finalizes a message edited in COMMIT_EDITMSG.
std::string normalize_commit_message(std::string_view raw);

// No finding when the message is absent; otherwise warn below `min_chars`.
std::optional<Finding> check_commit_message(const std::optional<std::string> &raw,
                                            std::size_t min_chars);

} // namespace commitgate
