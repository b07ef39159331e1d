#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace commitgate::diff {

struct AddedLine {
  std::size_t line_no;   // 1-based line number in the new file
  std::string text;      // without the leading '+'
};

struct FileDelta {
  std::string path;                 // new-side path ("b/" prefix stripped)
  std::vector<AddedLine> added;
};

// Parse `git diff` unified output. Only added lines are kept; deleted files
// (+++ /dev/null) produce no entry.
std::vector<FileDelta> parse_unified(std::string_view text);

// Utility to split raw text into lines (keeps newlines trimmed).
std::vector<std::string> split_lines(std::string_view text);

} // namespace commitgate::diff
