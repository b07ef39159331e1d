#include "commitgate/scan.hpp"

#include "commitgate/staged.hpp"

#include <cctype>

namespace commitgate {

std::string_view advisory_name(AdvisoryKind kind) {
  switch (kind) {
  case AdvisoryKind::DebugStatement:
    return "debug statement";
  case AdvisoryKind::TodoMarker:
    return "todo marker";
  case AdvisoryKind::LargeFile:
    return "large file";
  case AdvisoryKind::ShortMessage:
    return "short commit message";
  }
  return "advisory";
}

bool has_extension(std::string_view path, std::string_view ext) {
  if (ext.empty())
    return true;
  return path.size() >= ext.size() && path.substr(path.size() - ext.size()) == ext;
}

namespace {

std::vector<Finding> scan_added_lines(const std::vector<diff::FileDelta> &deltas,
                                      const std::vector<std::string> &patterns,
                                      std::string_view ext, AdvisoryKind kind) {
  std::vector<Finding> out;
  for (const auto &delta : deltas) {
    if (!has_extension(delta.path, ext))
      continue;
    for (const auto &line : delta.added) {
      for (const auto &pat : patterns) {
        if (pat.empty() || line.text.find(pat) == std::string::npos)
          continue;
        out.push_back(
            Finding{.kind = kind, .path = delta.path, .line_no = line.line_no, .detail = pat});
        break;
      }
    }
  }
  return out;
}

} // namespace

std::vector<Finding> scan_debug_statements(const std::vector<diff::FileDelta> &deltas,
                                           const std::vector<std::string> &patterns,
                                           std::string_view ext) {
  return scan_added_lines(deltas, patterns, ext, AdvisoryKind::DebugStatement);
}

std::vector<Finding> scan_todo_markers(const std::vector<diff::FileDelta> &deltas,
                                       const std::vector<std::string> &patterns,
                                       std::string_view ext) {
  return scan_added_lines(deltas, patterns, ext, AdvisoryKind::TodoMarker);
}

std::vector<Finding> check_file_sizes(const std::vector<StagedFile> &files, std::uint64_t limit) {
  std::vector<Finding> out;
  for (const auto &f : files) {
    if (f.size > limit) {
      out.push_back(Finding{.kind = AdvisoryKind::LargeFile,
                            .path = f.path,
                            .line_no = 0,
                            .detail = std::to_string(f.size) + " bytes"});
    }
  }
  return out;
}

std::size_t utf8_length(std::string_view text) {
  std::size_t n = 0;
  for (const char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
      ++n;
  }
  return n;
}

std::string normalize_commit_message(std::string_view raw) {
  std::string out;
  for (const auto &line : diff::split_lines(raw)) {
    if (!line.empty() && line.front() == '#')
      continue;
    out += line;
    out.push_back('\n');
  }
  while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back())))
    out.pop_back();
  return out;
}

std::optional<Finding> check_commit_message(const std::optional<std::string> &raw,
                                            std::size_t min_chars) {
  if (!raw)
    return std::nullopt;
  const auto n = utf8_length(normalize_commit_message(*raw));
  if (n >= min_chars)
    return std::nullopt;
  return Finding{.kind = AdvisoryKind::ShortMessage,
                 .path = {},
                 .line_no = 0,
                 .detail = std::to_string(n) + " characters"};
}

} // namespace commitgate
