#include "commitgate/diff.hpp"

#include <charconv>

namespace commitgate::diff {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : text) {
    if (c == '\n') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

namespace {

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

// "@@ -12,3 +40,7 @@ func x()" -> 40
std::size_t new_start_of_hunk(std::string_view header) {
  const auto plus = header.find('+');
  if (plus == std::string_view::npos)
    return 1;
  const char *first = header.data() + plus + 1;
  const char *last = header.data() + header.size();
  std::size_t start = 1;
  if (std::from_chars(first, last, start).ec != std::errc{})
    return 1;
  return start;
}

bool is_octal(char c) { return c >= '0' && c <= '7'; }

// Body of a git C-quoted path, starting after the opening quote. Stops at
// the closing quote; octal escapes are raw bytes (UTF-8 names arrive that way).
std::string c_unquote(std::string_view body) {
  std::string out;
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (c == '"')
      break;
    if (c != '\\' || i + 1 == body.size()) {
      out.push_back(c);
      continue;
    }
    const char e = body[++i];
    switch (e) {
    case 'a': out.push_back('\a'); break;
    case 'b': out.push_back('\b'); break;
    case 'f': out.push_back('\f'); break;
    case 'n': out.push_back('\n'); break;
    case 'r': out.push_back('\r'); break;
    case 't': out.push_back('\t'); break;
    case 'v': out.push_back('\v'); break;
    default:
      if (i + 2 < body.size() && is_octal(e) && is_octal(body[i + 1]) && is_octal(body[i + 2])) {
        const int v = (e - '0') * 64 + (body[i + 1] - '0') * 8 + (body[i + 2] - '0');
        out.push_back(static_cast<char>(v));
        i += 2;
      } else {
        out.push_back(e); // \\ and \"
      }
    }
  }
  return out;
}

// Strip the "b/" prefix git adds, and the quoting it uses for unusual names.
std::string new_side_path(std::string_view raw) {
  std::string path;
  if (!raw.empty() && raw.front() == '"') {
    path = c_unquote(raw.substr(1));
  } else {
    if (const auto tab = raw.find('\t'); tab != std::string_view::npos)
      raw = raw.substr(0, tab);
    path = std::string(raw);
  }
  if (starts_with(path, "b/"))
    path.erase(0, 2);
  return path;
}

} // namespace

std::vector<FileDelta> parse_unified(std::string_view text) {
  std::vector<FileDelta> out;
  FileDelta *current = nullptr;
  bool in_hunk = false;
  std::size_t line_no = 0;

  for (const auto &line : split_lines(text)) {
    const std::string_view sv{line};

    if (starts_with(sv, "diff --git ")) {
      current = nullptr;
      in_hunk = false;
      continue;
    }
    if (!in_hunk && starts_with(sv, "+++ ")) {
      const auto target = sv.substr(4);
      if (target == "/dev/null") {
        current = nullptr;
      } else {
        out.push_back(FileDelta{.path = new_side_path(target), .added = {}});
        current = &out.back();
      }
      continue;
    }
    if (starts_with(sv, "@@")) {
      in_hunk = current != nullptr;
      line_no = new_start_of_hunk(sv);
      continue;
    }
    if (!in_hunk || current == nullptr)
      continue;

    if (!sv.empty() && sv.front() == '+') {
      current->added.push_back(AddedLine{.line_no = line_no, .text = std::string(sv.substr(1))});
      ++line_no;
    } else if (!sv.empty() && sv.front() == ' ') {
      ++line_no;
    } else if (sv.empty()) {
      // an empty context line whose leading space was stripped
      ++line_no;
    }
    // '-' lines and "\ No newline at end of file" do not advance the new side
  }
  return out;
}

} // namespace commitgate::diff
