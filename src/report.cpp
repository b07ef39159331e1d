#include "commitgate/report.hpp"

#include "commitgate/diff.hpp"

#include <cstdlib>
#include <unistd.h>

namespace commitgate {

namespace {

constexpr std::string_view kReset = "\033[0m";

std::string_view level_color(Level level) {
  switch (level) {
  case Level::Success:
    return "\033[32m";
  case Level::Warning:
    return "\033[33m";
  case Level::Error:
    return "\033[31m";
  case Level::Info:
    return "\033[34m";
  }
  return "";
}

} // namespace

std::string_view level_icon(Level level) {
  switch (level) {
  case Level::Success:
    return "✔";
  case Level::Warning:
    return "⚠";
  case Level::Error:
    return "✖";
  case Level::Info:
    return "→";
  }
  return "?";
}

bool Reporter::color_wanted(int fd) {
  const char *no_color = std::getenv("NO_COLOR");
  if (no_color && *no_color)
    return false;
  return ::isatty(fd) == 1;
}

void Reporter::line(Level level, std::string_view msg) {
  if (level == Level::Warning)
    ++warnings_;
  if (color_)
    out_ << level_color(level) << level_icon(level) << kReset;
  else
    out_ << level_icon(level);
  out_ << ' ' << msg << '\n';
}

void Reporter::detail(std::string_view msg) { out_ << "    " << msg << '\n'; }

void Reporter::tool_output(std::string_view text, std::size_t max_lines) {
  const auto lines = diff::split_lines(text);
  std::size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0;
  if (first > 0)
    detail("... (" + std::to_string(first) + " earlier lines omitted)");
  for (std::size_t i = first; i < lines.size(); ++i)
    detail(lines[i]);
}

void Reporter::advisory(const Finding &f) {
  ++advisories_;
  std::string msg(advisory_name(f.kind));
  if (!f.path.empty()) {
    msg += ": " + f.path;
    if (f.line_no > 0)
      msg += ":" + std::to_string(f.line_no);
  }
  if (!f.detail.empty())
    msg += " (" + f.detail + ")";
  warning(msg);
}

} // namespace commitgate
