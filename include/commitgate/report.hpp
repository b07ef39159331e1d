#pragma once
#include "commitgate/scan.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace commitgate {

enum class Level : std::uint8_t { Success, Warning, Error, Info };

// One categorized status line per check, with a fixed icon per level.
class Reporter {
public:
  Reporter(std::ostream &out, bool color) : out_(out), color_(color) {}

  // Color only for a terminal, and never when NO_COLOR is set.
  static bool color_wanted(int fd);

  void line(Level level, std::string_view msg);
  void success(std::string_view msg) { line(Level::Success, msg); }
  void warning(std::string_view msg) { line(Level::Warning, msg); }
  void error(std::string_view msg) { line(Level::Error, msg); }
  void info(std::string_view msg) { line(Level::Info, msg); }

  // Indented continuation line under the previous status line.
  void detail(std::string_view msg);

  // Tail of a failed tool's output, indented.
  void tool_output(std::string_view text, std::size_t max_lines);

  void advisory(const Finding &f);

  [[nodiscard]] std::size_t warnings() const { return warnings_; }
  [[nodiscard]] std::size_t advisories() const { return advisories_; }

private:
  std::ostream &out_;
  bool color_;
  std::size_t warnings_ = 0;
  std::size_t advisories_ = 0;
};

std::string_view level_icon(Level level);

} // namespace commitgate
