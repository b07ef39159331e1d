#include "commitgate/config.hpp"

#include "commitgate/consts.hpp"
#include "commitgate/fs.hpp"

#include <sstream>
#include <stdexcept>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace

namespace commitgate {

std::filesystem::path cfg_path(const std::filesystem::path &repo_root) {
  return repo_root / consts::kConfigFile;
}

GateConfig parse_gate_config(std::string_view text) {
  GateConfig out{};
  bool debug_seen = false;
  bool todo_seen = false;

  std::istringstream iss{std::string(text)};
  std::string line;
  int line_no = 0;
  while (std::getline(iss, line)) {
    ++line_no;
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#')
      continue; // allow comments

    const auto colon = t.find(':');
    if (colon == std::string::npos) {
      throw std::runtime_error("config line " + std::to_string(line_no) +
                               ": expected `key: value`");
    }
    const std::string key = trim(std::string_view(t).substr(0, colon));
    std::string value = trim(std::string_view(t).substr(colon + 1));

    auto required = [&](std::string &field) {
      if (value.empty())
        throw std::runtime_error("config line " + std::to_string(line_no) + ": `" + key +
                                 "` needs a value");
      field = std::move(value);
    };

    if (key == "marker") {
      required(out.marker);
    } else if (key == "require") {
      required(out.required_tool);
    } else if (key == "tidy") {
      required(out.tidy);
    } else if (key == "format") {
      required(out.format);
    } else if (key == "lint") {
      out.lint = std::move(value);
    } else if (key == "vet") {
      required(out.vet);
    } else if (key == "test") {
      required(out.test);
    } else if (key == "source_ext") {
      out.source_ext = std::move(value);
    } else if (key == "debug_pattern") {
      if (!debug_seen)
        out.debug_patterns.clear();
      debug_seen = true;
      if (!value.empty())
        out.debug_patterns.push_back(std::move(value));
    } else if (key == "todo_pattern") {
      if (!todo_seen)
        out.todo_patterns.clear();
      todo_seen = true;
      if (!value.empty())
        out.todo_patterns.push_back(std::move(value));
    } else if (key == "message_file") {
      out.message_file = std::move(value);
    } else {
      throw std::runtime_error("config line " + std::to_string(line_no) + ": unknown key `" +
                               key + "`");
    }
  }
  return out;
}

auto load_gate_config(const std::filesystem::path &repo_root) -> GateConfig {
  const auto path = cfg_path(repo_root);
  if (!fs::exists(path))
    return GateConfig{};
  try {
    return parse_gate_config(fs::read_text(path));
  } catch (const std::runtime_error &e) {
    throw std::runtime_error(path.string() + ": " + e.what());
  }
}

std::string render_gate_config(const GateConfig &cfg) {
  std::ostringstream os;
  os << "# commitgate configuration\n";
  os << "marker: " << cfg.marker << '\n';
  os << "require: " << cfg.required_tool << '\n';
  os << "tidy: " << cfg.tidy << '\n';
  os << "format: " << cfg.format << '\n';
  os << "lint: " << cfg.lint << '\n';
  os << "vet: " << cfg.vet << '\n';
  os << "test: " << cfg.test << '\n';
  os << "source_ext: " << cfg.source_ext << '\n';
  // A bare key clears the defaults, so an empty list survives a reload.
  if (cfg.debug_patterns.empty())
    os << "debug_pattern:\n";
  for (const auto &p : cfg.debug_patterns)
    os << "debug_pattern: " << p << '\n';
  if (cfg.todo_patterns.empty())
    os << "todo_pattern:\n";
  for (const auto &p : cfg.todo_patterns)
    os << "todo_pattern: " << p << '\n';
  if (!cfg.message_file.empty())
    os << "message_file: " << cfg.message_file << '\n';
  return os.str();
}

void save_gate_config(const std::filesystem::path &repo_root, const GateConfig &cfg) {
  fs::write_text_atomic(cfg_path(repo_root), render_gate_config(cfg));
}

} // namespace commitgate
