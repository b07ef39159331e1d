#include "commitgate/config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using commitgate::GateConfig;

int main() {
  // Defaults target a Go module
  const GateConfig d{};
  if (d.marker != "go.mod" || d.required_tool != "go" || d.format != "gofmt -l ." ||
      d.source_ext != ".go" || d.todo_patterns.size() != 3) {
    std::cerr << "unexpected defaults\n";
    return 1;
  }

  // Parsing: comments, whitespace, repeated pattern keys replace the defaults
  const auto cfg = commitgate::parse_gate_config("# project gate\n"
                                                 "marker:  Cargo.toml\r\n"
                                                 "require: cargo\n"
                                                 "test: cargo test --all\n"
                                                 "lint:\n"
                                                 "source_ext: .rs\n"
                                                 "debug_pattern: dbg!(\n"
                                                 "debug_pattern: eprintln!(\n"
                                                 "\n");
  if (cfg.marker != "Cargo.toml" || cfg.required_tool != "cargo" ||
      cfg.test != "cargo test --all" || !cfg.lint.empty() || cfg.source_ext != ".rs") {
    std::cerr << "parsed values wrong\n";
    return 1;
  }
  if (cfg.debug_patterns.size() != 2 || cfg.debug_patterns[0] != "dbg!(" ||
      cfg.debug_patterns[1] != "eprintln!(") {
    std::cerr << "debug patterns not replaced\n";
    return 1;
  }
  if (cfg.todo_patterns != d.todo_patterns || cfg.vet != d.vet) {
    std::cerr << "untouched keys lost their defaults\n";
    return 1;
  }

  // Errors name the line
  for (const char *bad : {"marker: go.mod\nbogus: 1\n", "just words\n", "test:\n"}) {
    bool threw = false;
    try {
      (void)commitgate::parse_gate_config(bad);
    } catch (const std::runtime_error &e) {
      threw = std::string(e.what()).find("config line") != std::string::npos;
    }
    if (!threw) {
      std::cerr << "accepted bad config: " << bad << "\n";
      return 1;
    }
  }

  // Load/save against a directory
  const fs::path root =
      fs::temp_directory_path() / ("commitgate_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  int rc = 0;
  try {
    const auto missing = commitgate::load_gate_config(root);
    if (missing.test != d.test) {
      std::cerr << "missing file did not give defaults\n";
      return 1;
    }
    commitgate::save_gate_config(root, cfg);
    const auto back = commitgate::load_gate_config(root);
    if (back.marker != cfg.marker || back.debug_patterns != cfg.debug_patterns ||
        back.lint != cfg.lint) {
      std::cerr << "saved config did not load back\n";
      return 1;
    }

    // Emptied pattern lists stay empty after a save and reload
    GateConfig quiet;
    quiet.debug_patterns.clear();
    quiet.todo_patterns.clear();
    commitgate::save_gate_config(root, quiet);
    const auto quiet_back = commitgate::load_gate_config(root);
    if (!quiet_back.debug_patterns.empty() || !quiet_back.todo_patterns.empty() ||
        quiet_back.test != quiet.test) {
      std::cerr << "empty pattern lists came back as defaults\n";
      return 1;
    }

    std::ofstream(root / ".commitgate") << "unknown_key: x\n";
    bool threw = false;
    try {
      (void)commitgate::load_gate_config(root);
    } catch (const std::runtime_error &e) {
      threw = std::string(e.what()).find(".commitgate") != std::string::npos;
    }
    if (!threw) {
      std::cerr << "load error does not name the file\n";
      return 1;
    }
    std::cout << "config OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return rc;
}
