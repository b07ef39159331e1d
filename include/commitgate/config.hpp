#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace commitgate {

// Tool commands and scan patterns, read from `.commitgate` at the repo root.
// Defaults target a Go module.
struct GateConfig {
  std::string marker = "go.mod";         // project-marker file, relative to the root
  std::string required_tool = "go";
  std::string tidy = "go mod tidy";
  std::string format = "gofmt -l .";    // must list non-conforming files, one per line
  std::string lint = "golangci-lint run --timeout=5m"; // empty disables the stage
  std::string vet = "go vet ./...";
  std::string test = "go test ./...";
  std::string source_ext = ".go";
  std::vector<std::string> debug_patterns{"fmt.Print", "log.Print", "println(", "spew.Dump"};
  std::vector<std::string> todo_patterns{"TODO", "FIXME", "XXX"};
  std::string message_file;              // empty = <gitdir>/COMMIT_EDITMSG
};

// Parse "key: value" lines; '#' starts a comment line. Repeated
// debug_pattern/todo_pattern keys accumulate, replacing the defaults.
// Throws std::runtime_error on unknown keys or malformed lines.
GateConfig parse_gate_config(std::string_view text);

// Defaults if the file is missing.
GateConfig load_gate_config(const std::filesystem::path& repo_root);

std::string render_gate_config(const GateConfig& cfg);

// Overwrite `.commitgate` with the given configuration
void save_gate_config(const std::filesystem::path& repo_root, const GateConfig& cfg);

} // namespace commitgate
