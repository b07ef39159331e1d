#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace commitgate {

struct Command {
  std::vector<std::string> argv;   // argv[0] is the program, resolved via PATH
  std::filesystem::path cwd;       // empty = inherit
  std::string input;               // written to stdin; empty = /dev/null
};

struct ProcessResult {
  bool launched = false;
  int exit_code = -1;              // 127 if exec failed, 128+N if killed by signal N
  bool timed_out = false;
  std::string out;
  std::string err;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] bool ok() const { return launched && !timed_out && exit_code == 0; }
};

// Resolve a program name the way execvp does. Names containing '/' are
// checked as given; otherwise each PATH entry is tried in order.
std::optional<std::filesystem::path> find_executable(std::string_view name);

// Spawn, capture stdout/stderr and wait for the child to exit. Output still
// buffered at exit is collected; descendants holding the pipes are not waited
// for. A zero timeout means no bound; on expiry the child gets SIGKILL and
// `timed_out` is set.
// Throws std::runtime_error only if pipes or fork cannot be created.
ProcessResult run_process(const Command &cmd,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

// Split "go vet ./..." into argv. Single and double quotes group words.
std::vector<std::string> split_command(std::string_view text);

// Render argv for messages; inverse of split_command for simple words.
std::string join_command(const std::vector<std::string> &argv);

// Seam between the pipeline and the operating system.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  virtual bool resolvable(std::string_view program) const = 0;
  virtual ProcessResult run(const Command &cmd, std::chrono::milliseconds timeout) = 0;
};

class SystemRunner final : public CommandRunner {
public:
  bool resolvable(std::string_view program) const override;
  ProcessResult run(const Command &cmd, std::chrono::milliseconds timeout) override;
};

} // namespace commitgate
