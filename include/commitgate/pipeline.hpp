#pragma once
#include "commitgate/config.hpp"
#include "commitgate/consts.hpp"
#include "commitgate/process.hpp"
#include "commitgate/repo.hpp"
#include "commitgate/report.hpp"
#include "commitgate/scan.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace commitgate {

// Fixed order: the first six are hard gates, the last two advisories.
enum class Stage : std::uint8_t {
  Precondition,
  Tidy,
  Format,
  Lint,
  Vet,
  Test,
  ContentScan,
  MessageCheck,
};

enum class ErrorKind : std::uint8_t { Environment, Tool, Format, Lint, Vet, Test };

enum class StageStatus : std::uint8_t { Passed, Failed, Skipped };

std::string_view stage_name(Stage stage);
std::string_view error_kind_name(ErrorKind kind);
std::string_view status_name(StageStatus status);
[[nodiscard]] bool is_hard_gate(Stage stage);

struct GateError {
  ErrorKind kind;
  Stage stage;
  std::string reason;
  std::string hint;
};

struct StageReport {
  Stage stage;
  StageStatus status;
};

struct Outcome {
  std::optional<GateError> failure;
  std::vector<StageReport> stages;   // in execution order
  std::vector<Finding> advisories;

  [[nodiscard]] bool ok() const { return !failure.has_value(); }
  [[nodiscard]] bool ran(Stage stage) const;
  [[nodiscard]] std::optional<StageStatus> status_of(Stage stage) const;
};

struct PipelineOptions {
  std::optional<std::filesystem::path> message_file;   // overrides the config
  std::chrono::milliseconds lint_timeout = consts::kLintTimeout;
};

// Stateless between runs; every run() re-reads the environment.
class Pipeline {
public:
  Pipeline(Repository repo, GateConfig cfg, CommandRunner &runner, Reporter &reporter,
           PipelineOptions opts = {});

  // Hard gates with fail-fast, then the advisories. Never throws for a stage
  // failure; the failing stage is in Outcome::failure.
  Outcome run();

  // Content scan and commit-message check only.
  Outcome run_advisories();

private:
  struct StageResult {
    StageStatus status = StageStatus::Passed;
    std::optional<GateError> error;
  };

  StageResult run_gate(Stage stage);
  StageResult check_environment();
  StageResult run_tool(Stage stage, ErrorKind kind, const std::string &command_text,
                       std::chrono::milliseconds timeout, std::string_view ok_msg,
                       std::string_view hint);
  StageResult check_format();
  StageResult run_lint();
  StageResult scan_content(Outcome &outcome);
  StageResult check_message(Outcome &outcome);
  void advisories(Outcome &outcome);

  StageResult fail(ErrorKind kind, Stage stage, std::string reason, std::string hint);
  void report_failure(const GateError &err);
  [[nodiscard]] std::filesystem::path message_path() const;

  Repository repo_;
  GateConfig cfg_;
  CommandRunner &runner_;
  Reporter &reporter_;
  PipelineOptions opts_;
};

} // namespace commitgate
