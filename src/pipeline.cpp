#include "commitgate/pipeline.hpp"

#include "commitgate/diff.hpp"
#include "commitgate/fs.hpp"
#include "commitgate/staged.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace commitgate {

std::string_view stage_name(Stage stage) {
  switch (stage) {
  case Stage::Precondition:
    return "precondition";
  case Stage::Tidy:
    return "manifest";
  case Stage::Format:
    return "format";
  case Stage::Lint:
    return "lint";
  case Stage::Vet:
    return "vet";
  case Stage::Test:
    return "test";
  case Stage::ContentScan:
    return "content-scan";
  case Stage::MessageCheck:
    return "commit-message";
  }
  return "unknown";
}

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Environment:
    return "EnvironmentError";
  case ErrorKind::Tool:
    return "ToolError";
  case ErrorKind::Format:
    return "FormatError";
  case ErrorKind::Lint:
    return "LintError";
  case ErrorKind::Vet:
    return "VetError";
  case ErrorKind::Test:
    return "TestError";
  }
  return "Error";
}

std::string_view status_name(StageStatus status) {
  switch (status) {
  case StageStatus::Passed:
    return "passed";
  case StageStatus::Failed:
    return "failed";
  case StageStatus::Skipped:
    return "skipped";
  }
  return "unknown";
}

bool is_hard_gate(Stage stage) {
  return stage != Stage::ContentScan && stage != Stage::MessageCheck;
}

bool Outcome::ran(Stage stage) const { return status_of(stage).has_value(); }

std::optional<StageStatus> Outcome::status_of(Stage stage) const {
  const auto it =
      std::ranges::find_if(stages, [&](const StageReport &r) { return r.stage == stage; });
  if (it == stages.end())
    return std::nullopt;
  return it->status;
}

Pipeline::Pipeline(Repository repo, GateConfig cfg, CommandRunner &runner, Reporter &reporter,
                   PipelineOptions opts)
    : repo_(std::move(repo)), cfg_(std::move(cfg)), runner_(runner), reporter_(reporter),
      opts_(std::move(opts)) {}

Outcome Pipeline::run() {
  static constexpr std::array kGates = {Stage::Precondition, Stage::Tidy, Stage::Format,
                                        Stage::Lint,         Stage::Vet,  Stage::Test};
  Outcome outcome;
  for (const Stage stage : kGates) {
    auto res = run_gate(stage);
    outcome.stages.push_back(StageReport{.stage = stage, .status = res.status});
    if (res.error) {
      report_failure(*res.error);
      outcome.failure = std::move(res.error);
      return outcome;
    }
  }

  advisories(outcome);

  std::string banner = "all checks passed, ready to commit";
  if (!outcome.advisories.empty())
    banner += " (" + std::to_string(outcome.advisories.size()) + " advisory warnings)";
  reporter_.success(banner);
  return outcome;
}

Outcome Pipeline::run_advisories() {
  Outcome outcome;
  advisories(outcome);
  if (outcome.advisories.empty())
    reporter_.success("no advisory findings");
  else
    reporter_.warning(std::to_string(outcome.advisories.size()) + " advisory warnings");
  return outcome;
}

void Pipeline::advisories(Outcome &outcome) {
  auto scan = scan_content(outcome);
  outcome.stages.push_back(StageReport{.stage = Stage::ContentScan, .status = scan.status});
  auto msg = check_message(outcome);
  outcome.stages.push_back(StageReport{.stage = Stage::MessageCheck, .status = msg.status});
}

Pipeline::StageResult Pipeline::run_gate(Stage stage) {
  switch (stage) {
  case Stage::Precondition:
    return check_environment();
  case Stage::Tidy:
    return run_tool(stage, ErrorKind::Tool, cfg_.tidy, std::chrono::milliseconds{0},
                    "dependency manifest is tidy",
                    "check the dependency manifest and network access, then retry");
  case Stage::Format:
    return check_format();
  case Stage::Lint:
    return run_lint();
  case Stage::Vet:
    return run_tool(stage, ErrorKind::Vet, cfg_.vet, std::chrono::milliseconds{0},
                    "static analysis passed", "fix the reported issues before committing");
  case Stage::Test:
    return run_tool(stage, ErrorKind::Test, cfg_.test, std::chrono::milliseconds{0},
                    "tests passed", "fix the failing tests before committing");
  case Stage::ContentScan:
  case Stage::MessageCheck:
    break;
  }
  throw std::logic_error("run_gate: not a hard gate");
}

Pipeline::StageResult Pipeline::fail(ErrorKind kind, Stage stage, std::string reason,
                                     std::string hint) {
  return StageResult{.status = StageStatus::Failed,
                     .error = GateError{.kind = kind,
                                        .stage = stage,
                                        .reason = std::move(reason),
                                        .hint = std::move(hint)}};
}

void Pipeline::report_failure(const GateError &err) {
  if (!err.hint.empty())
    reporter_.detail("hint: " + err.hint);
  reporter_.error("commit blocked: " + std::string(stage_name(err.stage)) + " failed (" +
                  std::string(error_kind_name(err.kind)) + ": " + err.reason + ")");
}

Pipeline::StageResult Pipeline::check_environment() {
  const auto marker = repo_.root() / cfg_.marker;
  if (!fs::exists(marker)) {
    reporter_.error("project marker " + cfg_.marker + " not found in " + repo_.root().string());
    return fail(ErrorKind::Environment, Stage::Precondition, "missing " + cfg_.marker,
                "run the commit from the project root");
  }
  if (!runner_.resolvable(cfg_.required_tool)) {
    reporter_.error(cfg_.required_tool + " is not installed or not on PATH");
    return fail(ErrorKind::Environment, Stage::Precondition,
                cfg_.required_tool + " not found",
                "install " + cfg_.required_tool + " and make sure it is on PATH");
  }
  reporter_.success("environment ok (" + cfg_.marker + ", " + cfg_.required_tool + ")");
  return {};
}

Pipeline::StageResult Pipeline::run_tool(Stage stage, ErrorKind kind,
                                         const std::string &command_text,
                                         std::chrono::milliseconds timeout,
                                         std::string_view ok_msg, std::string_view hint) {
  ProcessResult res;
  try {
    const Command cmd{.argv = split_command(command_text), .cwd = repo_.root()};
    if (cmd.argv.empty())
      throw std::runtime_error("empty command");
    res = runner_.run(cmd, timeout);
  } catch (const std::exception &e) {
    reporter_.error(command_text + ": " + e.what());
    return fail(kind, stage, e.what(), std::string(hint));
  }

  if (res.ok()) {
    reporter_.success(std::string(ok_msg) + " (" + command_text + ")");
    return {};
  }

  std::string reason;
  if (!res.launched)
    reason = "could not start " + command_text;
  else if (res.timed_out)
    reason = "timed out after " +
             std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout).count()) +
             "s";
  else
    reason = "exit status " + std::to_string(res.exit_code);

  reporter_.error(command_text + ": " + reason);
  reporter_.tool_output(res.out + res.err, consts::kToolOutputTail);
  return fail(kind, stage, reason, std::string(hint));
}

Pipeline::StageResult Pipeline::check_format() {
  ProcessResult res;
  try {
    const Command cmd{.argv = split_command(cfg_.format), .cwd = repo_.root()};
    if (cmd.argv.empty())
      throw std::runtime_error("empty command");
    res = runner_.run(cmd, std::chrono::milliseconds{0});
  } catch (const std::exception &e) {
    reporter_.error(cfg_.format + ": " + e.what());
    return fail(ErrorKind::Format, Stage::Format, e.what(), "check the format command");
  }

  if (!res.ok()) {
    const std::string reason = res.timed_out
                                   ? "formatter timed out"
                                   : "formatter exit status " + std::to_string(res.exit_code);
    reporter_.error(cfg_.format + ": " + reason);
    reporter_.tool_output(res.out + res.err, consts::kToolOutputTail);
    return fail(ErrorKind::Format, Stage::Format, reason, "fix the syntax errors reported above");
  }

  std::vector<std::string> unformatted;
  for (auto &line : diff::split_lines(res.out)) {
    if (line.find_first_not_of(" \t") != std::string::npos)
      unformatted.push_back(std::move(line));
  }
  if (unformatted.empty()) {
    reporter_.success("code is formatted (" + cfg_.format + ")");
    return {};
  }

  reporter_.warning(std::to_string(unformatted.size()) + " files are not formatted:");
  for (const auto &f : unformatted)
    reporter_.detail(f);
  return fail(ErrorKind::Format, Stage::Format,
              std::to_string(unformatted.size()) + " files need formatting",
              "format the listed files and stage them again");
}

Pipeline::StageResult Pipeline::run_lint() {
  std::vector<std::string> argv;
  try {
    argv = split_command(cfg_.lint);
  } catch (const std::exception &e) {
    reporter_.error(cfg_.lint + ": " + e.what());
    return fail(ErrorKind::Lint, Stage::Lint, e.what(), "check the lint command");
  }
  if (argv.empty()) {
    reporter_.warning("lint disabled in configuration, skipping");
    return StageResult{.status = StageStatus::Skipped, .error = std::nullopt};
  }
  if (!runner_.resolvable(argv.front())) {
    reporter_.warning(argv.front() + " not installed, skipping lint");
    return StageResult{.status = StageStatus::Skipped, .error = std::nullopt};
  }
  return run_tool(Stage::Lint, ErrorKind::Lint, cfg_.lint, opts_.lint_timeout, "lint passed",
                  "fix the lint findings before committing");
}

Pipeline::StageResult Pipeline::scan_content(Outcome &outcome) {
  StagedSet staged;
  try {
    staged = StagedSet::collect(runner_, repo_);
  } catch (const std::exception &e) {
    reporter_.warning(std::string("content scan skipped: ") + e.what());
    return StageResult{.status = StageStatus::Skipped, .error = std::nullopt};
  }
  if (staged.empty()) {
    reporter_.info("no staged files to scan");
    return {};
  }

  const auto deltas = staged.deltas();
  std::vector<Finding> found =
      scan_debug_statements(deltas, cfg_.debug_patterns, cfg_.source_ext);
  auto todos = scan_todo_markers(deltas, cfg_.todo_patterns, cfg_.source_ext);
  found.insert(found.end(), todos.begin(), todos.end());
  auto large =
      check_file_sizes(staged.with_extension(cfg_.source_ext), consts::kLargeFileBytes);
  found.insert(found.end(), large.begin(), large.end());

  if (found.empty()) {
    reporter_.success("staged changes look clean (" + std::to_string(staged.files().size()) +
                      " files)");
  }
  for (auto &f : found) {
    reporter_.advisory(f);
    outcome.advisories.push_back(std::move(f));
  }
  return {};
}

std::filesystem::path Pipeline::message_path() const {
  if (opts_.message_file)
    return *opts_.message_file;
  if (!cfg_.message_file.empty()) {
    std::filesystem::path p = cfg_.message_file;
    return p.is_absolute() ? p : repo_.root() / p;
  }
  return repo_.commit_msg_file();
}

Pipeline::StageResult Pipeline::check_message(Outcome &outcome) {
  const auto path = message_path();
  std::optional<std::string> text;
  if (fs::exists(path)) {
    try {
      text = fs::read_text(path);
    } catch (const std::exception &e) {
      reporter_.warning(std::string("commit message unreadable: ") + e.what());
      return StageResult{.status = StageStatus::Skipped, .error = std::nullopt};
    }
  }
  if (!text) {
    reporter_.info("no pending commit message");
    return {};
  }
  if (auto f = check_commit_message(text, consts::kMinMessageChars)) {
    reporter_.advisory(*f);
    outcome.advisories.push_back(std::move(*f));
  } else {
    reporter_.success("commit message length ok");
  }
  return {};
}

} // namespace commitgate
