#include "commitgate/config.hpp"
#include "commitgate/consts.hpp"
#include "commitgate/pipeline.hpp"
#include "commitgate/process.hpp"
#include "commitgate/repo.hpp"
#include "commitgate/report.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace commitgate;

int cmd_run(int argc, char **argv) {
  bool no_color = false;
  PipelineOptions opts;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--no-color") {
      no_color = true;
    } else if (a == "--message-file" && i + 1 < argc) {
      opts.message_file = std::filesystem::absolute(argv[++i]);
    } else {
      std::cerr << "usage: commitgate run [--no-color] [--message-file <path>]\n";
      return consts::kExitUsage;
    }
  }

  const auto repo = Repository::discover(std::filesystem::current_path());
  if (!repo) {
    std::cerr << "run: not inside a git working tree\n";
    return consts::kExitBlocked;
  }

  try {
    const GateConfig cfg = load_gate_config(repo->root());
    Reporter reporter{std::cout, !no_color && Reporter::color_wanted(STDOUT_FILENO)};
    SystemRunner runner;
    Pipeline pipeline{*repo, cfg, runner, reporter, opts};
    const Outcome outcome = pipeline.run();
    return outcome.ok() ? consts::kExitOk : consts::kExitBlocked;
  } catch (const std::exception &e) {
    std::cerr << "run: " << e.what() << "\n";
    return consts::kExitBlocked;
  }
}
