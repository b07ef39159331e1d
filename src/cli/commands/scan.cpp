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

// Advisory stages only; findings never change the exit status.
int cmd_scan(int argc, char **argv) {
  bool no_color = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--no-color") {
      no_color = true;
    } else {
      std::cerr << "usage: commitgate scan [--no-color]\n";
      return consts::kExitUsage;
    }
  }

  const auto repo = Repository::discover(std::filesystem::current_path());
  if (!repo) {
    std::cerr << "scan: not inside a git working tree\n";
    return 1;
  }

  try {
    Reporter reporter{std::cout, !no_color && Reporter::color_wanted(STDOUT_FILENO)};
    SystemRunner runner;
    Pipeline pipeline{*repo, load_gate_config(repo->root()), runner, reporter};
    pipeline.run_advisories();
    return consts::kExitOk;
  } catch (const std::exception &e) {
    std::cerr << "scan: " << e.what() << "\n";
    return 1;
  }
}
