#include "commitgate/config.hpp"
#include "commitgate/consts.hpp"
#include "commitgate/fs.hpp"
#include "commitgate/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using namespace commitgate;

int cmd_config(int argc, char **argv) {
  bool init = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--init") {
      init = true;
    } else {
      std::cerr << "usage: commitgate config [--init]\n";
      return consts::kExitUsage;
    }
  }

  const auto repo = Repository::discover(std::filesystem::current_path());
  if (!repo) {
    std::cerr << "config: not inside a git working tree\n";
    return 1;
  }

  try {
    if (init) {
      if (fs::exists(repo->config_file())) {
        std::cerr << "config: " << repo->config_file().string() << " already exists\n";
        return 1;
      }
      save_gate_config(repo->root(), GateConfig{});
      std::cout << "wrote " << repo->config_file().string() << "\n";
      return 0;
    }
    std::cout << render_gate_config(load_gate_config(repo->root()));
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "config: " << e.what() << "\n";
    return 1;
  }
}
