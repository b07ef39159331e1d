#include "commitgate/consts.hpp"
#include "commitgate/hook.hpp"
#include "commitgate/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using commitgate::Repository;

namespace {

// Absolute path of this binary so the hook does not depend on PATH.
std::filesystem::path self_path() {
  std::error_code ec;
  const auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
  return ec ? std::filesystem::path("commitgate") : p;
}

} // namespace

int cmd_install(int argc, char **argv) {
  bool force = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--force") {
      force = true;
    } else {
      std::cerr << "usage: commitgate install [--force]\n";
      return commitgate::consts::kExitUsage;
    }
  }

  const auto repo = Repository::discover(std::filesystem::current_path());
  if (!repo || !repo->is_git_repo()) {
    std::cerr << "install: not inside a git working tree\n";
    return 1;
  }

  try {
    const auto hook = commitgate::install_hook(*repo, self_path(), force);
    std::cout << "installed " << hook.string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "install: " << e.what() << "\n";
    return 1;
  }
}
