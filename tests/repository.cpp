#include "commitgate/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("commitgate_repo_" + std::to_string(std::random_device{}()));
  int rc = 0;

  try {
    // Plain checkout: discover from a nested directory
    const fs::path main_root = base / "main";
    fs::create_directories(main_root / ".git" / "hooks");
    fs::create_directories(main_root / "pkg" / "flow");

    const auto found = commitgate::Repository::discover(main_root / "pkg" / "flow");
    if (!found || fs::canonical(found->root()) != fs::canonical(main_root)) {
      std::cerr << "discover did not find the enclosing repository\n";
      return 1;
    }
    if (!found->is_git_repo() || found->git_dir() != found->root() / ".git" ||
        found->common_dir() != found->git_dir()) {
      std::cerr << "plain repository paths wrong\n";
      return 1;
    }
    if (found->pre_commit_hook() != found->root() / ".git" / "hooks" / "pre-commit" ||
        found->commit_msg_file() != found->root() / ".git" / "COMMIT_EDITMSG" ||
        found->config_file() != found->root() / ".commitgate") {
      std::cerr << "derived paths wrong\n";
      return 1;
    }

    // Linked worktree: .git is a file, objects/hooks live in the common dir
    const fs::path wt_git = main_root / ".git" / "worktrees" / "feature";
    fs::create_directories(wt_git);
    std::ofstream(wt_git / "commondir") << "../..\n";
    const fs::path wt_root = base / "feature";
    fs::create_directories(wt_root);
    std::ofstream(wt_root / ".git") << "gitdir: " << wt_git.string() << "\n";

    const commitgate::Repository wt{wt_root};
    if (wt.git_dir() != wt_git) {
      std::cerr << "gitdir file not followed: " << wt.git_dir() << "\n";
      return 1;
    }
    if (fs::canonical(wt.common_dir()) != fs::canonical(main_root / ".git")) {
      std::cerr << "commondir not followed: " << wt.common_dir() << "\n";
      return 1;
    }
    if (wt.commit_msg_file() != wt_git / "COMMIT_EDITMSG") {
      std::cerr << "worktree message file should live in its own gitdir\n";
      return 1;
    }

    // Malformed .git file
    const fs::path bad = base / "bad";
    fs::create_directories(bad);
    std::ofstream(bad / ".git") << "nonsense\n";
    bool threw = false;
    try {
      commitgate::Repository broken{bad};
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "malformed .git file accepted\n";
      return 1;
    }

    std::cout << "repository OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return rc;
}
