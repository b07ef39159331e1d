#pragma once
#include "commitgate/consts.hpp"

#include <filesystem>
#include <optional>

namespace commitgate {

// Paths of a working tree and its git directory. `.git` may be a directory
// or a "gitdir: <path>" file (linked worktrees, submodules).
class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Walk up from `start` to the first directory holding a `.git` entry.
  static std::optional<Repository> discover(const std::filesystem::path &start);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] const std::filesystem::path &git_dir() const { return git_dir_; }
  // Shared directory of linked worktrees; equals git_dir() otherwise.
  [[nodiscard]] const std::filesystem::path &common_dir() const { return common_dir_; }

  [[nodiscard]] auto hooks_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kHooksDir;
  }
  [[nodiscard]] auto pre_commit_hook() const -> std::filesystem::path {
    return hooks_dir() / consts::kPreCommit;
  }
  [[nodiscard]] auto commit_msg_file() const -> std::filesystem::path {
    return git_dir_ / consts::kEditMsgFile;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return root_ / consts::kConfigFile;
  }

  [[nodiscard]] auto is_git_repo() const -> bool;

private:
  std::filesystem::path root_;
  std::filesystem::path git_dir_;
  std::filesystem::path common_dir_;
};

} // namespace commitgate
