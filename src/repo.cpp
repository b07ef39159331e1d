#include "commitgate/repo.hpp"

#include "commitgate/fs.hpp"

#include <stdexcept>
#include <string>

namespace commitgate {

namespace {

std::string first_line(const std::filesystem::path &p) {
  std::string s = fs::read_text(p);
  if (const auto nl = s.find_first_of("\r\n"); nl != std::string::npos)
    s.resize(nl);
  return s;
}

} // namespace

Repository::Repository(std::filesystem::path root) : root_(std::move(root)) {
  const auto dot_git = root_ / consts::kGitDir;
  git_dir_ = dot_git;

  std::error_code ec;
  if (std::filesystem::is_regular_file(dot_git, ec)) {
    const std::string line = first_line(dot_git);
    if (line.rfind(consts::kGitDirPrefix, 0) != 0)
      throw std::runtime_error("malformed .git file: " + dot_git.string());
    std::filesystem::path target = line.substr(consts::kGitDirPrefix.size());
    git_dir_ = target.is_absolute() ? target : (root_ / target).lexically_normal();
  }

  common_dir_ = git_dir_;
  if (const auto commondir = git_dir_ / "commondir"; fs::exists(commondir)) {
    std::filesystem::path target = first_line(commondir);
    common_dir_ = target.is_absolute() ? target : (git_dir_ / target).lexically_normal();
  }
}

std::optional<Repository> Repository::discover(const std::filesystem::path &start) {
  std::error_code ec;
  auto dir = std::filesystem::absolute(start, ec);
  if (ec)
    return std::nullopt;
  while (true) {
    if (fs::exists(dir / consts::kGitDir))
      return Repository{dir};
    if (!dir.has_parent_path() || dir.parent_path() == dir)
      return std::nullopt;
    dir = dir.parent_path();
  }
}

bool Repository::is_git_repo() const {
  std::error_code ec;
  return std::filesystem::is_directory(git_dir_, ec);
}

} // namespace commitgate
