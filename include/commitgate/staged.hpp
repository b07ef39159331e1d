#pragma once
#include "commitgate/diff.hpp"
#include "commitgate/process.hpp"
#include "commitgate/repo.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace commitgate {

struct StagedFile {
  std::string path;        // repo-relative
  std::uint32_t mode = 0;  // octal index mode, 0 if unknown
  std::string oid_hex;     // staged blob id
  std::uint64_t size = 0;  // staged blob size in bytes
};

// Snapshot of what `git commit` would record: added/copied/modified/renamed
// paths, their staged blob sizes, and the staged diff text.
class StagedSet {
public:
  StagedSet() = default;
  StagedSet(std::vector<StagedFile> files, std::string diff_text)
      : files_(std::move(files)), diff_text_(std::move(diff_text)) {}

  // Query git through `runner` (cwd = repo root). Throws std::runtime_error
  // if a git command fails.
  static StagedSet collect(CommandRunner &runner, const Repository &repo);

  [[nodiscard]] const std::vector<StagedFile> &files() const { return files_; }
  [[nodiscard]] const std::string &diff_text() const { return diff_text_; }
  [[nodiscard]] bool empty() const { return files_.empty(); }

  [[nodiscard]] std::vector<diff::FileDelta> deltas() const;
  [[nodiscard]] std::vector<StagedFile> with_extension(std::string_view ext) const;

private:
  std::vector<StagedFile> files_;
  std::string diff_text_;
};

// Parsers for git's -z outputs, exposed for tests.
std::vector<std::string> parse_nul_list(std::string_view text);
// "<mode> <oid> <stage>\t<path>\0" records of `git ls-files -s -z`
std::vector<StagedFile> parse_ls_files_stage(std::string_view text);
// oid -> size from `git cat-file --batch-check`; throws on a "missing" line
std::map<std::string, std::uint64_t> parse_batch_check(std::string_view text);

} // namespace commitgate
