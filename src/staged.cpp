#include "commitgate/staged.hpp"

#include "commitgate/scan.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <map>
#include <stdexcept>

namespace commitgate {

namespace {

constexpr std::uint32_t kModeGitlink = 0160000;

std::string run_git(CommandRunner &runner, const Repository &repo,
                    std::vector<std::string> args, std::string input = {}) {
  args.insert(args.begin(), "git");
  const Command cmd{.argv = args, .cwd = repo.root(), .input = std::move(input)};
  const auto res = runner.run(cmd, std::chrono::milliseconds{0});
  if (!res.ok()) {
    std::string why = res.err.empty() ? "exit " + std::to_string(res.exit_code) : res.err;
    while (!why.empty() && (why.back() == '\n' || why.back() == '\r'))
      why.pop_back();
    throw std::runtime_error(join_command(cmd.argv) + " failed: " + why);
  }
  return res.out;
}

} // namespace

std::vector<std::string> parse_nul_list(std::string_view text) {
  std::vector<std::string> out;
  while (!text.empty()) {
    const auto nul = text.find('\0');
    const auto item = text.substr(0, nul);
    if (!item.empty())
      out.emplace_back(item);
    if (nul == std::string_view::npos)
      break;
    text.remove_prefix(nul + 1);
  }
  return out;
}

std::vector<StagedFile> parse_ls_files_stage(std::string_view text) {
  std::vector<StagedFile> out;
  for (const auto &rec : parse_nul_list(text)) {
    const auto tab = rec.find('\t');
    if (tab == std::string::npos)
      throw std::runtime_error("git ls-files: malformed record: " + rec);
    const std::string_view meta = std::string_view(rec).substr(0, tab);

    // "<mode> <oid> <stage>"
    const auto sp1 = meta.find(' ');
    const auto sp2 = sp1 == std::string_view::npos ? sp1 : meta.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos)
      throw std::runtime_error("git ls-files: malformed record: " + rec);

    StagedFile f;
    const auto mode_sv = meta.substr(0, sp1);
    const auto parsed =
        std::from_chars(mode_sv.data(), mode_sv.data() + mode_sv.size(), f.mode, 8);
    if (parsed.ec != std::errc{})
      throw std::runtime_error("git ls-files: bad mode: " + rec);
    f.oid_hex = std::string(meta.substr(sp1 + 1, sp2 - sp1 - 1));
    f.path = rec.substr(tab + 1);
    out.push_back(std::move(f));
  }
  return out;
}

std::map<std::string, std::uint64_t> parse_batch_check(std::string_view text) {
  std::map<std::string, std::uint64_t> out;
  for (const auto &line : diff::split_lines(text)) {
    // "<oid> <type> <size>", or "<oid> missing"
    const auto sp1 = line.find(' ');
    const auto sp2 = sp1 == std::string::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos)
      continue;
    if (sp2 == std::string::npos) {
      throw std::runtime_error("git cat-file --batch-check: " + line);
    }
    std::uint64_t size = 0;
    const char *first = line.data() + sp2 + 1;
    const char *last = line.data() + line.size();
    const auto parsed = std::from_chars(first, last, size);
    if (parsed.ec != std::errc{} || parsed.ptr != last)
      throw std::runtime_error("git cat-file --batch-check: bad size in: " + line);
    out[line.substr(0, sp1)] = size;
  }
  return out;
}

StagedSet StagedSet::collect(CommandRunner &runner, const Repository &repo) {
  const auto names = parse_nul_list(
      run_git(runner, repo, {"diff", "--cached", "--name-only", "--diff-filter=ACMR", "-z"}));
  if (names.empty())
    return {};

  std::map<std::string, StagedFile> index;
  for (auto &e : parse_ls_files_stage(run_git(runner, repo, {"ls-files", "-s", "-z"}))) {
    index[e.path] = std::move(e);
  }

  std::vector<StagedFile> files;
  files.reserve(names.size());
  std::string wanted;
  for (const auto &name : names) {
    StagedFile f;
    f.path = name;
    if (const auto it = index.find(name); it != index.end()) {
      f.mode = it->second.mode;
      f.oid_hex = it->second.oid_hex;
    }
    if (!f.oid_hex.empty() && f.mode != kModeGitlink)
      wanted += f.oid_hex + '\n';
    files.push_back(std::move(f));
  }

  // One batch query sizes every blob.
  if (!wanted.empty()) {
    const auto sizes =
        parse_batch_check(run_git(runner, repo, {"cat-file", "--batch-check"}, std::move(wanted)));
    for (auto &f : files) {
      if (f.oid_hex.empty() || f.mode == kModeGitlink)
        continue;
      const auto it = sizes.find(f.oid_hex);
      if (it == sizes.end())
        throw std::runtime_error("git cat-file --batch-check: no size for " + f.path);
      f.size = it->second;
    }
  }

  std::string diff_text = run_git(runner, repo,
                                  {"diff", "--cached", "--no-color", "--no-ext-diff", "-U0",
                                   "--diff-filter=ACMR"});
  return StagedSet{std::move(files), std::move(diff_text)};
}

std::vector<diff::FileDelta> StagedSet::deltas() const { return diff::parse_unified(diff_text_); }

std::vector<StagedFile> StagedSet::with_extension(std::string_view ext) const {
  std::vector<StagedFile> out;
  std::ranges::copy_if(files_, std::back_inserter(out),
                       [&](const StagedFile &f) { return has_extension(f.path, ext); });
  return out;
}

} // namespace commitgate
