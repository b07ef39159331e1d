#include "fake_runner.hpp"

#include "commitgate/repo.hpp"
#include "commitgate/staged.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using commitgate::parse_batch_check;
using commitgate::parse_ls_files_stage;
using commitgate::parse_nul_list;
using commitgate::Repository;
using commitgate::StagedSet;
using testutil::FakeRunner;

static std::string nul_join(std::initializer_list<std::string> items) {
  std::string s;
  for (const auto &i : items) {
    s += i;
    s.push_back('\0');
  }
  return s;
}

int main() {
  // -z parsers
  if (parse_nul_list(nul_join({"a.go", "dir/b c.go"})) !=
      std::vector<std::string>{"a.go", "dir/b c.go"}) {
    std::cerr << "parse_nul_list wrong\n";
    return 1;
  }
  const auto entries = parse_ls_files_stage(
      nul_join({"100644 ce013625030ba8dba906f756967f9e9ca394464a 0\tmain.go",
                "160000 1111111111111111111111111111111111111111 0\tvendor/lib"}));
  if (entries.size() != 2 || entries[0].mode != 0100644 || entries[0].path != "main.go" ||
      entries[0].oid_hex != "ce013625030ba8dba906f756967f9e9ca394464a" ||
      entries[1].mode != 0160000) {
    std::cerr << "parse_ls_files_stage wrong\n";
    return 1;
  }
  bool threw = false;
  try {
    (void)parse_ls_files_stage(nul_join({"garbage"}));
  } catch (const std::runtime_error &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "malformed ls-files record accepted\n";
    return 1;
  }

  // batch-check output
  const auto sizes = parse_batch_check("ce013625030ba8dba906f756967f9e9ca394464a blob 6\n"
                                       "2222222222222222222222222222222222222222 blob 2000000\n");
  if (sizes.size() != 2 || sizes.at("ce013625030ba8dba906f756967f9e9ca394464a") != 6 ||
      sizes.at("2222222222222222222222222222222222222222") != 2000000) {
    std::cerr << "parse_batch_check wrong\n";
    return 1;
  }
  for (const char *bad : {"4444444444444444444444444444444444444444 missing\n",
                          "4444444444444444444444444444444444444444 blob 12x\n"}) {
    threw = false;
    try {
      (void)parse_batch_check(bad);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "bad batch-check line accepted: " << bad;
      return 1;
    }
  }

  const fs::path root =
      fs::temp_directory_path() / ("commitgate_staged_" + std::to_string(std::random_device{}()));
  fs::create_directories(root / ".git");
  int rc = 0;

  try {
    const std::string small_hex = "ce013625030ba8dba906f756967f9e9ca394464a";
    const std::string packed_hex = "2222222222222222222222222222222222222222";

    FakeRunner runner;
    runner.responses[testutil::kStagedNames] =
        FakeRunner::exit_with(0, nul_join({"main.go", "big.bin", "vendor/lib"}));
    runner.responses[testutil::kLsFiles] = FakeRunner::exit_with(
        0, nul_join({"100644 " + packed_hex + " 0\tbig.bin",
                     "100644 " + small_hex + " 0\tmain.go",
                     "160000 1111111111111111111111111111111111111111 0\tvendor/lib",
                     "100644 3333333333333333333333333333333333333333 0\tuntouched.go"}));
    runner.responses[testutil::kBatchCheck] = FakeRunner::exit_with(
        0, small_hex + " blob 6\n" + packed_hex + " blob 2000000\n");
    runner.responses[testutil::kStagedDiff] =
        FakeRunner::exit_with(0, "diff --git a/main.go b/main.go\n--- /dev/null\n+++ b/main.go\n"
                                 "@@ -0,0 +1 @@\n+hello\n");

    const auto set = StagedSet::collect(runner, Repository{root});
    if (set.files().size() != 3) {
      std::cerr << "expected 3 staged files, got " << set.files().size() << "\n";
      return 1;
    }
    const auto &main_go = set.files()[0];
    const auto &big = set.files()[1];
    const auto &sub = set.files()[2];
    if (main_go.path != "main.go" || main_go.size != 6 || main_go.oid_hex != small_hex) {
      std::cerr << "main.go size wrong: " << main_go.size << "\n";
      return 1;
    }
    if (big.size != 2000000) {
      std::cerr << "big.bin size wrong: " << big.size << "\n";
      return 1;
    }
    if (sub.size != 0 || sub.mode != 0160000) {
      std::cerr << "submodule entry sized\n";
      return 1;
    }
    // Every size comes from one batch query, and the submodule is not asked for
    if (runner.calls.size() != 4 || runner.inputs.size() != 4 ||
        runner.inputs[2] != small_hex + "\n" + packed_hex + "\n") {
      std::cerr << "sizes not queried in one batch\n";
      return 1;
    }
    if (set.with_extension(".go").size() != 1 || set.deltas().size() != 1) {
      std::cerr << "extension filter / deltas wrong\n";
      return 1;
    }

    // git reports a staged blob as missing
    FakeRunner lost;
    lost.responses[testutil::kStagedNames] = FakeRunner::exit_with(0, nul_join({"main.go"}));
    lost.responses[testutil::kLsFiles] =
        FakeRunner::exit_with(0, nul_join({"100644 " + small_hex + " 0\tmain.go"}));
    lost.responses[testutil::kBatchCheck] = FakeRunner::exit_with(0, small_hex + " missing\n");
    threw = false;
    try {
      (void)StagedSet::collect(lost, Repository{root});
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "missing blob not reported\n";
      return 1;
    }

    // Nothing staged: no further git calls
    FakeRunner idle;
    const auto none = StagedSet::collect(idle, Repository{root});
    if (!none.empty() || idle.calls.size() != 1) {
      std::cerr << "empty staged set queried more than the name list\n";
      return 1;
    }

    // A failing git command is reported with its stderr
    FakeRunner broken;
    broken.responses[testutil::kStagedNames] =
        FakeRunner::exit_with(128, "", "fatal: not a git repository\n");
    threw = false;
    try {
      (void)StagedSet::collect(broken, Repository{root});
    } catch (const std::runtime_error &e) {
      threw = std::string(e.what()).find("not a git repository") != std::string::npos;
    }
    if (!threw) {
      std::cerr << "git failure not surfaced\n";
      return 1;
    }

    std::cout << "staged OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  return rc;
}
