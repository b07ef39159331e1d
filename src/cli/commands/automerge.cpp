#include "commitgate/consts.hpp"
#include "commitgate/merge_policy.hpp"

#include <iostream>

// Exit 0 when the pull request may be merged, 1 when it must wait for review.
int cmd_automerge(int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: commitgate automerge <actor> <update-type>\n";
    return commitgate::consts::kExitUsage;
  }
  const auto decision = commitgate::should_auto_merge(argv[1], argv[2]);
  std::cout << (decision.merge ? "merge: " : "hold: ") << decision.reason << "\n";
  return decision.merge ? 0 : 1;
}
