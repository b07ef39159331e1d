#pragma once
#include <string>
#include <string_view>

namespace commitgate {

struct MergeDecision {
  bool merge = false;
  std::string reason;
};

// Dependency-update pull requests are merged automatically only when opened
// by the update bot and only for minor or patch version bumps.
MergeDecision should_auto_merge(std::string_view actor, std::string_view update_type);

} // namespace commitgate
