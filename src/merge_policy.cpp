#include "commitgate/merge_policy.hpp"

#include "commitgate/consts.hpp"

namespace commitgate {

MergeDecision should_auto_merge(std::string_view actor, std::string_view update_type) {
  if (actor != consts::kDependabotActor) {
    return MergeDecision{.merge = false,
                         .reason = "actor " + std::string(actor) + " is not " +
                                   std::string(consts::kDependabotActor)};
  }
  if (update_type == consts::kSemverMinor || update_type == consts::kSemverPatch) {
    return MergeDecision{.merge = true, .reason = std::string(update_type)};
  }
  if (update_type.empty())
    return MergeDecision{.merge = false, .reason = "update type unknown"};
  return MergeDecision{.merge = false,
                       .reason = std::string(update_type) + " needs manual review"};
}

} // namespace commitgate
