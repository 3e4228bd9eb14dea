#include "raft/types.h"

#include <absl/strings/str_join.h>
#include <fmt/format.h>

#include "basic/enum_name.h"

namespace metad::raft {

std::string log_id::to_string() const { return fmt::format("{}-{}", term, index); }

std::set<node_id> membership::all_members() const {
  auto ids = voters;
  ids.insert(learners.begin(), learners.end());
  return ids;
}

std::string membership::to_string() const {
  return fmt::format("voters:[{}] learners:[{}]", absl::StrJoin(voters, ","), absl::StrJoin(learners, ","));
}

std::string raft_metrics::to_string() const {
  return fmt::format("id:{} state:{} term:{} last_log:{} applied:{} leader:{} membership:{{{}}} snapshot:{}", id,
                     enum_name(state), current_term, last_log_index, last_applied.to_string(),
                     current_leader ? fmt::format("{}", *current_leader) : std::string("none"),
                     membership.to_string(), snapshot ? snapshot->to_string() : std::string("none"));
}

}  // namespace metad::raft
