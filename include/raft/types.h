#pragma once
#ifndef _METAD_RAFT_TYPES_H_
#define _METAD_RAFT_TYPES_H_
#include <compare>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "types/meta_types.h"

namespace metad::raft {

using metad::node_id;

// 日志位置；{0, 0} 表示空日志
struct log_id {
  std::uint64_t term = 0;
  std::uint64_t index = 0;

  auto operator<=>(const log_id&) const = default;
  std::string to_string() const;
};

// 集群成员：voters 参与选举和提交，learners 只接收日志
struct membership {
  std::set<node_id> voters;
  std::set<node_id> learners;

  bool is_voter(node_id id) const { return voters.contains(id); }
  bool is_learner(node_id id) const { return learners.contains(id); }
  bool contains(node_id id) const { return is_voter(id) || is_learner(id); }
  bool empty() const { return voters.empty() && learners.empty(); }
  std::set<node_id> all_members() const;

  bool operator==(const membership&) const = default;
  std::string to_string() const;
};

enum class server_state : std::uint8_t {
  follower,
  candidate,
  leader,
  learner,
  shutdown,
};

// 引擎对外发布的状态快照，每次角色、任期、leader、apply 位置、成员或快照变化都会重新发布
struct raft_metrics {
  node_id id = 0;
  server_state state = server_state::learner;
  std::uint64_t current_term = 0;
  std::uint64_t last_log_index = 0;
  log_id last_applied;
  std::optional<node_id> current_leader;
  raft::membership membership;
  std::optional<log_id> snapshot;

  bool operator==(const raft_metrics&) const = default;
  std::string to_string() const;
};

}  // namespace metad::raft

#endif  // _METAD_RAFT_TYPES_H_
