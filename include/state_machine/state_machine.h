#pragma once
#ifndef _METAD_STATE_MACHINE_H_
#define _METAD_STATE_MACHINE_H_
#include <metad.pb.h>

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "basic/utility_macros.h"
#include "error/leaf.h"
#include "raft/types.h"
#include "types/meta_types.h"

namespace metad::sm {

// 生成 seqv.seq 的全局序列名
inline constexpr std::string_view GENERIC_KV_SEQ = "generic-kv";

struct client_last_resp {
  std::uint64_t serial = 0;
  applied_state response;

  bool operator==(const client_last_resp&) const = default;
};

// 状态机的全部内容。快照时整体拷贝出一份只读视图
struct state_data {
  std::map<std::string, seqv, std::less<>> kvs;
  std::map<std::string, std::uint64_t, std::less<>> sequences;
  std::map<node_id, node> nodes;
  std::map<std::string, client_last_resp, std::less<>> client_last_resps;
  raft::log_id last_applied;
  std::optional<raft::membership> last_membership;

  bool operator==(const state_data&) const = default;
};

class state_machine {
  NOT_COPYABLE_NOT_MOVABLE(state_machine)
 public:
  state_machine() = default;

  // 按 index 顺序应用一条已提交日志。index 不大于 last_applied 的日志直接跳过
  leaf::result<applied_state> apply(const metadpb::entry& ent);

  std::optional<seqv> get_kv(std::string_view key) const;

  std::vector<std::pair<std::string, seqv>> prefix_list_kv(std::string_view prefix) const;

  std::optional<std::uint64_t> get_sequence(std::string_view key) const;

  std::optional<node> get_node(node_id id) const;

  std::map<node_id, node> get_nodes() const;

  raft::log_id last_applied() const;

  std::optional<raft::membership> last_membership() const;

  state_data copy() const;

  static metadpb::state_machine_data serialize(const state_data& data);

  // 用快照内容替换当前状态
  leaf::result<void> restore(const metadpb::state_machine_data& data);

 private:
  applied_state apply_cmd(const cmd& c);
  applied_state apply_upsert_kv(const upsert_kv& cmd);
  std::uint64_t incr_sequence(std::string_view key);

  mutable std::shared_mutex mutex_;
  state_data data_;
};

}  // namespace metad::sm

#endif  // _METAD_STATE_MACHINE_H_
