#pragma once
#ifndef _METAD_RAFT_STORAGE_H_
#define _METAD_RAFT_STORAGE_H_
#include <metad.pb.h>
#include <proxy.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "error/leaf.h"
#include "pb/types.h"
#include "raft/types.h"
#include "state_machine/state_machine.h"
#include "types/meta_types.h"

namespace metad::raft {

// 启动时从存储恢复的状态
struct initial_state {
  metadpb::hard_state hard_state;
  log_id last_log_id;
  // 状态机当前反映的位置（快照位置，日志尚未重放）
  log_id last_applied;
  raft::membership membership;
  // membership 所在日志的 index；来自快照或尚无成员时为 0
  std::uint64_t membership_index = 0;
  std::optional<log_id> snapshot_last;
};

struct snapshot_payload {
  metadpb::snapshot_meta meta;
  std::string data;
};

// 返回 hard state、日志边界、成员配置以及快照位置
PRO_DEF_MEM_DISPATCH(storage_initial_state, initial_state);
PRO_DEF_MEM_DISPATCH(storage_save_hard_state, save_hard_state);
// [lo, hi) 范围内的日志
PRO_DEF_MEM_DISPATCH(storage_entries, entries);
// index 所在日志的 term；index 为最后一次清理的位置时仍可查询
PRO_DEF_MEM_DISPATCH(storage_term, term);
PRO_DEF_MEM_DISPATCH(storage_first_index, first_index);
PRO_DEF_MEM_DISPATCH(storage_last_log_id, last_log_id);
PRO_DEF_MEM_DISPATCH(storage_append, append);
// 删除 index 及之后的日志
PRO_DEF_MEM_DISPATCH(storage_truncate_since, truncate_since);
// 删除 index 及之前的日志
PRO_DEF_MEM_DISPATCH(storage_purge_upto, purge_upto);
PRO_DEF_MEM_DISPATCH(storage_effective_membership, effective_membership);
// 把已提交日志应用到状态机
PRO_DEF_MEM_DISPATCH(storage_apply, apply);
// 状态机的时间点拷贝，在 apply 路径上调用
PRO_DEF_MEM_DISPATCH(storage_snapshot_view, snapshot_view);
// 序列化并持久化 snapshot_view 的结果，可在后台线程调用
PRO_DEF_MEM_DISPATCH(storage_save_snapshot, save_snapshot);
PRO_DEF_MEM_DISPATCH(storage_current_snapshot, current_snapshot);
PRO_DEF_MEM_DISPATCH(storage_install_snapshot, install_snapshot);

// clang-format off
struct storage_builder : pro::facade_builder
  ::add_convention<storage_initial_state, leaf::result<initial_state>() const>
  ::add_convention<storage_save_hard_state, leaf::result<void>(const metadpb::hard_state& hs)>
  ::add_convention<storage_entries, leaf::result<pb::entry_list>(std::uint64_t lo, std::uint64_t hi) const>
  ::add_convention<storage_term, leaf::result<std::uint64_t>(std::uint64_t index) const>
  ::add_convention<storage_first_index, std::uint64_t() const>
  ::add_convention<storage_last_log_id, log_id() const>
  ::add_convention<storage_append, leaf::result<void>(const pb::entry_list& entries)>
  ::add_convention<storage_truncate_since, leaf::result<void>(std::uint64_t index)>
  ::add_convention<storage_purge_upto, leaf::result<void>(std::uint64_t index)>
  ::add_convention<storage_effective_membership, leaf::result<std::pair<membership, std::uint64_t>>() const>
  ::add_convention<storage_apply, leaf::result<std::vector<applied_state>>(const pb::entry_list& entries)>
  ::add_convention<storage_snapshot_view, sm::state_data() const>
  ::add_convention<storage_save_snapshot, leaf::result<metadpb::snapshot_meta>(const sm::state_data& view)>
  ::add_convention<storage_current_snapshot, leaf::result<std::optional<snapshot_payload>>() const>
  ::add_convention<storage_install_snapshot, leaf::result<void>(const metadpb::snapshot_meta& meta, const std::string& data)>
  ::add_skill<pro::skills::as_view>
  ::build{};
// clang-format on

}  // namespace metad::raft

#endif  // _METAD_RAFT_STORAGE_H_
