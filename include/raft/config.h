#pragma once
#ifndef _METAD_RAFT_CONFIG_H_
#define _METAD_RAFT_CONFIG_H_
#include <chrono>
#include <cstdint>

#include "error/leaf.h"

namespace metad::raft {

struct raft_config {
  // leader 向每个成员发送心跳的间隔
  std::chrono::milliseconds heartbeat_interval{100};
  // follower 在 [min, max) 内随机选择选举超时
  std::chrono::milliseconds election_timeout_min{300};
  std::chrono::milliseconds election_timeout_max{600};
  // append_entries / vote 的单次 RPC 超时
  std::chrono::milliseconds send_timeout{1000};
  std::chrono::milliseconds install_snapshot_timeout{4000};
  // leader 等待提案被应用的最长时间，超时返回 TIMEOUT，日志仍可能在之后提交
  std::chrono::milliseconds write_timeout{10000};
  // 单个 append_entries 携带的最大日志条数
  std::uint64_t max_payload_entries = 300;
  // 距离上次快照新增多少条已应用日志后构建快照
  std::uint64_t snapshot_logs_since_last = 1024;
  // 快照之后保留的已应用日志条数，0 表示快照覆盖的日志全部清理
  std::uint64_t max_applied_log_to_keep = 1000;

  leaf::result<void> validate() const;
};

}  // namespace metad::raft

#endif  // _METAD_RAFT_CONFIG_H_
