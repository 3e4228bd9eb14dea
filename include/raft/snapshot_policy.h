#pragma once
#ifndef _METAD_SNAPSHOT_POLICY_H_
#define _METAD_SNAPSHOT_POLICY_H_
#include <cstdint>
#include <optional>

#include "raft/config.h"

namespace metad::raft {

// 决定何时构建快照以及快照后清理到哪条日志
class snapshot_policy {
 public:
  snapshot_policy(std::uint64_t logs_since_last, std::uint64_t max_applied_log_to_keep)
      : logs_since_last_(logs_since_last), max_applied_log_to_keep_(max_applied_log_to_keep) {}

  explicit snapshot_policy(const raft_config& config)
      : snapshot_policy(config.snapshot_logs_since_last, config.max_applied_log_to_keep) {}

  bool should_build(std::uint64_t last_applied_index, std::uint64_t last_snapshot_index) const {
    return last_applied_index >= last_snapshot_index + logs_since_last_;
  }

  // 返回可以清理到（含）的日志 index；没有可清理的日志时返回空
  std::optional<std::uint64_t> purge_upto(std::uint64_t snapshot_index) const {
    if (snapshot_index <= max_applied_log_to_keep_) {
      return std::nullopt;
    }
    return snapshot_index - max_applied_log_to_keep_;
  }

 private:
  std::uint64_t logs_since_last_;
  std::uint64_t max_applied_log_to_keep_;
};

}  // namespace metad::raft

#endif  // _METAD_SNAPSHOT_POLICY_H_
