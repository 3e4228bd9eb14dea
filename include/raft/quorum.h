#pragma once
#ifndef _METAD_QUORUM_H_
#define _METAD_QUORUM_H_
#include <fmt/core.h>
#include <proxy.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "basic/utility_macros.h"
#include "error/error.h"
#include "error/leaf.h"
#include "error/logic_error.h"

namespace metad::raft::quorum {

using log_index = std::uint64_t;
constexpr auto INVALID_LOG_INDEX = static_cast<log_index>(std::numeric_limits<std::uint64_t>::max());

enum class vote_result : std::uint8_t {
  VOTE_PENDING,
  VOTE_LOST,
  VOTE_WON,
};

// 按节点 id 查询其已确认的日志位置
PRO_DEF_MEM_DISPATCH(acked_indexer, acked_index);
// clang-format off
struct acked_indexer_builder : pro::facade_builder
  ::add_convention<acked_indexer, leaf::result<log_index>(std::uint64_t id)>
  ::add_skill<pro::skills::as_view>
  ::build{};
// clang-format on

class map_ack_indexer {
  NOT_COPYABLE(map_ack_indexer)

 public:
  explicit map_ack_indexer(std::map<std::uint64_t, log_index>&& id_log_idx_map) : map_(std::move(id_log_idx_map)) {}

  leaf::result<log_index> acked_index(std::uint64_t id) {
    if (auto iter = map_.find(id); iter != map_.end()) {
      return iter->second;
    }
    return new_error(logic_error::KEY_NOT_FOUND, fmt::format("{} not found", id));
  }

 private:
  std::map<std::uint64_t, log_index> map_;
};

// 一组 voter 的多数派
class majority_config {
 public:
  majority_config() = default;
  explicit majority_config(std::set<std::uint64_t> id_set) : id_set_(std::move(id_set)) {}

  auto empty() const { return id_set_.empty(); }

  auto size() const { return id_set_.size(); }

  // 被多数派确认的最大日志位置。没有应答的成员按 0 计算
  log_index committed_index(pro::proxy_view<acked_indexer_builder> indexer) const {
    if (id_set_.empty()) {
      return INVALID_LOG_INDEX;
    }

    std::vector<log_index> acked;
    acked.reserve(id_set_.size());
    for (const auto& id : id_set_) {
      auto result = indexer->acked_index(id);
      acked.push_back(result ? *result : 0);
    }
    std::sort(acked.begin(), acked.end());
    auto pos = id_set_.size() - (id_set_.size() / 2 + 1);
    return acked[pos];
  }

  vote_result vote_result_statistics(const std::map<std::uint64_t, bool>& votes) const {
    if (id_set_.empty()) {
      return vote_result::VOTE_WON;
    }

    std::size_t pending = 0;
    std::size_t granted = 0;
    for (const auto& id : id_set_) {
      auto iter = votes.find(id);
      if (iter == votes.end()) {
        ++pending;
      } else if (iter->second) {
        ++granted;
      }
    }

    auto q = id_set_.size() / 2 + 1;
    if (granted >= q) {
      return vote_result::VOTE_WON;
    }
    if (granted + pending >= q) {
      return vote_result::VOTE_PENDING;
    }
    return vote_result::VOTE_LOST;
  }

 private:
  std::set<std::uint64_t> id_set_;
};

}  // namespace metad::raft::quorum

#endif  // _METAD_QUORUM_H_
