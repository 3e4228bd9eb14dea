#pragma once
#ifndef _METAD_META_LEADER_H_
#define _METAD_META_LEADER_H_
#include <metad.pb.h>

#include <asio/awaitable.hpp>
#include <memory>
#include <set>
#include <system_error>

#include "error/meta_error.h"
#include "types/meta_types.h"

namespace metad::service {

class meta_node;

// 只在 leader 上执行的操作。raft 返回 NOT_LEADER 时统一转换为 forward_to_leader
class meta_leader {
 public:
  explicit meta_leader(std::shared_ptr<meta_node> node) : node_(std::move(node)) {}

  asio::awaitable<meta_result<metadpb::forward_response>> handle(metadpb::forward_request req);

  asio::awaitable<meta_result<applied_state>> write(log_entry entry);

  // 注册节点描述并把节点加为 learner；已是成员时只更新描述
  asio::awaitable<meta_result<void>> join(metadpb::join_request req);

  // 从成员配置中移除节点并删除节点描述；未知节点直接返回
  asio::awaitable<meta_result<void>> leave(metadpb::leave_request req);

  // 把 voters 设置为给定集合，不在其中的原 voter 被移出集群
  asio::awaitable<meta_result<void>> change_membership(std::set<node_id> voters);

 private:
  meta_error to_meta_error(std::error_code ec) const;

  std::shared_ptr<meta_node> node_;
};

}  // namespace metad::service

#endif  // _METAD_META_LEADER_H_
