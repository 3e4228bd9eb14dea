#pragma once
#ifndef _METAD_META_NETWORK_H_
#define _METAD_META_NETWORK_H_
#include <metad.pb.h>

#include <asio/awaitable.hpp>
#include <memory>
#include <string>

#include "basic/logger.h"
#include "error/expected.h"
#include "raft/config.h"
#include "service/local_router.h"
#include "store/meta_store.h"
#include "types/meta_types.h"

namespace metad::service {

// raft 引擎使用的网络层：按节点表把 node id 解析为 endpoint，再经 router 发送
class meta_network {
 public:
  meta_network(std::shared_ptr<local_router> router, std::weak_ptr<store::meta_store> store,
               raft::raft_config config, std::shared_ptr<logger_interface> logger)
      : router_(std::move(router)), store_(std::move(store)), config_(config), logger_(std::move(logger)) {}

  asio::awaitable<expected<metadpb::append_entries_response>> append_entries(node_id target,
                                                                             metadpb::append_entries_request req);

  asio::awaitable<expected<metadpb::vote_response>> vote(node_id target, metadpb::vote_request req);

  asio::awaitable<expected<metadpb::install_snapshot_response>> install_snapshot(
      node_id target, metadpb::install_snapshot_request req);

 private:
  expected<std::string> resolve(node_id target) const;

  std::shared_ptr<local_router> router_;
  std::weak_ptr<store::meta_store> store_;
  raft::raft_config config_;
  std::shared_ptr<logger_interface> logger_;
};

}  // namespace metad::service

#endif  // _METAD_META_NETWORK_H_
