#pragma once
#ifndef _METAD_LOCAL_ROUTER_H_
#define _METAD_LOCAL_ROUTER_H_
#include <metad.pb.h>

#include <asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "basic/utility_macros.h"
#include "error/expected.h"
#include "service/raft_service.h"

namespace metad::service {

// 进程内传输：按 endpoint 查找已注册的节点并直接调用。被隔离的 endpoint 不可达
class local_router {
  NOT_COPYABLE_NOT_MOVABLE(local_router)
 public:
  local_router() = default;

  void register_service(const std::string& endpoint, std::weak_ptr<raft_service> service);

  void unregister_service(const std::string& endpoint);

  void isolate(const std::string& endpoint);

  void restore(const std::string& endpoint);

  bool is_registered(const std::string& endpoint) const;

  asio::awaitable<expected<metadpb::append_entries_response>> append_entries(const std::string& endpoint,
                                                                             metadpb::append_entries_request req,
                                                                             std::chrono::milliseconds timeout);

  asio::awaitable<expected<metadpb::vote_response>> vote(const std::string& endpoint, metadpb::vote_request req,
                                                         std::chrono::milliseconds timeout);

  asio::awaitable<expected<metadpb::install_snapshot_response>> install_snapshot(
      const std::string& endpoint, metadpb::install_snapshot_request req, std::chrono::milliseconds timeout);

  asio::awaitable<expected<metadpb::forward_response>> forward(const std::string& endpoint,
                                                               metadpb::forward_request req,
                                                               std::chrono::milliseconds timeout);

 private:
  std::shared_ptr<raft_service> lookup(const std::string& endpoint) const;

  mutable std::mutex mutex_;
  std::map<std::string, std::weak_ptr<raft_service>> services_;
  std::set<std::string> isolated_;
};

}  // namespace metad::service

#endif  // _METAD_LOCAL_ROUTER_H_
