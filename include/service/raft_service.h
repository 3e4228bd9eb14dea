#pragma once
#ifndef _METAD_RAFT_SERVICE_H_
#define _METAD_RAFT_SERVICE_H_
#include <metad.pb.h>

#include <asio/awaitable.hpp>

#include "error/expected.h"

namespace metad::service {

// 节点对外提供的 RPC 处理接口，由 local_router 按 endpoint 分发
class raft_service {
 public:
  virtual ~raft_service() = default;

  virtual asio::awaitable<expected<metadpb::append_entries_response>> append_entries(
      metadpb::append_entries_request req) = 0;

  virtual asio::awaitable<expected<metadpb::vote_response>> vote(metadpb::vote_request req) = 0;

  virtual asio::awaitable<expected<metadpb::install_snapshot_response>> install_snapshot(
      metadpb::install_snapshot_request req) = 0;

  // 可转发请求。业务错误编码在 forward_response 中，expected 的错误只表示传输失败
  virtual asio::awaitable<expected<metadpb::forward_response>> forward(metadpb::forward_request req) = 0;
};

}  // namespace metad::service

#endif  // _METAD_RAFT_SERVICE_H_
