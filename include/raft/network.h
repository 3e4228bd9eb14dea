#pragma once
#ifndef _METAD_RAFT_NETWORK_H_
#define _METAD_RAFT_NETWORK_H_
#include <metad.pb.h>
#include <proxy.h>

#include <asio/awaitable.hpp>

#include "error/expected.h"
#include "raft/types.h"

namespace metad::raft {

// 向目标节点发送 raft RPC，实现负责解析地址和超时
PRO_DEF_MEM_DISPATCH(network_append_entries, append_entries);
PRO_DEF_MEM_DISPATCH(network_vote, vote);
PRO_DEF_MEM_DISPATCH(network_install_snapshot, install_snapshot);

// clang-format off
struct network_builder : pro::facade_builder
  ::add_convention<network_append_entries,
                   asio::awaitable<expected<metadpb::append_entries_response>>(node_id target, metadpb::append_entries_request req)>
  ::add_convention<network_vote,
                   asio::awaitable<expected<metadpb::vote_response>>(node_id target, metadpb::vote_request req)>
  ::add_convention<network_install_snapshot,
                   asio::awaitable<expected<metadpb::install_snapshot_response>>(node_id target, metadpb::install_snapshot_request req)>
  ::build{};
// clang-format on

}  // namespace metad::raft

#endif  // _METAD_RAFT_NETWORK_H_
