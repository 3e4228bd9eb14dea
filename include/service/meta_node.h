#pragma once
#ifndef _METAD_META_NODE_H_
#define _METAD_META_NODE_H_
#include <metad.pb.h>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "basic/logger.h"
#include "basic/utility_macros.h"
#include "error/expected.h"
#include "error/meta_error.h"
#include "raft/raft_node.h"
#include "raft/types.h"
#include "raft/wait.h"
#include "service/local_router.h"
#include "service/meta_config.h"
#include "service/meta_leader.h"
#include "service/meta_network.h"
#include "service/raft_service.h"
#include "store/meta_store.h"
#include "types/meta_types.h"

namespace metad::service {

// 一个元数据节点：持有存储、raft 引擎和网络层，并处理可转发请求
class meta_node : public raft_service, public std::enable_shared_from_this<meta_node> {
  NOT_COPYABLE_NOT_MOVABLE(meta_node)
 public:
  using meta_node_ptr = std::shared_ptr<meta_node>;

  // 按 open_options 打开或创建存储；新建时初始化集群或加入已有集群
  static asio::awaitable<meta_result<meta_node_ptr>> open_create_boot(asio::any_io_executor executor,
                                                                      meta_config config, open_options options,
                                                                      std::shared_ptr<local_router> router,
                                                                      std::shared_ptr<logger_interface> logger);

  // 在新目录上启动单节点集群
  static asio::awaitable<meta_result<meta_node_ptr>> boot(asio::any_io_executor executor, meta_config config,
                                                          std::shared_ptr<local_router> router,
                                                          std::shared_ptr<logger_interface> logger);

  // 停止 raft 引擎并释放存储，返回回收的后台协程数量
  asio::awaitable<std::size_t> stop();

  asio::awaitable<expected<metadpb::append_entries_response>> append_entries(
      metadpb::append_entries_request req) override;

  asio::awaitable<expected<metadpb::vote_response>> vote(metadpb::vote_request req) override;

  asio::awaitable<expected<metadpb::install_snapshot_response>> install_snapshot(
      metadpb::install_snapshot_request req) override;

  asio::awaitable<expected<metadpb::forward_response>> forward(metadpb::forward_request req) override;

  // leader 上直接处理；否则在预算允许时转发给已知 leader，不允许时返回 forward_to_leader
  asio::awaitable<meta_result<metadpb::forward_response>> handle_forwardable_request(metadpb::forward_request req);

  // 客户端写入入口，最多转发一次
  asio::awaitable<meta_result<applied_state>> write(log_entry entry);

  asio::awaitable<meta_result<applied_state>> add_node(node_id id, node n);

  asio::awaitable<meta_result<void>> join_cluster(std::vector<std::string> endpoints);

  // 本节点是 leader 时返回 meta_leader，否则返回 forward_to_leader
  meta_result<meta_leader> as_leader();

  std::optional<node> get_node(node_id id) const;

  std::map<node_id, node> get_nodes() const;

  std::optional<seqv> get_kv(std::string_view key) const;

  std::vector<std::pair<std::string, seqv>> prefix_list_kv(std::string_view prefix) const;

  std::optional<node_id> get_leader() const { return raft_->current_leader(); }

  // 存储是打开的已有数据（而不是新建）
  bool is_opened() const { return opened_; }

  raft::raft_metrics metrics() const { return raft_->metrics(); }

  raft::wait wait(std::chrono::milliseconds timeout) const { return raft_->wait(timeout); }

  node_id id() const { return config_.id; }

  const meta_config& config() const { return config_; }

 private:
  friend class meta_leader;
  // 只允许经由 create 构造
  struct private_tag {
    explicit private_tag() = default;
  };

 public:
  meta_node(private_tag, asio::any_io_executor executor, meta_config config, std::shared_ptr<local_router> router,
            std::shared_ptr<logger_interface> logger);

 private:

  static meta_result<meta_node_ptr> create(asio::any_io_executor executor, const meta_config& config,
                                           std::shared_ptr<local_router> router, store::meta_store_ptr store,
                                           std::shared_ptr<logger_interface> logger);

  asio::awaitable<meta_result<void>> init_cluster();

  asio::awaitable<meta_result<metadpb::forward_response>> forward_to(const std::string& endpoint,
                                                                     metadpb::forward_request req);

#ifdef METAD_TEST
 public:
#else
 private:
#endif
  asio::any_io_executor executor_;
  meta_config config_;
  std::shared_ptr<local_router> router_;
  std::shared_ptr<logger_interface> logger_;
  bool opened_ = false;
  bool stopped_ = false;
  store::meta_store_ptr store_;
  std::shared_ptr<meta_network> network_;
  raft::raft_node_ptr raft_;
};

using meta_node_ptr = meta_node::meta_node_ptr;

// 把 forward_response 中编码的错误还原为 meta_error
meta_result<metadpb::forward_response> decode_forward_response(metadpb::forward_response resp);

metadpb::forward_response encode_forward_result(const meta_result<metadpb::forward_response>& result);

}  // namespace metad::service

#endif  // _METAD_META_NODE_H_
