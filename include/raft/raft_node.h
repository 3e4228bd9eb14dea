#pragma once
#ifndef _METAD_RAFT_NODE_H_
#define _METAD_RAFT_NODE_H_
#include <metad.pb.h>
#include <proxy.h>

#include <asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/strand.hpp>
#include <asio/thread_pool.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>

#include "basic/logger.h"
#include "basic/utility_macros.h"
#include "coroutine/channel.h"
#include "coroutine/co_spawn_waiter.h"
#include "coroutine/signal_channel_endpoint.h"
#include "error/expected.h"
#include "error/leaf.h"
#include "pb/types.h"
#include "raft/config.h"
#include "raft/network.h"
#include "raft/snapshot_policy.h"
#include "raft/storage.h"
#include "raft/types.h"
#include "raft/wait.h"
#include "types/meta_types.h"

namespace metad::raft {

struct client_write_response {
  log_id log;
  applied_state data;
};

// 单个 raft 成员。全部状态只在 strand_ 上访问，公开的协程接口先切换到 strand_ 再执行
class raft_node : public std::enable_shared_from_this<raft_node> {
  NOT_COPYABLE_NOT_MOVABLE(raft_node)
 public:
  raft_node(node_id id, raft_config config, asio::any_io_executor executor, pro::proxy<storage_builder> storage,
            pro::proxy<network_builder> network, std::shared_ptr<logger_interface> logger);

  // 从存储恢复状态、重放已提交日志并启动选举循环
  leaf::result<void> start();

  // 停止全部后台协程，返回被回收的协程数量
  asio::awaitable<std::size_t> shutdown();

  // 写入第一条成员配置日志。日志非空时返回 ALREADY_INITIALIZED
  asio::awaitable<expected<void>> initialize(membership m);

  // 提交一条客户端日志，等待其应用后返回结果
  asio::awaitable<expected<client_write_response>> client_write(log_entry entry);

  // voters 中的每个成员必须已经在当前配置中；被移出 voters 的成员同时移出集群
  asio::awaitable<expected<void>> change_membership(std::set<node_id> voters);

  // 成员已存在时直接返回
  asio::awaitable<expected<void>> add_learner(node_id id);

  // 不是 learner 时直接返回
  asio::awaitable<expected<void>> remove_learner(node_id id);

  asio::awaitable<expected<metadpb::append_entries_response>> handle_append_entries(
      metadpb::append_entries_request req);

  asio::awaitable<expected<metadpb::vote_response>> handle_vote(metadpb::vote_request req);

  asio::awaitable<expected<metadpb::install_snapshot_response>> handle_install_snapshot(
      metadpb::install_snapshot_request req);

  raft_metrics metrics() const { return metrics_->borrow(); }

  std::shared_ptr<metrics_watch> watch() const { return metrics_; }

  raft::wait wait(std::chrono::milliseconds timeout) const { return raft::wait(metrics_, timeout); }

  std::optional<node_id> current_leader() const { return metrics().current_leader; }

  bool is_leader() const {
    auto m = metrics();
    return m.state == server_state::leader && m.current_leader == id_;
  }

  node_id id() const { return id_; }

 private:
  struct replication_progress {
    std::uint64_t next_index = 1;
    std::uint64_t matched = 0;
    std::shared_ptr<coro::signal_channel_endpoint> notifier;
  };

  enum class replicate_result : std::uint8_t {
    idle,
    more,
    failed,
  };

  using pending_channel = coro::channel<applied_state>;

  asio::awaitable<expected<void>> initialize_impl(membership m);
  asio::awaitable<expected<client_write_response>> client_write_impl(log_entry entry);
  asio::awaitable<expected<void>> change_membership_impl(std::set<node_id> voters);
  asio::awaitable<expected<void>> add_learner_impl(node_id id);
  asio::awaitable<expected<void>> remove_learner_impl(node_id id);
  asio::awaitable<expected<void>> propose_membership(membership m);
  asio::awaitable<std::size_t> shutdown_impl();
  asio::awaitable<expected<applied_state>> wait_applied(std::uint64_t index, std::shared_ptr<pending_channel> chan);
  // 停止服务但不等待后台任务，未完成的提案以 ec 失败
  void halt(std::error_code ec);

  // election.cpp
  asio::awaitable<void> election_loop();
  asio::awaitable<void> campaign();
  expected<metadpb::vote_response> handle_vote_impl(const metadpb::vote_request& req);
  void become_leader();
  void become_follower(std::uint64_t term, std::optional<node_id> leader);
  std::chrono::milliseconds random_election_timeout();

  // replication.cpp
  void start_replication(node_id target);
  void stop_replication();
  void sync_replication_targets();
  void notify_replication();
  asio::awaitable<void> replication_loop(node_id target, std::uint64_t term,
                                         std::shared_ptr<coro::signal_channel_endpoint> notifier);
  asio::awaitable<replicate_result> replicate_once(node_id target, std::uint64_t term);
  asio::awaitable<replicate_result> send_snapshot(node_id target, std::uint64_t term);
  expected<metadpb::append_entries_response> handle_append_entries_impl(const metadpb::append_entries_request& req);
  expected<metadpb::install_snapshot_response> handle_install_snapshot_impl(
      const metadpb::install_snapshot_request& req);
  void advance_commit();

  // raft_node.cpp
  leaf::result<void> append_local(const pb::entry_list& entries);
  leaf::result<void> save_hard_state();
  leaf::result<void> reload_membership();
  void update_commit(std::uint64_t committed);
  leaf::result<void> apply_committed();
  void resolve_pending(std::uint64_t index, applied_state result);
  void fail_pending(std::error_code ec);
  void maybe_build_snapshot();
  asio::awaitable<void> build_snapshot(sm::state_data view);
  void publish_metrics();
  void heard_from_leader();
  server_state follower_state() const;
  metadpb::entry next_entry(metadpb::entry_type type) const;

#ifdef METAD_TEST
 public:
#else
 private:
#endif
  node_id id_;
  raft_config config_;
  snapshot_policy policy_;
  asio::strand<asio::any_io_executor> strand_;
  pro::proxy<storage_builder> storage_;
  pro::proxy<network_builder> network_;
  std::shared_ptr<logger_interface> logger_;

  server_state state_ = server_state::learner;
  std::uint64_t current_term_ = 0;
  std::optional<node_id> voted_for_;
  std::uint64_t committed_ = 0;
  log_id last_log_id_;
  log_id last_applied_;
  membership membership_;
  std::uint64_t membership_index_ = 0;
  std::optional<node_id> leader_id_;
  std::optional<log_id> snapshot_last_;
  std::chrono::steady_clock::time_point last_heard_leader_;

  std::map<node_id, replication_progress> progress_;
  std::map<std::uint64_t, std::shared_ptr<pending_channel>> pending_;

  bool started_ = false;
  bool stopped_ = false;
  bool joined_ = false;
  bool snapshot_building_ = false;
  asio::thread_pool snapshot_pool_{1};

  std::mt19937_64 rng_;
  coro::signal_channel_endpoint election_signal_;
  std::shared_ptr<coro::co_spawn_waiter> waiter_;
  std::shared_ptr<metrics_watch> metrics_;
  raft_metrics last_published_;
};

using raft_node_ptr = std::shared_ptr<raft_node>;

}  // namespace metad::raft

#endif  // _METAD_RAFT_NODE_H_
