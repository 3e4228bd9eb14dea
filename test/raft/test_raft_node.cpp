#include <fmt/format.h>
#include <gtest/gtest.h>
#include <metad.pb.h>
#include <proxy.h>

#include <asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/use_future.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "basic/enum_name.h"
#include "basic/spdlog_logger.h"
#include "coroutine/watch.h"
#include "error/error.h"
#include "error/leaf_expected.h"
#include "error/network_error.h"
#include "error/raft_error.h"
#include "error/storage_error.h"
#include "pb/codec.h"
#include "raft/raft_node.h"
#include "raft/types.h"
#include "store/meta_store.h"
#include "test_meta_utils.h"

using namespace metad;
using metad::test::blank_entry;
using metad::test::membership_entry;
using metad::test::normal_entry;
using metad::test::sleep_for;
using metad::test::temp_dir;

class raft_node_test_suit : public testing::Test {
 protected:
  static void SetUpTestSuite() { std::cout << "run before first case..." << std::endl; }

  static void TearDownTestSuite() { std::cout << "run after last case..." << std::endl; }

  virtual void SetUp() override { std::cout << "enter from SetUp" << std::endl; }

  virtual void TearDown() override { std::cout << "exit from TearDown" << std::endl; }
};

namespace {

// 所有 RPC 都失败，用于只观察单个节点的行为
struct unreachable_network {
  asio::awaitable<expected<metadpb::append_entries_response>> append_entries(node_id, metadpb::append_entries_request) {
    co_return unexpected(network_error::UNREACHABLE);
  }

  asio::awaitable<expected<metadpb::vote_response>> vote(node_id, metadpb::vote_request) {
    co_return unexpected(network_error::UNREACHABLE);
  }

  asio::awaitable<expected<metadpb::install_snapshot_response>> install_snapshot(node_id,
                                                                                 metadpb::install_snapshot_request) {
    co_return unexpected(network_error::UNREACHABLE);
  }
};

raft::raft_config fast_config() {
  raft::raft_config config;
  config.heartbeat_interval = std::chrono::milliseconds(20);
  config.election_timeout_min = std::chrono::milliseconds(100);
  config.election_timeout_max = std::chrono::milliseconds(200);
  config.send_timeout = std::chrono::milliseconds(100);
  return config;
}

class raft_harness {
 public:
  raft_harness(asio::any_io_executor executor, const std::string& name) : executor_(executor), dir_(name) {}

  expected<raft::raft_node_ptr> start_node(node_id id, raft::raft_config config = fast_config()) {
    auto logger = std::make_shared<spdlog_logger>(fmt::format("[raft-{}]", id));
    auto store = leaf_to_expected(
        [&]() { return store::meta_store::open_create(node_dir(id), id, true, true, logger); });
    if (!store) {
      return tl::unexpected(store.error());
    }
    auto node = std::make_shared<raft::raft_node>(id, config, executor_, pro::proxy<raft::storage_builder>(*store),
                                                  pro::proxy<raft::network_builder>(
                                                      std::make_shared<unreachable_network>()),
                                                  logger);
    if (auto started = leaf_to_expected_void([&]() { return node->start(); }); !started) {
      return tl::unexpected(started.error());
    }
    nodes_.push_back(node);
    return node;
  }

  std::string node_dir(node_id id) const { return dir_.sub(fmt::format("node-{}", id)); }

  asio::awaitable<void> shutdown_all() {
    for (auto& node : nodes_) {
      co_await node->shutdown();
    }
    nodes_.clear();
  }

 private:
  asio::any_io_executor executor_;
  temp_dir dir_;
  std::vector<raft::raft_node_ptr> nodes_;
};

void run_raft_test(const std::string& name, std::function<asio::awaitable<void>(raft_harness&)> body) {
  asio::io_context io;
  raft_harness harness(io.get_executor(), name);
  auto fut = asio::co_spawn(
      io,
      [&]() -> asio::awaitable<void> {
        std::exception_ptr err;
        try {
          co_await body(harness);
        } catch (...) {
          err = std::current_exception();
        }
        co_await harness.shutdown_all();
        if (err) {
          std::rethrow_exception(err);
        }
      },
      asio::use_future);
  io.run();
  fut.get();
}

metadpb::append_entries_request append_request(std::uint64_t term, node_id leader, raft::log_id prev,
                                               std::vector<metadpb::entry> entries, std::uint64_t commit) {
  metadpb::append_entries_request req;
  req.set_term(term);
  req.set_leader_id(leader);
  *req.mutable_prev_log_id() = pb::to_pb(prev);
  for (auto& ent : entries) {
    *req.add_entries() = std::move(ent);
  }
  req.set_leader_commit(commit);
  return req;
}

// cmd 未设置的日志，状态机无法解码
metadpb::entry undecodable_entry(std::uint64_t term, std::uint64_t index) {
  metadpb::entry ent;
  ent.set_term(term);
  ent.set_index(index);
  ent.set_type(metadpb::ENTRY_NORMAL);
  ent.mutable_normal();
  return ent;
}

metadpb::vote_request vote_request(std::uint64_t term, node_id candidate, raft::log_id last) {
  metadpb::vote_request req;
  req.set_term(term);
  req.set_candidate_id(candidate);
  *req.mutable_last_log_id() = pb::to_pb(last);
  return req;
}

}  // namespace

TEST_F(raft_node_test_suit, single_node_initialize_and_write) {
  run_raft_test("raft_single", [](raft_harness& h) -> asio::awaitable<void> {
    auto node = h.start_node(1);
    EXPECT_TRUE(node);
    if (!node) {
      co_return;
    }
    auto& n = *node;
    EXPECT_EQ(raft::server_state::learner, n->metrics().state);

    EXPECT_TRUE(co_await n->initialize(raft::membership{{1}, {}}));
    auto leader = co_await n->wait(std::chrono::seconds(2)).state(raft::server_state::leader, "single");
    EXPECT_TRUE(leader);
    EXPECT_EQ(1u, leader->current_leader.value_or(0));
    EXPECT_GE(leader->current_term, 1u);
    EXPECT_TRUE(n->is_leader());

    // 1: membership, 2: 新任期的空日志
    auto written = co_await n->client_write(log_entry{incr_seq{"s"}});
    EXPECT_TRUE(written);
    EXPECT_EQ(3u, written->log.index);
    EXPECT_EQ(applied_state{applied_seq{1}}, written->data);
    written = co_await n->client_write(log_entry{upsert_kv::update("k", "v")});
    EXPECT_TRUE(written);
    EXPECT_TRUE(std::get<applied_kv>(written->data).changed());

    auto metrics = co_await n->wait(std::chrono::seconds(1)).log(4, "write");
    EXPECT_TRUE(metrics);

    auto again = co_await n->initialize(raft::membership{{1}, {}});
    EXPECT_FALSE(again);
    EXPECT_EQ(make_error_code(raft_error::ALREADY_INITIALIZED), again.error());
  });
}

TEST_F(raft_node_test_suit, membership_changes_on_leader) {
  run_raft_test("raft_membership", [](raft_harness& h) -> asio::awaitable<void> {
    auto node = h.start_node(1);
    EXPECT_TRUE(node);
    if (!node) {
      co_return;
    }
    auto& n = *node;
    EXPECT_TRUE(co_await n->initialize(raft::membership{{1}, {}}));
    EXPECT_TRUE(co_await n->wait(std::chrono::seconds(2)).state(raft::server_state::leader));

    auto unknown = co_await n->change_membership({1, 9});
    EXPECT_FALSE(unknown);
    EXPECT_EQ(make_error_code(raft_error::LEARNER_NOT_FOUND), unknown.error());

    auto empty = co_await n->change_membership({});
    EXPECT_FALSE(empty);
    EXPECT_EQ(make_error_code(raft_error::CONFIG_INVALID), empty.error());

    // learner 不参与提交，不可达的 learner 不影响变更
    EXPECT_TRUE(co_await n->add_learner(2));
    EXPECT_TRUE(co_await n->wait(std::chrono::seconds(1)).learners({2}));
    EXPECT_TRUE(co_await n->add_learner(2));
    EXPECT_EQ((std::set<node_id>{2}), n->metrics().membership.learners);

    // 已经是当前配置时直接返回
    EXPECT_TRUE(co_await n->change_membership({1}));

    EXPECT_TRUE(co_await n->remove_learner(2));
    EXPECT_TRUE(co_await n->wait(std::chrono::seconds(1)).learners({}));
    EXPECT_TRUE(co_await n->remove_learner(5));
    EXPECT_EQ((std::set<node_id>{1}), n->metrics().membership.voters);
  });
}

TEST_F(raft_node_test_suit, non_leader_rejects_proposals) {
  run_raft_test("raft_not_leader", [](raft_harness& h) -> asio::awaitable<void> {
    auto node = h.start_node(2);
    EXPECT_TRUE(node);
    if (!node) {
      co_return;
    }
    auto& n = *node;
    auto write = co_await n->client_write(log_entry{incr_seq{"s"}});
    EXPECT_FALSE(write);
    EXPECT_EQ(make_error_code(raft_error::NOT_LEADER), write.error());

    auto change = co_await n->change_membership({2});
    EXPECT_FALSE(change);
    EXPECT_EQ(make_error_code(raft_error::NOT_LEADER), change.error());

    auto learner = co_await n->add_learner(3);
    EXPECT_FALSE(learner);
    EXPECT_EQ(make_error_code(raft_error::NOT_LEADER), learner.error());
  });
}

TEST_F(raft_node_test_suit, follower_append_entries) {
  run_raft_test("raft_follower", [](raft_harness& h) -> asio::awaitable<void> {
    auto node = h.start_node(2);
    EXPECT_TRUE(node);
    if (!node) {
      co_return;
    }
    auto& n = *node;

    auto resp = co_await n->handle_append_entries(
        append_request(1, 1, raft::log_id{}, {membership_entry(0, 1, raft::membership{{1, 2}, {}}), blank_entry(1, 2)},
                       2));
    EXPECT_TRUE(resp);
    EXPECT_TRUE(resp->success());
    EXPECT_EQ(2u, resp->matched_index());

    auto m = co_await n->wait(std::chrono::seconds(1)).log(2, "replicated");
    EXPECT_TRUE(m);
    EXPECT_EQ(raft::server_state::follower, m->state);
    EXPECT_EQ(1u, m->current_leader.value_or(0));
    EXPECT_EQ(1u, m->current_term);
    EXPECT_EQ((std::set<node_id>{1, 2}), m->membership.voters);

    // prev 超出本地日志
    resp = co_await n->handle_append_entries(append_request(1, 1, raft::log_id{1, 5}, {}, 2));
    EXPECT_TRUE(resp);
    EXPECT_FALSE(resp->success());
    EXPECT_EQ(3u, resp->conflict_index());

    // prev term 不一致
    resp = co_await n->handle_append_entries(append_request(1, 1, raft::log_id{3, 2}, {}, 2));
    EXPECT_TRUE(resp);
    EXPECT_FALSE(resp->success());
    EXPECT_EQ(2u, resp->conflict_index());

    // 旧任期的请求
    resp = co_await n->handle_append_entries(append_request(0, 3, raft::log_id{}, {}, 0));
    EXPECT_TRUE(resp);
    EXPECT_FALSE(resp->success());
    EXPECT_EQ(1u, resp->term());

    // 未提交的日志被新 leader 覆盖
    resp = co_await n->handle_append_entries(append_request(
        1, 1, raft::log_id{1, 2},
        {normal_entry(1, 3, log_entry{incr_seq{"s"}}), normal_entry(1, 4, log_entry{incr_seq{"s"}})}, 2));
    EXPECT_TRUE(resp);
    EXPECT_EQ(4u, resp->matched_index());
    EXPECT_EQ(4u, n->metrics().last_log_index);

    resp = co_await n->handle_append_entries(append_request(2, 3, raft::log_id{1, 2}, {blank_entry(2, 3)}, 3));
    EXPECT_TRUE(resp);
    EXPECT_TRUE(resp->success());
    EXPECT_EQ(3u, resp->matched_index());

    m = co_await n->wait(std::chrono::seconds(1)).log(3, "overwritten");
    EXPECT_TRUE(m);
    EXPECT_EQ(3u, m->last_log_index);
    EXPECT_EQ(2u, m->current_term);
    EXPECT_EQ(3u, m->current_leader.value_or(0));
    EXPECT_EQ((raft::log_id{2, 3}), m->last_applied);
  });
}

TEST_F(raft_node_test_suit, vote_rules) {
  run_raft_test("raft_vote", [](raft_harness& h) -> asio::awaitable<void> {
    auto fresh = h.start_node(3);
    EXPECT_TRUE(fresh);
    if (!fresh) {
      co_return;
    }
    auto resp = co_await (*fresh)->handle_vote(vote_request(1, 1, raft::log_id{}));
    EXPECT_TRUE(resp);
    EXPECT_TRUE(resp->vote_granted());
    EXPECT_EQ(1u, resp->term());

    // 同一任期只投一票
    resp = co_await (*fresh)->handle_vote(vote_request(1, 2, raft::log_id{}));
    EXPECT_TRUE(resp);
    EXPECT_FALSE(resp->vote_granted());
    resp = co_await (*fresh)->handle_vote(vote_request(1, 1, raft::log_id{}));
    EXPECT_TRUE(resp->vote_granted());

    resp = co_await (*fresh)->handle_vote(vote_request(0, 2, raft::log_id{}));
    EXPECT_FALSE(resp->vote_granted());
    EXPECT_EQ(1u, resp->term());

    // learner 跟随 leader 1，membership 中不包含自己，不会发起选举
    auto learner = h.start_node(5);
    EXPECT_TRUE(learner);
    if (!learner) {
      co_return;
    }
    auto& l = *learner;
    auto append = co_await l->handle_append_entries(
        append_request(1, 1, raft::log_id{}, {membership_entry(0, 1, raft::membership{{1, 2}, {}}), blank_entry(1, 2)},
                       2));
    EXPECT_TRUE(append && append->success());

    // leader 刚刚发送过心跳，拒绝投票且不更新任期
    resp = co_await l->handle_vote(vote_request(2, 2, raft::log_id{1, 2}));
    EXPECT_FALSE(resp->vote_granted());
    EXPECT_EQ(1u, l->metrics().current_term);

    co_await sleep_for(std::chrono::milliseconds(150));

    // 日志落后的候选人
    resp = co_await l->handle_vote(vote_request(2, 2, raft::log_id{1, 1}));
    EXPECT_FALSE(resp->vote_granted());
    EXPECT_EQ(2u, resp->term());
    EXPECT_EQ((raft::log_id{1, 2}), pb::from_pb(resp->last_log_id()));

    resp = co_await l->handle_vote(vote_request(2, 1, raft::log_id{1, 2}));
    EXPECT_TRUE(resp->vote_granted());
  });
}

TEST_F(raft_node_test_suit, snapshot_and_purge) {
  run_raft_test("raft_snapshot", [](raft_harness& h) -> asio::awaitable<void> {
    auto config = fast_config();
    config.snapshot_logs_since_last = 5;
    config.max_applied_log_to_keep = 0;
    auto node = h.start_node(1, config);
    EXPECT_TRUE(node);
    if (!node) {
      co_return;
    }
    auto& n = *node;
    EXPECT_TRUE(co_await n->initialize(raft::membership{{1}, {}}));
    EXPECT_TRUE(co_await n->wait(std::chrono::seconds(2)).state(raft::server_state::leader));

    for (int i = 0; i < 8; ++i) {
      auto written = co_await n->client_write(log_entry{incr_seq{"s"}});
      EXPECT_TRUE(written);
    }

    auto m = co_await n->wait(std::chrono::seconds(2))
                 .metrics([](const raft::raft_metrics& m) { return m.snapshot && m.snapshot->index >= 5; },
                          "snapshot");
    EXPECT_TRUE(m);
    if (!m) {
      co_return;
    }
    // 快照之后立即清理到快照位置，期间可能又生成了新的快照
    EXPECT_GE(n->storage_->first_index(), m->snapshot->index + 1);

    auto payload = leaf_to_expected([&]() { return n->storage_->current_snapshot(); });
    EXPECT_TRUE(payload && *payload);
  });
}

TEST_F(raft_node_test_suit, restart_restores_state) {
  run_raft_test("raft_restart", [](raft_harness& h) -> asio::awaitable<void> {
    {
      auto node = h.start_node(1);
      EXPECT_TRUE(node);
      if (!node) {
        co_return;
      }
      EXPECT_TRUE(co_await (*node)->initialize(raft::membership{{1}, {}}));
      EXPECT_TRUE(co_await (*node)->wait(std::chrono::seconds(2)).state(raft::server_state::leader));
      for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(co_await (*node)->client_write(log_entry{incr_seq{"s"}}));
      }
      co_await (*node)->shutdown();
      EXPECT_EQ(raft::server_state::shutdown, (*node)->metrics().state);

      auto stopped = co_await (*node)->client_write(log_entry{incr_seq{"s"}});
      EXPECT_FALSE(stopped);
      EXPECT_EQ(make_error_code(raft_error::STOPPED), stopped.error());
    }

    auto node = h.start_node(1);
    EXPECT_TRUE(node);
    if (!node) {
      co_return;
    }
    auto& n = *node;
    // 已提交日志在启动时重放
    EXPECT_GE(n->metrics().last_applied.index, 5u);
    EXPECT_TRUE(co_await n->wait(std::chrono::seconds(2)).state(raft::server_state::leader, "restart"));
    auto written = co_await n->client_write(log_entry{incr_seq{"s"}});
    EXPECT_TRUE(written);
    EXPECT_EQ(applied_state{applied_seq{4}}, written->data);
  });
}

TEST_F(raft_node_test_suit, watch_notifies_waiters) {
  asio::io_context io;
  auto w = std::make_shared<coro::watch<int>>(0);
  auto fut = asio::co_spawn(
      io,
      [w]() -> asio::awaitable<void> {
        auto [value, version] = w->borrow_with_version();
        EXPECT_EQ(0, value);

        asio::co_spawn(
            co_await asio::this_coro::executor,
            [w]() -> asio::awaitable<void> {
              co_await sleep_for(std::chrono::milliseconds(10));
              w->send(1);
            },
            asio::detached);
        auto changed = co_await w->changed(version);
        EXPECT_TRUE(changed);
        EXPECT_EQ(1, w->borrow());

        // 版本已变化时立即返回
        EXPECT_TRUE(co_await w->changed(version));

        w->close();
        auto closed = co_await w->changed(w->version());
        EXPECT_FALSE(closed);
        EXPECT_EQ(make_error_code(raft_error::STOPPED), closed.error());
        // 关闭后 send 被忽略
        w->send(2);
        EXPECT_EQ(1, w->borrow());
      },
      asio::use_future);
  io.run();
  fut.get();
}

TEST_F(raft_node_test_suit, wait_times_out) {
  asio::io_context io;
  auto w = std::make_shared<raft::metrics_watch>(raft::raft_metrics{});
  auto fut = asio::co_spawn(
      io,
      [w]() -> asio::awaitable<void> {
        auto start = std::chrono::steady_clock::now();
        EXPECT_EQ("leader", enum_name(raft::server_state::leader));
        auto r = co_await raft::wait(w, std::chrono::milliseconds(50)).state(raft::server_state::leader, "never");
        EXPECT_FALSE(r);
        EXPECT_EQ(make_error_code(raft_error::TIMEOUT), r.error());
        EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));

        raft::raft_metrics m;
        m.current_leader = 3;
        w->send(m);
        auto leader = co_await raft::wait(w, std::chrono::milliseconds(50)).current_leader(3);
        EXPECT_TRUE(leader);
      },
      asio::use_future);
  io.run();
  fut.get();
}

TEST_F(raft_node_test_suit, start_refuses_undecodable_committed_entry) {
  run_raft_test("raft_corrupted_start", [](raft_harness& h) -> asio::awaitable<void> {
    {
      auto logger = std::make_shared<spdlog_logger>("[store-1]");
      auto store = leaf_to_expected(
          [&]() { return store::meta_store::open_create(h.node_dir(1), 1, true, true, logger); });
      EXPECT_TRUE(store);
      if (!store) {
        co_return;
      }
      auto& s = *store;
      pb::entry_list entries{membership_entry(0, 1, raft::membership{{1}, {}}), blank_entry(1, 2),
                             undecodable_entry(1, 3)};
      EXPECT_TRUE(leaf_to_expected_void([&]() { return s->append(entries); }));
      metadpb::hard_state hs;
      hs.set_current_term(1);
      hs.set_committed(3);
      EXPECT_TRUE(leaf_to_expected_void([&]() { return s->save_hard_state(hs); }));
    }

    auto node = h.start_node(1);
    EXPECT_FALSE(node);
    if (!node) {
      EXPECT_EQ(make_error_code(storage_error::CORRUPTED), node.error());
    }
  });
}

TEST_F(raft_node_test_suit, apply_failure_halts_follower) {
  run_raft_test("raft_corrupted_apply", [](raft_harness& h) -> asio::awaitable<void> {
    auto node = h.start_node(2);
    EXPECT_TRUE(node);
    if (!node) {
      co_return;
    }
    auto n = *node;

    auto resp = co_await n->handle_append_entries(append_request(
        1, 1, raft::log_id{}, {membership_entry(0, 1, raft::membership{{1, 2}, {}}), undecodable_entry(1, 2)}, 2));
    EXPECT_FALSE(resp);
    if (!resp) {
      EXPECT_EQ(make_error_code(raft_error::STOPPED), resp.error());
    }
    EXPECT_EQ(raft::server_state::shutdown, n->metrics().state);
    EXPECT_EQ(0u, n->metrics().last_applied.index);

    // 停止后不再接受任何请求
    resp = co_await n->handle_append_entries(append_request(1, 1, raft::log_id{0, 1}, {}, 2));
    EXPECT_FALSE(resp);
    auto vote = co_await n->handle_vote(vote_request(2, 1, raft::log_id{1, 2}));
    EXPECT_FALSE(vote);

    // 已提交的位置已经落盘，重启时同样拒绝
    co_await n->shutdown();
    auto reopened = h.start_node(2);
    EXPECT_FALSE(reopened);
    if (!reopened) {
      EXPECT_EQ(make_error_code(storage_error::CORRUPTED), reopened.error());
    }
  });
}
