#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <set>

#include "error/leaf_expected.h"
#include "error/raft_error.h"
#include "raft/config.h"
#include "raft/quorum.h"
#include "raft/snapshot_policy.h"
#include "raft/types.h"

using namespace metad;
using namespace metad::raft;

class quorum_test_suit : public testing::Test {
 protected:
  static void SetUpTestSuite() { std::cout << "run before first case..." << std::endl; }

  static void TearDownTestSuite() { std::cout << "run after last case..." << std::endl; }

  virtual void SetUp() override { std::cout << "enter from SetUp" << std::endl; }

  virtual void TearDown() override { std::cout << "exit from TearDown" << std::endl; }
};

static quorum::log_index committed(const std::set<std::uint64_t>& ids, std::map<std::uint64_t, quorum::log_index> acked) {
  quorum::majority_config c(ids);
  quorum::map_ack_indexer indexer(std::move(acked));
  return c.committed_index(&indexer);
}

TEST_F(quorum_test_suit, committed_index) {
  ASSERT_EQ(quorum::INVALID_LOG_INDEX, committed({}, {}));
  ASSERT_EQ(5u, committed({1}, {{1, 5}}));
  ASSERT_EQ(0u, committed({1, 2}, {{1, 5}}));
  ASSERT_EQ(4u, committed({1, 2}, {{1, 5}, {2, 4}}));
  ASSERT_EQ(4u, committed({1, 2, 3}, {{1, 5}, {2, 4}}));
  ASSERT_EQ(4u, committed({1, 2, 3}, {{1, 5}, {2, 4}, {3, 1}}));
  ASSERT_EQ(3u, committed({1, 2, 3, 4}, {{1, 5}, {2, 4}, {3, 3}, {4, 1}}));
  ASSERT_EQ(4u, committed({1, 2, 3, 4, 5}, {{1, 5}, {2, 4}, {3, 4}, {4, 1}, {5, 9}}));
  // 不在配置中的应答不参与计算
  ASSERT_EQ(0u, committed({1, 2, 3}, {{1, 5}, {7, 9}, {8, 9}}));
}

TEST_F(quorum_test_suit, vote_result) {
  quorum::majority_config empty;
  ASSERT_EQ(quorum::vote_result::VOTE_WON, empty.vote_result_statistics({}));

  quorum::majority_config one(std::set<std::uint64_t>{1});
  ASSERT_EQ(quorum::vote_result::VOTE_PENDING, one.vote_result_statistics({}));
  ASSERT_EQ(quorum::vote_result::VOTE_WON, one.vote_result_statistics({{1, true}}));
  ASSERT_EQ(quorum::vote_result::VOTE_LOST, one.vote_result_statistics({{1, false}}));

  quorum::majority_config three(std::set<std::uint64_t>{1, 2, 3});
  ASSERT_EQ(quorum::vote_result::VOTE_PENDING, three.vote_result_statistics({{1, true}}));
  ASSERT_EQ(quorum::vote_result::VOTE_WON, three.vote_result_statistics({{1, true}, {3, true}}));
  ASSERT_EQ(quorum::vote_result::VOTE_PENDING, three.vote_result_statistics({{1, true}, {2, false}}));
  ASSERT_EQ(quorum::vote_result::VOTE_LOST, three.vote_result_statistics({{1, false}, {2, false}}));
  // 非成员的投票不计入
  ASSERT_EQ(quorum::vote_result::VOTE_PENDING, three.vote_result_statistics({{1, true}, {9, true}}));
}

TEST_F(quorum_test_suit, snapshot_policy) {
  snapshot_policy policy(10, 3);
  ASSERT_FALSE(policy.should_build(9, 0));
  ASSERT_TRUE(policy.should_build(10, 0));
  ASSERT_FALSE(policy.should_build(15, 10));
  ASSERT_TRUE(policy.should_build(21, 10));

  ASSERT_FALSE(policy.purge_upto(3));
  ASSERT_EQ(7u, policy.purge_upto(10).value());

  snapshot_policy keep_none(10, 0);
  ASSERT_EQ(10u, keep_none.purge_upto(10).value());
  ASSERT_FALSE(keep_none.purge_upto(0));

  raft_config config;
  config.snapshot_logs_since_last = 4;
  config.max_applied_log_to_keep = 1;
  snapshot_policy from_config(config);
  ASSERT_TRUE(from_config.should_build(4, 0));
  ASSERT_EQ(3u, from_config.purge_upto(4).value());
}

TEST_F(quorum_test_suit, raft_config_validate) {
  raft_config config;
  ASSERT_TRUE(leaf_to_expected_void([&]() { return config.validate(); }));

  auto invalid = [](raft_config c) {
    auto r = leaf_to_expected_void([&]() { return c.validate(); });
    return !r && r.error() == raft_error::CONFIG_INVALID;
  };

  auto c = config;
  c.heartbeat_interval = std::chrono::milliseconds(0);
  ASSERT_TRUE(invalid(c));

  c = config;
  c.election_timeout_min = c.heartbeat_interval;
  ASSERT_TRUE(invalid(c));

  c = config;
  c.election_timeout_max = c.election_timeout_min;
  ASSERT_TRUE(invalid(c));

  c = config;
  c.write_timeout = std::chrono::milliseconds(0);
  ASSERT_TRUE(invalid(c));

  c = config;
  c.max_payload_entries = 0;
  ASSERT_TRUE(invalid(c));

  c = config;
  c.snapshot_logs_since_last = 0;
  ASSERT_TRUE(invalid(c));

  c = config;
  c.max_applied_log_to_keep = 0;
  ASSERT_FALSE(invalid(c));
}

TEST_F(quorum_test_suit, membership) {
  membership m{{1, 2}, {3}};
  ASSERT_TRUE(m.is_voter(1));
  ASSERT_FALSE(m.is_voter(3));
  ASSERT_TRUE(m.is_learner(3));
  ASSERT_TRUE(m.contains(3));
  ASSERT_FALSE(m.contains(4));
  ASSERT_EQ((std::set<node_id>{1, 2, 3}), m.all_members());
  ASSERT_FALSE(m.empty());
  ASSERT_TRUE(membership{}.empty());
}
