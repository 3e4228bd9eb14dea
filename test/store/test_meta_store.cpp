#include <gtest/gtest.h>
#include <metad.pb.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "basic/spdlog_logger.h"
#include "error/leaf_expected.h"
#include "error/storage_error.h"
#include "pb/codec.h"
#include "raft/types.h"
#include "store/meta_store.h"
#include "test_meta_utils.h"
#include "types/meta_types.h"

using namespace metad;
using metad::test::blank_entry;
using metad::test::membership_entry;
using metad::test::normal_entry;
using metad::test::temp_dir;

class meta_store_test_suit : public testing::Test {
 protected:
  static void SetUpTestSuite() { std::cout << "run before first case..." << std::endl; }

  static void TearDownTestSuite() { std::cout << "run after last case..." << std::endl; }

  virtual void SetUp() override { std::cout << "enter from SetUp" << std::endl; }

  virtual void TearDown() override { std::cout << "exit from TearDown" << std::endl; }
};

static expected<store::meta_store_ptr> open_store(const std::string& dir, node_id id, bool open = true,
                                                  bool create = true) {
  return leaf_to_expected([&]() {
    return store::meta_store::open_create(dir, id, open, create, std::make_shared<spdlog_logger>("[store]"));
  });
}

// 日志 1..5，term 依次为 1 1 2 2 3
static pb::entry_list sample_entries() {
  return pb::entry_list{
      blank_entry(1, 1),
      normal_entry(1, 2, log_entry{upsert_kv::update("a", "1")}),
      blank_entry(2, 3),
      normal_entry(2, 4, log_entry{incr_seq{"s"}}),
      normal_entry(3, 5, log_entry{upsert_kv::update("b", "2")}),
  };
}

TEST_F(meta_store_test_suit, log_key_order) {
  ASSERT_LT(store::encode_log_key(1), store::encode_log_key(2));
  ASSERT_LT(store::encode_log_key(255), store::encode_log_key(256));
  ASSERT_LT(store::encode_log_key(0xffff), store::encode_log_key(0x10000));
  ASSERT_EQ(8u, store::encode_log_key(1).size());
  ASSERT_EQ(0x0102030405060708u, store::decode_log_key(store::encode_log_key(0x0102030405060708u)));
}

TEST_F(meta_store_test_suit, open_create_flags) {
  temp_dir dir("store_flags");
  auto path = dir.sub("raft");

  auto missing = open_store(path, 1, true, false);
  ASSERT_FALSE(missing);
  ASSERT_EQ(make_error_code(storage_error::NOT_FOUND), missing.error());

  {
    auto created = open_store(path, 1, false, true);
    ASSERT_TRUE(created);
    ASSERT_FALSE((*created)->is_opened());
  }

  auto exists = open_store(path, 1, false, true);
  ASSERT_FALSE(exists);
  ASSERT_EQ(make_error_code(storage_error::ALREADY_EXISTS), exists.error());

  {
    auto opened = open_store(path, 1, true, false);
    ASSERT_TRUE(opened);
    ASSERT_TRUE((*opened)->is_opened());
  }

  auto wrong_id = open_store(path, 2);
  ASSERT_FALSE(wrong_id);
  ASSERT_EQ(make_error_code(storage_error::ID_MISMATCH), wrong_id.error());
}

TEST_F(meta_store_test_suit, exclusive_lock) {
  temp_dir dir("store_lock");
  auto path = dir.sub("raft");
  auto first = open_store(path, 1);
  ASSERT_TRUE(first);

  auto second = open_store(path, 1);
  ASSERT_FALSE(second);
  ASSERT_EQ(make_error_code(storage_error::LOCKED), second.error());

  // 释放后可以再次打开
  first->reset();
  auto third = open_store(path, 1);
  ASSERT_TRUE(third);
}

TEST_F(meta_store_test_suit, append_and_read_entries) {
  temp_dir dir("store_append");
  auto store = open_store(dir.sub("raft"), 1);
  ASSERT_TRUE(store);
  auto& s = *store;

  ASSERT_EQ(raft::log_id{}, s->last_log_id());
  ASSERT_EQ(1u, s->first_index());
  ASSERT_TRUE(leaf_to_expected_void([&]() { return s->append(sample_entries()); }));
  ASSERT_EQ((raft::log_id{3, 5}), s->last_log_id());

  auto all = leaf_to_expected([&]() { return s->entries(1, 6); });
  ASSERT_TRUE(all);
  ASSERT_EQ(5u, all->size());
  ASSERT_EQ(1u, all->front().index());
  ASSERT_EQ(5u, all->back().index());

  auto part = leaf_to_expected([&]() { return s->entries(2, 4); });
  ASSERT_TRUE(part);
  ASSERT_EQ(2u, part->size());
  ASSERT_EQ(metadpb::ENTRY_NORMAL, (*part)[0].type());

  auto empty = leaf_to_expected([&]() { return s->entries(3, 3); });
  ASSERT_TRUE(empty);
  ASSERT_TRUE(empty->empty());

  auto beyond = leaf_to_expected([&]() { return s->entries(1, 7); });
  ASSERT_FALSE(beyond);
  ASSERT_EQ(make_error_code(storage_error::UNAVAILABLE), beyond.error());

  ASSERT_EQ(0u, leaf_to_expected([&]() { return s->term(0); }).value());
  ASSERT_EQ(1u, leaf_to_expected([&]() { return s->term(2); }).value());
  ASSERT_EQ(2u, leaf_to_expected([&]() { return s->term(4); }).value());
  ASSERT_EQ(3u, leaf_to_expected([&]() { return s->term(5); }).value());
  auto term6 = leaf_to_expected([&]() { return s->term(6); });
  ASSERT_FALSE(term6);
  ASSERT_EQ(make_error_code(storage_error::UNAVAILABLE), term6.error());
}

TEST_F(meta_store_test_suit, append_overwrites_conflicting_suffix) {
  temp_dir dir("store_overwrite");
  auto store = open_store(dir.sub("raft"), 1);
  ASSERT_TRUE(store);
  auto& s = *store;
  ASSERT_TRUE(leaf_to_expected_void([&]() { return s->append(sample_entries()); }));

  // 从 4 开始覆盖，5 之后的旧日志一并删除
  ASSERT_TRUE(leaf_to_expected_void([&]() { return s->append({blank_entry(4, 4)}); }));
  ASSERT_EQ((raft::log_id{4, 4}), s->last_log_id());
  auto beyond = leaf_to_expected([&]() { return s->entries(5, 6); });
  ASSERT_FALSE(beyond);

  // 不连续的追加被拒绝
  auto gap = leaf_to_expected_void([&]() { return s->append({blank_entry(4, 6)}); });
  ASSERT_FALSE(gap);
  ASSERT_EQ(make_error_code(storage_error::UNAVAILABLE), gap.error());
  ASSERT_EQ((raft::log_id{4, 4}), s->last_log_id());
}

TEST_F(meta_store_test_suit, truncate_since) {
  temp_dir dir("store_truncate");
  auto store = open_store(dir.sub("raft"), 1);
  ASSERT_TRUE(store);
  auto& s = *store;
  ASSERT_TRUE(leaf_to_expected_void([&]() { return s->append(sample_entries()); }));

  ASSERT_TRUE(leaf_to_expected_void([&]() { return s->truncate_since(4); }));
  ASSERT_EQ((raft::log_id{2, 3}), s->last_log_id());
  ASSERT_FALSE(leaf_to_expected([&]() { return s->entries(4, 5); }));

  // 超出末尾时不做任何事
  ASSERT_TRUE(leaf_to_expected_void([&]() { return s->truncate_since(10); }));
  ASSERT_EQ((raft::log_id{2, 3}), s->last_log_id());

  ASSERT_TRUE(leaf_to_expected_void([&]() { return s->truncate_since(1); }));
  ASSERT_EQ(raft::log_id{}, s->last_log_id());
}

TEST_F(meta_store_test_suit, purge_upto) {
  temp_dir dir("store_purge");
  auto path = dir.sub("raft");
  {
    auto store = open_store(path, 1);
    ASSERT_TRUE(store);
    auto& s = *store;
    ASSERT_TRUE(leaf_to_expected_void([&]() { return s->append(sample_entries()); }));

    ASSERT_TRUE(leaf_to_expected_void([&]() { return s->purge_upto(3); }));
    ASSERT_EQ(4u, s->first_index());
    ASSERT_EQ((raft::log_id{2, 3}), s->last_purged());
    // 最后清理位置的 term 仍可查询
    ASSERT_EQ(2u, leaf_to_expected([&]() { return s->term(3); }).value());

    auto compacted = leaf_to_expected([&]() { return s->term(2); });
    ASSERT_FALSE(compacted);
    ASSERT_EQ(make_error_code(storage_error::COMPACTED), compacted.error());
    auto entries = leaf_to_expected([&]() { return s->entries(3, 5); });
    ASSERT_FALSE(entries);
    ASSERT_EQ(make_error_code(storage_error::COMPACTED), entries.error());
    ASSERT_EQ(2u, leaf_to_expected([&]() { return s->entries(4, 6); })->size());

    // 回退的清理请求被忽略
    ASSERT_TRUE(leaf_to_expected_void([&]() { return s->purge_upto(2); }));
    ASSERT_EQ(4u, s->first_index());

    auto too_far = leaf_to_expected_void([&]() { return s->purge_upto(6); });
    ASSERT_FALSE(too_far);

    // 不能截断已清理的日志
    auto truncate = leaf_to_expected_void([&]() { return s->truncate_since(2); });
    ASSERT_FALSE(truncate);
    ASSERT_EQ(make_error_code(storage_error::COMPACTED), truncate.error());
  }

  auto reopened = open_store(path, 1);
  ASSERT_TRUE(reopened);
  ASSERT_EQ((raft::log_id{2, 3}), (*reopened)->last_purged());
  ASSERT_EQ((raft::log_id{3, 5}), (*reopened)->last_log_id());
  ASSERT_EQ(4u, (*reopened)->first_index());
}

TEST_F(meta_store_test_suit, hard_state_persisted) {
  temp_dir dir("store_hard_state");
  auto path = dir.sub("raft");
  {
    auto store = open_store(path, 1);
    ASSERT_TRUE(store);
    auto hs = leaf_to_expected([&]() { return (*store)->read_hard_state(); });
    ASSERT_TRUE(hs);
    ASSERT_EQ(0u, hs->current_term());
    ASSERT_FALSE(hs->has_voted_for());

    metadpb::hard_state next;
    next.set_current_term(7);
    next.set_voted_for(3);
    next.set_committed(12);
    ASSERT_TRUE(leaf_to_expected_void([&]() { return (*store)->save_hard_state(next); }));
  }

  auto reopened = open_store(path, 1);
  ASSERT_TRUE(reopened);
  auto state = leaf_to_expected([&]() { return (*reopened)->initial_state(); });
  ASSERT_TRUE(state);
  ASSERT_EQ(7u, state->hard_state.current_term());
  ASSERT_EQ(3u, state->hard_state.voted_for());
  ASSERT_EQ(12u, state->hard_state.committed());
}

TEST_F(meta_store_test_suit, effective_membership_follows_log) {
  temp_dir dir("store_membership");
  auto store = open_store(dir.sub("raft"), 1);
  ASSERT_TRUE(store);
  auto& s = *store;

  raft::membership m1{{1}, {}};
  raft::membership m3{{1}, {2}};
  ASSERT_TRUE(leaf_to_expected_void([&]() {
    return s->append({membership_entry(0, 1, m1), blank_entry(1, 2), membership_entry(1, 3, m3)});
  }));

  auto effective = leaf_to_expected([&]() { return s->effective_membership(); });
  ASSERT_TRUE(effective);
  ASSERT_EQ(m3, effective->first);
  ASSERT_EQ(3u, effective->second);

  // 未提交的成员配置被截断后回退到上一条
  ASSERT_TRUE(leaf_to_expected_void([&]() { return s->truncate_since(3); }));
  effective = leaf_to_expected([&]() { return s->effective_membership(); });
  ASSERT_EQ(m1, effective->first);
  ASSERT_EQ(1u, effective->second);
}

TEST_F(meta_store_test_suit, snapshot_save_and_install) {
  temp_dir dir("store_snapshot");
  auto source = open_store(dir.sub("source"), 1);
  ASSERT_TRUE(source);
  auto& s = *source;

  raft::membership m{{1}, {}};
  pb::entry_list ents{membership_entry(0, 1, m), normal_entry(1, 2, log_entry{upsert_kv::update("k", "v")}),
                      normal_entry(1, 3, log_entry{add_node{1, node{"1", "127.0.0.1:1", std::nullopt}}})};
  ASSERT_TRUE(leaf_to_expected_void([&]() { return s->append(ents); }));
  ASSERT_TRUE(leaf_to_expected([&]() { return s->apply(ents); }));

  auto none = leaf_to_expected([&]() { return s->current_snapshot(); });
  ASSERT_TRUE(none);
  ASSERT_FALSE(*none);

  auto view = s->snapshot_view();
  auto meta = leaf_to_expected([&]() { return s->save_snapshot(view); });
  ASSERT_TRUE(meta);
  ASSERT_EQ((raft::log_id{1, 3}), pb::from_pb(meta->last_log_id()));
  ASSERT_EQ(m, pb::from_pb(meta->membership()));
  ASSERT_FALSE(meta->snapshot_id().empty());

  // 不比现有快照新的视图直接返回已有快照
  auto again = leaf_to_expected([&]() { return s->save_snapshot(view); });
  ASSERT_TRUE(again);
  ASSERT_EQ(meta->snapshot_id(), again->snapshot_id());

  auto payload = leaf_to_expected([&]() { return s->current_snapshot(); });
  ASSERT_TRUE(payload);
  ASSERT_TRUE(*payload);
  ASSERT_EQ(meta->checksum(), (*payload)->meta.checksum());

  auto target = open_store(dir.sub("target"), 2);
  ASSERT_TRUE(target);
  auto& t = *target;

  std::string corrupted = (*payload)->data + "x";
  auto bad = leaf_to_expected_void([&]() { return t->install_snapshot((*payload)->meta, corrupted); });
  ASSERT_FALSE(bad);
  ASSERT_EQ(make_error_code(storage_error::SNAPSHOT_MISMATCH), bad.error());

  ASSERT_TRUE(leaf_to_expected_void([&]() { return t->install_snapshot((*payload)->meta, (*payload)->data); }));
  ASSERT_EQ("v", t->get_kv("k")->data);
  ASSERT_TRUE(t->get_node(1));
  ASSERT_EQ((raft::log_id{1, 3}), t->state_machine().last_applied());
  ASSERT_EQ((raft::log_id{1, 3}), t->last_purged());
  ASSERT_EQ((raft::log_id{1, 3}), t->last_log_id());
  ASSERT_EQ(4u, t->first_index());

  auto effective = leaf_to_expected([&]() { return t->effective_membership(); });
  ASSERT_TRUE(effective);
  ASSERT_EQ(m, effective->first);
}

TEST_F(meta_store_test_suit, install_snapshot_keeps_matching_suffix) {
  temp_dir dir("store_snapshot_suffix");
  auto source = open_store(dir.sub("source"), 1);
  auto target = open_store(dir.sub("target"), 2);
  ASSERT_TRUE(source);
  ASSERT_TRUE(target);

  auto ents = sample_entries();
  pb::entry_list head(ents.begin(), ents.begin() + 3);
  ASSERT_TRUE(leaf_to_expected_void([&]() { return (*source)->append(head); }));
  ASSERT_TRUE(leaf_to_expected([&]() { return (*source)->apply(head); }));
  ASSERT_TRUE(leaf_to_expected([&]() { return (*source)->save_snapshot((*source)->snapshot_view()); }));
  auto payload = leaf_to_expected([&]() { return (*source)->current_snapshot(); });
  ASSERT_TRUE(payload && *payload);

  ASSERT_TRUE(leaf_to_expected_void([&]() { return (*target)->append(ents); }));
  ASSERT_TRUE(leaf_to_expected_void([&]() { return (*target)->install_snapshot((*payload)->meta, (*payload)->data); }));
  // 快照位置 term 一致，4 和 5 保留
  ASSERT_EQ((raft::log_id{3, 5}), (*target)->last_log_id());
  ASSERT_EQ(4u, (*target)->first_index());
  ASSERT_EQ(2u, leaf_to_expected([&]() { return (*target)->entries(4, 6); })->size());
}

TEST_F(meta_store_test_suit, reopen_restores_snapshot) {
  temp_dir dir("store_reopen");
  auto path = dir.sub("raft");
  auto ents = sample_entries();
  {
    auto store = open_store(path, 1);
    ASSERT_TRUE(store);
    auto& s = *store;
    ASSERT_TRUE(leaf_to_expected_void([&]() { return s->append(ents); }));
    pb::entry_list head(ents.begin(), ents.begin() + 4);
    ASSERT_TRUE(leaf_to_expected([&]() { return s->apply(head); }));
    ASSERT_TRUE(leaf_to_expected([&]() { return s->save_snapshot(s->snapshot_view()); }));
    ASSERT_TRUE(leaf_to_expected_void([&]() { return s->purge_upto(4); }));
  }

  auto reopened = open_store(path, 1);
  ASSERT_TRUE(reopened);
  auto& s = *reopened;
  ASSERT_TRUE(s->is_opened());
  ASSERT_EQ("1", s->get_kv("a")->data);
  ASSERT_EQ(1u, s->get_sequence("s").value());
  ASSERT_FALSE(s->get_kv("b"));

  auto state = leaf_to_expected([&]() { return s->initial_state(); });
  ASSERT_TRUE(state);
  ASSERT_EQ((raft::log_id{2, 4}), state->last_applied);
  ASSERT_EQ((raft::log_id{3, 5}), state->last_log_id);
  ASSERT_TRUE(state->snapshot_last);
  ASSERT_EQ((raft::log_id{2, 4}), *state->snapshot_last);
}
