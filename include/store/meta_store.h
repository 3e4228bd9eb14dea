#pragma once
#ifndef _METAD_META_STORE_H_
#define _METAD_META_STORE_H_
#include <metad.pb.h>
#include <rocksdb/db.h>
#include <rocksdb/env.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "basic/logger.h"
#include "basic/utility_macros.h"
#include "error/leaf.h"
#include "pb/types.h"
#include "raft/storage.h"
#include "raft/types.h"
#include "state_machine/state_machine.h"
#include "types/meta_types.h"

namespace metad::store {

// 列族名称
inline constexpr std::string_view LOGS_CF = "logs";
inline constexpr std::string_view RAFT_STATE_CF = "raft_state";
inline constexpr std::string_view SNAPSHOT_CF = "snapshot";

// raft_dir 下的进程锁文件
inline constexpr std::string_view LOCK_FILE_NAME = "metad.lock";

// 日志 key：大端序 index，保证按 index 有序
std::string encode_log_key(std::uint64_t index);
std::uint64_t decode_log_key(std::string_view key);

// RocksDB 持久化的日志、hard state 和快照，同时持有内存状态机。
// 状态机只在 raft strand 上通过 apply / install_snapshot 修改；save_snapshot 可以在后台线程调用
class meta_store {
  NOT_COPYABLE_NOT_MOVABLE(meta_store)
 public:
  // open 为 false 时目录已存在返回 ALREADY_EXISTS；create 为 false 时目录不存在返回 NOT_FOUND
  static leaf::result<std::shared_ptr<meta_store>> open_create(const std::string& dir, node_id id, bool open,
                                                               bool create, std::shared_ptr<logger_interface> logger);

  ~meta_store();

  node_id id() const { return id_; }

  // 打开的是已有数据时返回 true
  bool is_opened() const { return opened_; }

  const std::string& dir() const { return dir_; }

  leaf::result<raft::initial_state> initial_state() const;

  leaf::result<void> save_hard_state(const metadpb::hard_state& hs);

  leaf::result<metadpb::hard_state> read_hard_state() const;

  leaf::result<pb::entry_list> entries(std::uint64_t lo, std::uint64_t hi) const;

  leaf::result<std::uint64_t> term(std::uint64_t index) const;

  std::uint64_t first_index() const;

  raft::log_id last_log_id() const;

  raft::log_id last_purged() const;

  leaf::result<void> append(const pb::entry_list& entries);

  leaf::result<void> truncate_since(std::uint64_t index);

  leaf::result<void> purge_upto(std::uint64_t index);

  leaf::result<std::pair<raft::membership, std::uint64_t>> effective_membership() const;

  leaf::result<std::vector<applied_state>> apply(const pb::entry_list& entries);

  sm::state_data snapshot_view() const { return sm_.copy(); }

  leaf::result<metadpb::snapshot_meta> save_snapshot(const sm::state_data& view);

  leaf::result<std::optional<raft::snapshot_payload>> current_snapshot() const;

  leaf::result<void> install_snapshot(const metadpb::snapshot_meta& meta, const std::string& data);

  std::optional<node> get_node(node_id id) const { return sm_.get_node(id); }

  std::map<node_id, node> get_nodes() const { return sm_.get_nodes(); }

  std::optional<seqv> get_kv(std::string_view key) const { return sm_.get_kv(key); }

  std::vector<std::pair<std::string, seqv>> prefix_list_kv(std::string_view prefix) const {
    return sm_.prefix_list_kv(prefix);
  }

  std::optional<std::uint64_t> get_sequence(std::string_view key) const { return sm_.get_sequence(key); }

  const sm::state_machine& state_machine() const { return sm_; }

 private:
  struct private_tag {
    explicit private_tag() = default;
  };

 public:
  meta_store(private_tag, std::string dir, node_id id, rocksdb::Env* env, rocksdb::FileLock* lock,
             std::shared_ptr<logger_interface> logger);

 private:

  leaf::result<void> open_db();
  leaf::result<void> init_new();
  leaf::result<void> load_existing();
  leaf::result<void> load_log_bounds();
  leaf::result<void> load_snapshot();

  leaf::result<std::optional<std::string>> get(rocksdb::ColumnFamilyHandle* cf, std::string_view key) const;
  leaf::result<void> write(rocksdb::WriteBatch& batch);
  leaf::result<metadpb::entry> read_entry(std::uint64_t index) const;
  leaf::result<std::uint64_t> term_locked(std::uint64_t index) const;

  std::string dir_;
  node_id id_;
  bool opened_ = false;
  rocksdb::Env* env_;
  rocksdb::FileLock* lock_;
  std::shared_ptr<logger_interface> logger_;

  std::unique_ptr<rocksdb::DB> db_;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  rocksdb::ColumnFamilyHandle* logs_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* state_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* snapshot_cf_ = nullptr;

  sm::state_machine sm_;

  // 保护下面的缓存；RocksDB 自身线程安全
  mutable std::mutex mutex_;
  raft::log_id last_purged_;
  raft::log_id last_log_id_;
  std::optional<metadpb::snapshot_meta> snapshot_meta_;
  std::uint64_t snapshot_seq_ = 0;
};

using meta_store_ptr = std::shared_ptr<meta_store>;

}  // namespace metad::store

#endif  // _METAD_META_STORE_H_
