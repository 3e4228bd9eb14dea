#include "store/meta_store.h"

#include <absl/crc/crc32c.h>
#include <fmt/format.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>

#include <filesystem>

#include "error/error.h"
#include "error/rocksdb_err.h"
#include "error/storage_error.h"
#include "pb/codec.h"

namespace metad::store {

static constexpr std::string_view ID_KEY = "id";
static constexpr std::string_view HARD_STATE_KEY = "hard_state";
static constexpr std::string_view LAST_PURGED_KEY = "last_purged";
static constexpr std::string_view SNAPSHOT_META_KEY = "meta";
static constexpr std::string_view SNAPSHOT_DATA_KEY = "data";

static rocksdb::Slice to_slice(std::string_view s) { return rocksdb::Slice(s.data(), s.size()); }

static std::uint32_t crc32c(std::string_view data) { return static_cast<std::uint32_t>(absl::ComputeCrc32c(data)); }

static auto rocksdb_error(const rocksdb::Status& s, std::string_view what) {
  return new_error(make_error_code(s), fmt::format("{}: {}", what, s.ToString()));
}

std::string encode_log_key(std::uint64_t index) {
  std::string key(8, '\0');
  for (int i = 7; i >= 0; --i) {
    key[i] = static_cast<char>(index & 0xff);
    index >>= 8;
  }
  return key;
}

std::uint64_t decode_log_key(std::string_view key) {
  std::uint64_t index = 0;
  for (std::size_t i = 0; i < 8 && i < key.size(); ++i) {
    index = (index << 8) | static_cast<std::uint8_t>(key[i]);
  }
  return index;
}

meta_store::meta_store(private_tag, std::string dir, node_id id, rocksdb::Env* env, rocksdb::FileLock* lock,
                       std::shared_ptr<logger_interface> logger)
    : dir_(std::move(dir)), id_(id), env_(env), lock_(lock), logger_(std::move(logger)) {}

meta_store::~meta_store() {
  for (auto* handle : handles_) {
    if (auto s = db_->DestroyColumnFamilyHandle(handle); !s.ok()) {
      LOGGER_WARN(logger_, "destroy column family handle failed: {}", s.ToString());
    }
  }
  handles_.clear();
  if (db_) {
    if (auto s = db_->Close(); !s.ok()) {
      LOGGER_WARN(logger_, "close {} failed: {}", dir_, s.ToString());
    }
    db_.reset();
  }
  if (lock_ != nullptr) {
    if (auto s = env_->UnlockFile(lock_); !s.ok()) {
      LOGGER_WARN(logger_, "unlock {} failed: {}", dir_, s.ToString());
    }
    lock_ = nullptr;
  }
  LOGGER_INFO(logger_, "meta store {} closed", dir_);
}

leaf::result<std::shared_ptr<meta_store>> meta_store::open_create(const std::string& dir, node_id id, bool open,
                                                                  bool create,
                                                                  std::shared_ptr<logger_interface> logger) {
  auto* env = rocksdb::Env::Default();
  auto current = (std::filesystem::path(dir) / "CURRENT").string();
  bool exists = env->FileExists(current).ok();
  if (exists && !open) {
    return new_error(storage_error::ALREADY_EXISTS, fmt::format("raft dir {} already exists", dir));
  }
  if (!exists && !create) {
    return new_error(storage_error::NOT_FOUND, fmt::format("raft dir {} not found", dir));
  }

  if (auto s = env->CreateDirIfMissing(dir); !s.ok()) {
    return rocksdb_error(s, fmt::format("create dir {}", dir));
  }

  rocksdb::FileLock* lock = nullptr;
  auto lock_path = (std::filesystem::path(dir) / LOCK_FILE_NAME).string();
  if (auto s = env->LockFile(lock_path, &lock); !s.ok()) {
    LOGGER_ERROR(logger, "lock {} failed: {}", lock_path, s.ToString());
    return new_error(storage_error::LOCKED, fmt::format("lock {} failed: {}", lock_path, s.ToString()));
  }

  // 构造之后析构函数负责释放锁
  auto store = std::make_shared<meta_store>(private_tag{}, dir, id, env, lock, logger);
  METAD_LEAF_CHECK(store->open_db());
  if (exists) {
    METAD_LEAF_CHECK(store->load_existing());
  } else {
    METAD_LEAF_CHECK(store->init_new());
  }
  LOGGER_INFO(logger, "meta store {} {} for node {}, last log {} last purged {}", dir, exists ? "opened" : "created",
              id, store->last_log_id_.to_string(), store->last_purged_.to_string());
  return store;
}

leaf::result<void> meta_store::open_db() {
  rocksdb::DBOptions options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
  descriptors.emplace_back(rocksdb::kDefaultColumnFamilyName, rocksdb::ColumnFamilyOptions());
  descriptors.emplace_back(std::string(LOGS_CF), rocksdb::ColumnFamilyOptions());
  descriptors.emplace_back(std::string(RAFT_STATE_CF), rocksdb::ColumnFamilyOptions());
  descriptors.emplace_back(std::string(SNAPSHOT_CF), rocksdb::ColumnFamilyOptions());

  rocksdb::DB* db = nullptr;
  if (auto s = rocksdb::DB::Open(options, dir_, descriptors, &handles_, &db); !s.ok()) {
    return rocksdb_error(s, fmt::format("open {}", dir_));
  }
  db_.reset(db);
  logs_cf_ = handles_[1];
  state_cf_ = handles_[2];
  snapshot_cf_ = handles_[3];
  return {};
}

leaf::result<void> meta_store::init_new() {
  rocksdb::WriteBatch batch;
  batch.Put(state_cf_, to_slice(ID_KEY), std::to_string(id_));
  METAD_LEAF_CHECK(write(batch));
  opened_ = false;
  return {};
}

leaf::result<void> meta_store::load_existing() {
  BOOST_LEAF_AUTO(stored_id, get(state_cf_, ID_KEY));
  if (!stored_id) {
    return new_error(storage_error::CORRUPTED, fmt::format("node id missing in {}", dir_));
  }
  if (*stored_id != std::to_string(id_)) {
    return new_error(storage_error::ID_MISMATCH,
                     fmt::format("raft dir {} belongs to node {}, not {}", dir_, *stored_id, id_));
  }
  METAD_LEAF_CHECK(load_snapshot());
  METAD_LEAF_CHECK(load_log_bounds());
  opened_ = true;
  return {};
}

leaf::result<void> meta_store::load_snapshot() {
  BOOST_LEAF_AUTO(meta_bytes, get(snapshot_cf_, SNAPSHOT_META_KEY));
  if (!meta_bytes) {
    return {};
  }
  metadpb::snapshot_meta meta;
  if (!meta.ParseFromString(*meta_bytes)) {
    return new_error(storage_error::CORRUPTED, "undecodable snapshot meta");
  }
  BOOST_LEAF_AUTO(data, get(snapshot_cf_, SNAPSHOT_DATA_KEY));
  if (!data) {
    return new_error(storage_error::CORRUPTED, "snapshot data missing");
  }
  if (crc32c(*data) != meta.checksum()) {
    return new_error(storage_error::SNAPSHOT_MISMATCH,
                     fmt::format("snapshot {} checksum mismatch", meta.snapshot_id()));
  }
  metadpb::state_machine_data sm_data;
  if (!sm_data.ParseFromString(*data)) {
    return new_error(storage_error::CORRUPTED, fmt::format("undecodable snapshot {}", meta.snapshot_id()));
  }
  METAD_LEAF_CHECK(sm_.restore(sm_data));
  LOGGER_INFO(logger_, "restore state machine from snapshot {} at {}", meta.snapshot_id(),
              pb::from_pb(meta.last_log_id()).to_string());
  snapshot_meta_ = std::move(meta);
  return {};
}

leaf::result<void> meta_store::load_log_bounds() {
  BOOST_LEAF_AUTO(purged_bytes, get(state_cf_, LAST_PURGED_KEY));
  if (purged_bytes) {
    metadpb::log_id purged;
    if (!purged.ParseFromString(*purged_bytes)) {
      return new_error(storage_error::CORRUPTED, "undecodable last purged log id");
    }
    last_purged_ = pb::from_pb(purged);
  }

  // 校验日志可以解码且 index 连续
  last_log_id_ = last_purged_;
  std::unique_ptr<rocksdb::Iterator> iter(db_->NewIterator(rocksdb::ReadOptions(), logs_cf_));
  auto expected_index = last_purged_.index + 1;
  for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
    auto index = decode_log_key(std::string_view(iter->key().data(), iter->key().size()));
    metadpb::entry ent;
    if (!ent.ParseFromArray(iter->value().data(), static_cast<int>(iter->value().size()))) {
      return new_error(storage_error::CORRUPTED, fmt::format("undecodable log entry at {}", index));
    }
    if (index != expected_index || ent.index() != index) {
      return new_error(storage_error::CORRUPTED,
                       fmt::format("log gap: expect {}, key {}, entry {}", expected_index, index, ent.index()));
    }
    last_log_id_ = pb::entry_log_id(ent);
    ++expected_index;
  }
  if (auto s = iter->status(); !s.ok()) {
    return rocksdb_error(s, "scan logs");
  }
  return {};
}

leaf::result<std::optional<std::string>> meta_store::get(rocksdb::ColumnFamilyHandle* cf,
                                                         std::string_view key) const {
  std::string value;
  auto s = db_->Get(rocksdb::ReadOptions(), cf, to_slice(key), &value);
  if (s.IsNotFound()) {
    return std::optional<std::string>{};
  }
  if (!s.ok()) {
    return rocksdb_error(s, fmt::format("get {}", key));
  }
  return std::optional<std::string>{std::move(value)};
}

leaf::result<void> meta_store::write(rocksdb::WriteBatch& batch) {
  rocksdb::WriteOptions options;
  options.sync = true;
  if (auto s = db_->Write(options, &batch); !s.ok()) {
    return rocksdb_error(s, "write batch");
  }
  return {};
}

leaf::result<metadpb::entry> meta_store::read_entry(std::uint64_t index) const {
  BOOST_LEAF_AUTO(bytes, get(logs_cf_, encode_log_key(index)));
  if (!bytes) {
    return new_error(storage_error::UNAVAILABLE, fmt::format("log {} not found", index));
  }
  metadpb::entry ent;
  if (!ent.ParseFromString(*bytes)) {
    return new_error(storage_error::CORRUPTED, fmt::format("undecodable log entry at {}", index));
  }
  return ent;
}

leaf::result<raft::initial_state> meta_store::initial_state() const {
  raft::initial_state state;
  BOOST_LEAF_AUTO(hs, read_hard_state());
  state.hard_state = std::move(hs);
  BOOST_LEAF_AUTO(effective, effective_membership());
  state.membership = std::move(effective.first);
  state.membership_index = effective.second;
  state.last_applied = sm_.last_applied();
  std::lock_guard<std::mutex> lock(mutex_);
  state.last_log_id = last_log_id_;
  if (snapshot_meta_) {
    state.snapshot_last = pb::from_pb(snapshot_meta_->last_log_id());
  }
  return state;
}

leaf::result<void> meta_store::save_hard_state(const metadpb::hard_state& hs) {
  rocksdb::WriteBatch batch;
  batch.Put(state_cf_, to_slice(HARD_STATE_KEY), hs.SerializeAsString());
  return write(batch);
}

leaf::result<metadpb::hard_state> meta_store::read_hard_state() const {
  BOOST_LEAF_AUTO(bytes, get(state_cf_, HARD_STATE_KEY));
  metadpb::hard_state hs;
  if (bytes && !hs.ParseFromString(*bytes)) {
    return new_error(storage_error::CORRUPTED, "undecodable hard state");
  }
  return hs;
}

leaf::result<pb::entry_list> meta_store::entries(std::uint64_t lo, std::uint64_t hi) const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lo <= last_purged_.index) {
      return new_error(storage_error::COMPACTED, fmt::format("entries from {} compacted upto {}", lo,
                                                             last_purged_.index));
    }
    if (hi > last_log_id_.index + 1) {
      return new_error(storage_error::UNAVAILABLE,
                       fmt::format("entries [{}, {}) beyond last log {}", lo, hi, last_log_id_.index));
    }
  }

  pb::entry_list out;
  if (lo >= hi) {
    return out;
  }
  out.reserve(hi - lo);
  auto upper = encode_log_key(hi);
  rocksdb::Slice upper_bound(upper);
  rocksdb::ReadOptions options;
  options.iterate_upper_bound = &upper_bound;
  std::unique_ptr<rocksdb::Iterator> iter(db_->NewIterator(options, logs_cf_));
  auto expected_index = lo;
  for (iter->Seek(encode_log_key(lo)); iter->Valid(); iter->Next()) {
    metadpb::entry ent;
    if (!ent.ParseFromArray(iter->value().data(), static_cast<int>(iter->value().size()))) {
      return new_error(storage_error::CORRUPTED, fmt::format("undecodable log entry at {}", expected_index));
    }
    if (ent.index() != expected_index) {
      // 并发清理或截断
      return new_error(storage_error::COMPACTED, fmt::format("log {} missing", expected_index));
    }
    out.push_back(std::move(ent));
    ++expected_index;
  }
  if (auto s = iter->status(); !s.ok()) {
    return rocksdb_error(s, "scan logs");
  }
  if (expected_index != hi) {
    return new_error(storage_error::UNAVAILABLE, fmt::format("entries [{}, {}) incomplete", lo, hi));
  }
  return out;
}

leaf::result<std::uint64_t> meta_store::term_locked(std::uint64_t index) const {
  if (index == 0) {
    return std::uint64_t{0};
  }
  if (index == last_purged_.index) {
    return last_purged_.term;
  }
  if (index < last_purged_.index) {
    return new_error(storage_error::COMPACTED);
  }
  if (index > last_log_id_.index) {
    return new_error(storage_error::UNAVAILABLE);
  }
  if (index == last_log_id_.index) {
    return last_log_id_.term;
  }
  BOOST_LEAF_AUTO(ent, read_entry(index));
  return ent.term();
}

leaf::result<std::uint64_t> meta_store::term(std::uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return term_locked(index);
}

std::uint64_t meta_store::first_index() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_purged_.index + 1;
}

raft::log_id meta_store::last_log_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_log_id_;
}

raft::log_id meta_store::last_purged() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_purged_;
}

leaf::result<void> meta_store::append(const pb::entry_list& entries) {
  if (entries.empty()) {
    return {};
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto first = entries.front().index();
  if (first <= last_purged_.index || first > last_log_id_.index + 1) {
    return new_error(storage_error::UNAVAILABLE,
                     fmt::format("append from {} not contiguous with last log {}, last purged {}", first,
                                 last_log_id_.to_string(), last_purged_.to_string()));
  }

  rocksdb::WriteBatch batch;
  if (first <= last_log_id_.index) {
    batch.DeleteRange(logs_cf_, encode_log_key(first), encode_log_key(last_log_id_.index + 1));
  }
  auto expected_index = first;
  for (const auto& ent : entries) {
    if (ent.index() != expected_index) {
      return new_error(storage_error::UNAVAILABLE, fmt::format("entries not contiguous at {}", ent.index()));
    }
    batch.Put(logs_cf_, encode_log_key(ent.index()), ent.SerializeAsString());
    ++expected_index;
  }
  METAD_LEAF_CHECK(write(batch));
  last_log_id_ = pb::entry_log_id(entries.back());
  return {};
}

leaf::result<void> meta_store::truncate_since(std::uint64_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index <= last_purged_.index) {
    return new_error(storage_error::COMPACTED, fmt::format("truncate {} below purged {}", index,
                                                           last_purged_.to_string()));
  }
  if (index > last_log_id_.index) {
    return {};
  }
  BOOST_LEAF_AUTO(prev_term, term_locked(index - 1));
  rocksdb::WriteBatch batch;
  batch.DeleteRange(logs_cf_, encode_log_key(index), encode_log_key(last_log_id_.index + 1));
  METAD_LEAF_CHECK(write(batch));
  LOGGER_INFO(logger_, "truncate logs [{}, {}]", index, last_log_id_.index);
  last_log_id_ = raft::log_id{prev_term, index - 1};
  return {};
}

leaf::result<void> meta_store::purge_upto(std::uint64_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index <= last_purged_.index) {
    return {};
  }
  if (index > last_log_id_.index) {
    return new_error(storage_error::UNAVAILABLE,
                     fmt::format("purge upto {} beyond last log {}", index, last_log_id_.to_string()));
  }
  BOOST_LEAF_AUTO(purged_term, term_locked(index));
  raft::log_id purged{purged_term, index};

  rocksdb::WriteBatch batch;
  batch.DeleteRange(logs_cf_, encode_log_key(last_purged_.index), encode_log_key(index + 1));
  batch.Put(state_cf_, to_slice(LAST_PURGED_KEY), pb::to_pb(purged).SerializeAsString());
  METAD_LEAF_CHECK(write(batch));
  LOGGER_DEBUG(logger_, "purge logs upto {}", purged.to_string());
  last_purged_ = purged;
  return {};
}

leaf::result<std::pair<raft::membership, std::uint64_t>> meta_store::effective_membership() const {
  std::optional<metadpb::snapshot_meta> snapshot;
  raft::log_id purged;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = snapshot_meta_;
    purged = last_purged_;
  }

  // 最后一条成员配置日志优先，其次是快照中的配置
  std::unique_ptr<rocksdb::Iterator> iter(db_->NewIterator(rocksdb::ReadOptions(), logs_cf_));
  for (iter->SeekToLast(); iter->Valid(); iter->Prev()) {
    metadpb::entry ent;
    if (!ent.ParseFromArray(iter->value().data(), static_cast<int>(iter->value().size()))) {
      return new_error(storage_error::CORRUPTED, "undecodable log entry while loading membership");
    }
    if (ent.index() <= purged.index) {
      break;
    }
    if (ent.type() == metadpb::ENTRY_MEMBERSHIP) {
      return std::make_pair(pb::from_pb(ent.membership()), ent.index());
    }
  }
  if (auto s = iter->status(); !s.ok()) {
    return rocksdb_error(s, "scan logs");
  }

  if (snapshot) {
    return std::make_pair(pb::from_pb(snapshot->membership()), std::uint64_t{0});
  }
  if (auto m = sm_.last_membership()) {
    return std::make_pair(std::move(*m), std::uint64_t{0});
  }
  return std::make_pair(raft::membership{}, std::uint64_t{0});
}

leaf::result<std::vector<applied_state>> meta_store::apply(const pb::entry_list& entries) {
  std::vector<applied_state> results;
  results.reserve(entries.size());
  for (const auto& ent : entries) {
    BOOST_LEAF_AUTO(result, sm_.apply(ent));
    results.push_back(std::move(result));
  }
  return results;
}

leaf::result<metadpb::snapshot_meta> meta_store::save_snapshot(const sm::state_data& view) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshot_meta_ && snapshot_meta_->last_log_id().index() >= view.last_applied.index) {
      return *snapshot_meta_;
    }
  }

  auto data = sm::state_machine::serialize(view).SerializeAsString();
  metadpb::snapshot_meta meta;
  *meta.mutable_last_log_id() = pb::to_pb(view.last_applied);
  if (view.last_membership) {
    *meta.mutable_membership() = pb::to_pb(*view.last_membership);
  }
  meta.set_checksum(crc32c(data));

  std::lock_guard<std::mutex> lock(mutex_);
  meta.set_snapshot_id(fmt::format("{}-{}-{}", view.last_applied.term, view.last_applied.index, ++snapshot_seq_));
  rocksdb::WriteBatch batch;
  batch.Put(snapshot_cf_, to_slice(SNAPSHOT_META_KEY), meta.SerializeAsString());
  batch.Put(snapshot_cf_, to_slice(SNAPSHOT_DATA_KEY), data);
  METAD_LEAF_CHECK(write(batch));
  LOGGER_INFO(logger_, "saved snapshot {}, {} bytes", meta.snapshot_id(), data.size());
  snapshot_meta_ = meta;
  return meta;
}

leaf::result<std::optional<raft::snapshot_payload>> meta_store::current_snapshot() const {
  std::optional<metadpb::snapshot_meta> meta;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    meta = snapshot_meta_;
  }
  if (!meta) {
    return std::optional<raft::snapshot_payload>{};
  }
  BOOST_LEAF_AUTO(data, get(snapshot_cf_, SNAPSHOT_DATA_KEY));
  if (!data) {
    return new_error(storage_error::SNAPSHOT_UNAVAILABLE, fmt::format("snapshot {} data missing",
                                                                      meta->snapshot_id()));
  }
  if (crc32c(*data) != meta->checksum()) {
    // 后台刚写入了更新的快照，下次复制时重新读取
    return new_error(storage_error::SNAPSHOT_UNAVAILABLE,
                     fmt::format("snapshot {} replaced while reading", meta->snapshot_id()));
  }
  return std::optional<raft::snapshot_payload>{raft::snapshot_payload{std::move(*meta), std::move(*data)}};
}

leaf::result<void> meta_store::install_snapshot(const metadpb::snapshot_meta& meta, const std::string& data) {
  if (crc32c(data) != meta.checksum()) {
    return new_error(storage_error::SNAPSHOT_MISMATCH,
                     fmt::format("snapshot {} checksum mismatch", meta.snapshot_id()));
  }
  metadpb::state_machine_data sm_data;
  if (!sm_data.ParseFromString(data)) {
    return new_error(storage_error::CORRUPTED, fmt::format("undecodable snapshot {}", meta.snapshot_id()));
  }

  auto snapshot_id = pb::from_pb(meta.last_log_id());
  std::lock_guard<std::mutex> lock(mutex_);
  // 本地日志在快照位置 term 一致时保留其后的日志，否则整体丢弃
  bool keep_suffix = false;
  if (snapshot_id.index <= last_log_id_.index) {
    auto local_term = term_locked(snapshot_id.index);
    keep_suffix = local_term && *local_term == snapshot_id.term;
  }

  rocksdb::WriteBatch batch;
  if (keep_suffix) {
    batch.DeleteRange(logs_cf_, encode_log_key(0), encode_log_key(snapshot_id.index + 1));
  } else if (last_log_id_.index > 0) {
    batch.DeleteRange(logs_cf_, encode_log_key(0), encode_log_key(last_log_id_.index + 1));
  }
  batch.Put(state_cf_, to_slice(LAST_PURGED_KEY), pb::to_pb(snapshot_id).SerializeAsString());
  batch.Put(snapshot_cf_, to_slice(SNAPSHOT_META_KEY), meta.SerializeAsString());
  batch.Put(snapshot_cf_, to_slice(SNAPSHOT_DATA_KEY), data);
  METAD_LEAF_CHECK(write(batch));
  METAD_LEAF_CHECK(sm_.restore(sm_data));

  last_purged_ = snapshot_id;
  if (!keep_suffix || last_log_id_ < snapshot_id) {
    last_log_id_ = snapshot_id;
  }
  snapshot_meta_ = meta;
  LOGGER_INFO(logger_, "installed snapshot {} at {}, keep log suffix: {}", meta.snapshot_id(),
              snapshot_id.to_string(), keep_suffix);
  return {};
}

}  // namespace metad::store
