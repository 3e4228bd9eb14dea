#pragma once
#ifndef _METAD_META_TYPES_H_
#define _METAD_META_TYPES_H_
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace metad {

using node_id = std::uint64_t;

// 集群节点描述。endpoint 为 raft 传输地址 host:port
struct node {
  std::string name;
  std::string endpoint;
  std::optional<std::string> grpc_api_addr;

  bool operator==(const node&) const = default;
  std::string to_string() const;
};

struct kv_meta {
  std::optional<std::uint64_t> expire_at;

  bool operator==(const kv_meta&) const = default;
};

// 带版本号的值
struct seqv {
  std::uint64_t seq = 0;
  std::string data;
  std::optional<kv_meta> meta;

  bool operator==(const seqv&) const = default;
};

struct match_any {
  bool operator==(const match_any&) const = default;
};

struct match_exact {
  std::uint64_t seq = 0;
  bool operator==(const match_exact&) const = default;
};

struct match_ge {
  std::uint64_t seq = 0;
  bool operator==(const match_ge&) const = default;
};

using match_seq = std::variant<match_any, match_exact, match_ge>;

// 当前 seq（key 不存在时为 0）是否满足条件
bool match_seq_satisfied(const match_seq& cond, std::uint64_t current_seq);

std::string to_string(const match_seq& cond);

struct op_update {
  std::string value;
  bool operator==(const op_update&) const = default;
};

struct op_delete {
  bool operator==(const op_delete&) const = default;
};

using operation = std::variant<op_update, op_delete>;

struct txid {
  std::string client;
  std::uint64_t serial = 0;

  bool operator==(const txid&) const = default;
};

struct upsert_kv {
  std::string key;
  match_seq seq = match_any{};
  operation value = op_delete{};
  std::optional<kv_meta> value_meta;

  static upsert_kv update(std::string key, std::string value, match_seq seq = match_any{});
  static upsert_kv remove(std::string key, match_seq seq = match_any{});

  bool operator==(const upsert_kv&) const = default;
};

struct incr_seq {
  std::string key;
  bool operator==(const incr_seq&) const = default;
};

struct add_node {
  node_id id = 0;
  metad::node node;
  bool operator==(const add_node&) const = default;
};

struct remove_node {
  node_id id = 0;
  bool operator==(const remove_node&) const = default;
};

using cmd = std::variant<upsert_kv, incr_seq, add_node, remove_node>;

std::string to_string(const cmd& c);

// 客户端写入的日志内容；带 txid 时同一 client 的同一 serial 只生效一次
struct log_entry {
  std::optional<metad::txid> txid;
  metad::cmd cmd;

  log_entry() = default;
  template <typename C>
    requires std::is_constructible_v<metad::cmd, C>
  log_entry(C c) : cmd(std::move(c)) {}
  log_entry(std::optional<metad::txid> id, metad::cmd c) : txid(std::move(id)), cmd(std::move(c)) {}

  bool operator==(const log_entry&) const = default;
};

struct applied_none {
  bool operator==(const applied_none&) const = default;
};

struct applied_kv {
  std::optional<seqv> prev;
  std::optional<seqv> result;

  bool changed() const { return prev != result; }
  bool operator==(const applied_kv&) const = default;
};

struct applied_seq {
  std::uint64_t seq = 0;
  bool operator==(const applied_seq&) const = default;
};

struct applied_node {
  std::optional<node> prev;
  std::optional<node> result;
  bool operator==(const applied_node&) const = default;
};

using applied_state = std::variant<applied_none, applied_kv, applied_seq, applied_node>;

std::string to_string(const applied_state& state);

}  // namespace metad

#endif  // _METAD_META_TYPES_H_
