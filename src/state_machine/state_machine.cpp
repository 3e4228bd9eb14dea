#include "state_machine/state_machine.h"

#include <fmt/format.h>

#include <spdlog/spdlog.h>

#include <mutex>

#include "basic/overloaded.h"
#include "error/error.h"
#include "error/storage_error.h"
#include "pb/codec.h"

namespace metad::sm {

leaf::result<applied_state> state_machine::apply(const metadpb::entry& ent) {
  std::unique_lock lock(mutex_);
  if (ent.index() != 0 && ent.index() <= data_.last_applied.index) {
    SPDLOG_DEBUG("skip already applied entry {}, last_applied {}", ent.index(), data_.last_applied.to_string());
    return applied_state{applied_none{}};
  }

  applied_state result = applied_none{};
  switch (ent.type()) {
    case metadpb::ENTRY_BLANK:
      break;
    case metadpb::ENTRY_MEMBERSHIP:
      data_.last_membership = pb::from_pb(ent.membership());
      break;
    case metadpb::ENTRY_NORMAL: {
      auto decoded = pb::from_pb(ent.normal());
      if (!decoded) {
        return new_error(storage_error::CORRUPTED, fmt::format("undecodable log entry at index {}", ent.index()));
      }
      const auto& entry = *decoded;
      if (entry.txid) {
        auto iter = data_.client_last_resps.find(entry.txid->client);
        if (iter != data_.client_last_resps.end() && iter->second.serial == entry.txid->serial) {
          result = iter->second.response;
          break;
        }
      }
      result = apply_cmd(entry.cmd);
      if (entry.txid) {
        data_.client_last_resps[entry.txid->client] = client_last_resp{entry.txid->serial, result};
      }
      break;
    }
    default:
      return new_error(storage_error::CORRUPTED, fmt::format("unknown entry type at index {}", ent.index()));
  }
  data_.last_applied = pb::entry_log_id(ent);
  return result;
}

applied_state state_machine::apply_cmd(const cmd& c) {
  return std::visit(overloaded{
                        [&](const upsert_kv& u) { return apply_upsert_kv(u); },
                        [&](const incr_seq& i) -> applied_state { return applied_seq{incr_sequence(i.key)}; },
                        [&](const add_node& a) -> applied_state {
                          std::optional<node> prev;
                          if (auto iter = data_.nodes.find(a.id); iter != data_.nodes.end()) {
                            prev = iter->second;
                          }
                          data_.nodes[a.id] = a.node;
                          return applied_node{std::move(prev), a.node};
                        },
                        [&](const remove_node& r) -> applied_state {
                          std::optional<node> prev;
                          if (auto iter = data_.nodes.find(r.id); iter != data_.nodes.end()) {
                            prev = std::move(iter->second);
                            data_.nodes.erase(iter);
                          }
                          return applied_node{std::move(prev), std::nullopt};
                        },
                    },
                    c);
}

applied_state state_machine::apply_upsert_kv(const upsert_kv& cmd) {
  std::optional<seqv> prev;
  auto iter = data_.kvs.find(cmd.key);
  if (iter != data_.kvs.end()) {
    prev = iter->second;
  }
  const auto current_seq = prev ? prev->seq : 0;
  if (!match_seq_satisfied(cmd.seq, current_seq)) {
    return applied_kv{prev, prev};
  }

  return std::visit(overloaded{
                        [&](const op_update& upd) -> applied_state {
                          seqv value{incr_sequence(GENERIC_KV_SEQ), upd.value, cmd.value_meta};
                          data_.kvs.insert_or_assign(cmd.key, value);
                          return applied_kv{std::move(prev), std::move(value)};
                        },
                        [&](const op_delete&) -> applied_state {
                          if (iter != data_.kvs.end()) {
                            data_.kvs.erase(iter);
                          }
                          return applied_kv{std::move(prev), std::nullopt};
                        },
                    },
                    cmd.value);
}

std::uint64_t state_machine::incr_sequence(std::string_view key) {
  auto iter = data_.sequences.find(key);
  if (iter == data_.sequences.end()) {
    iter = data_.sequences.emplace(std::string(key), 0).first;
  }
  return ++iter->second;
}

std::optional<seqv> state_machine::get_kv(std::string_view key) const {
  std::shared_lock lock(mutex_);
  if (auto iter = data_.kvs.find(key); iter != data_.kvs.end()) {
    return iter->second;
  }
  return std::nullopt;
}

std::vector<std::pair<std::string, seqv>> state_machine::prefix_list_kv(std::string_view prefix) const {
  std::shared_lock lock(mutex_);
  std::vector<std::pair<std::string, seqv>> out;
  for (auto iter = data_.kvs.lower_bound(prefix); iter != data_.kvs.end(); ++iter) {
    if (!iter->first.starts_with(prefix)) {
      break;
    }
    out.emplace_back(iter->first, iter->second);
  }
  return out;
}

std::optional<std::uint64_t> state_machine::get_sequence(std::string_view key) const {
  std::shared_lock lock(mutex_);
  if (auto iter = data_.sequences.find(key); iter != data_.sequences.end()) {
    return iter->second;
  }
  return std::nullopt;
}

std::optional<node> state_machine::get_node(node_id id) const {
  std::shared_lock lock(mutex_);
  if (auto iter = data_.nodes.find(id); iter != data_.nodes.end()) {
    return iter->second;
  }
  return std::nullopt;
}

std::map<node_id, node> state_machine::get_nodes() const {
  std::shared_lock lock(mutex_);
  return data_.nodes;
}

raft::log_id state_machine::last_applied() const {
  std::shared_lock lock(mutex_);
  return data_.last_applied;
}

std::optional<raft::membership> state_machine::last_membership() const {
  std::shared_lock lock(mutex_);
  return data_.last_membership;
}

state_data state_machine::copy() const {
  std::shared_lock lock(mutex_);
  return data_;
}

metadpb::state_machine_data state_machine::serialize(const state_data& data) {
  metadpb::state_machine_data out;
  *out.mutable_last_applied() = pb::to_pb(data.last_applied);
  if (data.last_membership) {
    *out.mutable_last_membership() = pb::to_pb(*data.last_membership);
  }
  for (const auto& [key, value] : data.kvs) {
    auto* record = out.add_kvs();
    record->set_key(key);
    *record->mutable_value() = pb::to_pb(value);
  }
  for (const auto& [key, value] : data.sequences) {
    auto* record = out.add_sequences();
    record->set_key(key);
    record->set_value(value);
  }
  for (const auto& [id, n] : data.nodes) {
    auto* record = out.add_nodes();
    record->set_node_id(id);
    *record->mutable_node() = pb::to_pb(n);
  }
  for (const auto& [client, resp] : data.client_last_resps) {
    auto* record = out.add_client_last_resps();
    record->set_client(client);
    record->set_serial(resp.serial);
    *record->mutable_response() = pb::to_pb(resp.response);
  }
  return out;
}

leaf::result<void> state_machine::restore(const metadpb::state_machine_data& data) {
  state_data restored;
  restored.last_applied = pb::from_pb(data.last_applied());
  if (data.has_last_membership()) {
    restored.last_membership = pb::from_pb(data.last_membership());
  }
  for (const auto& record : data.kvs()) {
    restored.kvs.emplace(record.key(), pb::from_pb(record.value()));
  }
  for (const auto& record : data.sequences()) {
    restored.sequences.emplace(record.key(), record.value());
  }
  for (const auto& record : data.nodes()) {
    restored.nodes.emplace(record.node_id(), pb::from_pb(record.node()));
  }
  for (const auto& record : data.client_last_resps()) {
    auto response = pb::from_pb(record.response());
    if (!response) {
      return new_error(storage_error::CORRUPTED, fmt::format("bad cached response for client {}", record.client()));
    }
    restored.client_last_resps.emplace(record.client(), client_last_resp{record.serial(), std::move(*response)});
  }

  std::unique_lock lock(mutex_);
  data_ = std::move(restored);
  return {};
}

}  // namespace metad::sm
