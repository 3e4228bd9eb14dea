#include "pb/codec.h"

#include <string_view>

#include "basic/overloaded.h"
#include "error/error.h"
#include "error/logic_error.h"
#include "error/network_error.h"
#include "error/raft_error.h"
#include "error/rocksdb_err.h"
#include "error/storage_error.h"

namespace metad::pb {

metadpb::node to_pb(const node& n) {
  metadpb::node out;
  out.set_name(n.name);
  out.set_endpoint(n.endpoint);
  if (n.grpc_api_addr) {
    out.set_grpc_api_addr(*n.grpc_api_addr);
  }
  return out;
}

node from_pb(const metadpb::node& n) {
  node out{n.name(), n.endpoint(), std::nullopt};
  if (n.has_grpc_api_addr()) {
    out.grpc_api_addr = n.grpc_api_addr();
  }
  return out;
}

static void fill_kv_meta(metadpb::kv_meta* out, const kv_meta& meta) {
  if (meta.expire_at) {
    out->set_expire_at(*meta.expire_at);
  }
}

static kv_meta read_kv_meta(const metadpb::kv_meta& meta) {
  kv_meta out;
  if (meta.has_expire_at()) {
    out.expire_at = meta.expire_at();
  }
  return out;
}

metadpb::seq_v to_pb(const seqv& v) {
  metadpb::seq_v out;
  out.set_seq(v.seq);
  out.set_data(v.data);
  if (v.meta) {
    fill_kv_meta(out.mutable_meta(), *v.meta);
  }
  return out;
}

seqv from_pb(const metadpb::seq_v& v) {
  seqv out{v.seq(), v.data(), std::nullopt};
  if (v.has_meta()) {
    out.meta = read_kv_meta(v.meta());
  }
  return out;
}

metadpb::match_seq to_pb(const match_seq& m) {
  metadpb::match_seq out;
  std::visit(overloaded{
                 [&](const match_any&) { out.set_any(true); },
                 [&](const match_exact& e) { out.set_exact(e.seq); },
                 [&](const match_ge& g) { out.set_greater_or_equal(g.seq); },
             },
             m);
  return out;
}

leaf::result<match_seq> from_pb(const metadpb::match_seq& m) {
  switch (m.kind_case()) {
    case metadpb::match_seq::kAny:
      return match_seq{match_any{}};
    case metadpb::match_seq::kExact:
      return match_seq{match_exact{m.exact()}};
    case metadpb::match_seq::kGreaterOrEqual:
      return match_seq{match_ge{m.greater_or_equal()}};
    default:
      return new_error(logic_error::MALFORMED_MESSAGE, "match_seq kind not set");
  }
}

metadpb::log_entry to_pb(const log_entry& e) {
  metadpb::log_entry out;
  if (e.txid) {
    auto* id = out.mutable_txid();
    id->set_client(e.txid->client);
    id->set_serial(e.txid->serial);
  }
  std::visit(overloaded{
                 [&](const upsert_kv& u) {
                   auto* cmd = out.mutable_upsert_kv();
                   cmd->set_key(u.key);
                   *cmd->mutable_seq() = to_pb(u.seq);
                   std::visit(overloaded{
                                  [&](const op_update& upd) { cmd->set_update(upd.value); },
                                  [&](const op_delete&) { cmd->set_remove(true); },
                              },
                              u.value);
                   if (u.value_meta) {
                     fill_kv_meta(cmd->mutable_value_meta(), *u.value_meta);
                   }
                 },
                 [&](const incr_seq& i) { out.mutable_incr_seq()->set_key(i.key); },
                 [&](const add_node& a) {
                   auto* cmd = out.mutable_add_node();
                   cmd->set_node_id(a.id);
                   *cmd->mutable_node() = to_pb(a.node);
                 },
                 [&](const remove_node& r) { out.mutable_remove_node()->set_node_id(r.id); },
             },
             e.cmd);
  return out;
}

leaf::result<log_entry> from_pb(const metadpb::log_entry& e) {
  log_entry out;
  if (e.has_txid()) {
    out.txid = txid{e.txid().client(), e.txid().serial()};
  }
  switch (e.cmd_case()) {
    case metadpb::log_entry::kUpsertKv: {
      const auto& cmd = e.upsert_kv();
      upsert_kv u;
      u.key = cmd.key();
      if (cmd.has_seq()) {
        BOOST_LEAF_AUTO(seq, from_pb(cmd.seq()));
        u.seq = seq;
      }
      switch (cmd.value_case()) {
        case metadpb::cmd_upsert_kv::kUpdate:
          u.value = op_update{cmd.update()};
          break;
        case metadpb::cmd_upsert_kv::kRemove:
          u.value = op_delete{};
          break;
        default:
          return new_error(logic_error::MALFORMED_MESSAGE, "upsert_kv operation not set");
      }
      if (cmd.has_value_meta()) {
        u.value_meta = read_kv_meta(cmd.value_meta());
      }
      out.cmd = std::move(u);
      break;
    }
    case metadpb::log_entry::kIncrSeq:
      out.cmd = incr_seq{e.incr_seq().key()};
      break;
    case metadpb::log_entry::kAddNode:
      out.cmd = add_node{e.add_node().node_id(), from_pb(e.add_node().node())};
      break;
    case metadpb::log_entry::kRemoveNode:
      out.cmd = remove_node{e.remove_node().node_id()};
      break;
    default:
      return new_error(logic_error::MALFORMED_MESSAGE, "log_entry cmd not set");
  }
  return out;
}

metadpb::applied_state to_pb(const applied_state& s) {
  metadpb::applied_state out;
  std::visit(overloaded{
                 [&](const applied_none&) { out.set_none(true); },
                 [&](const applied_kv& kv) {
                   auto* dst = out.mutable_kv();
                   if (kv.prev) {
                     *dst->mutable_prev() = to_pb(*kv.prev);
                   }
                   if (kv.result) {
                     *dst->mutable_result() = to_pb(*kv.result);
                   }
                 },
                 [&](const applied_seq& seq) { out.set_seq(seq.seq); },
                 [&](const applied_node& n) {
                   auto* dst = out.mutable_node();
                   if (n.prev) {
                     *dst->mutable_prev() = to_pb(*n.prev);
                   }
                   if (n.result) {
                     *dst->mutable_result() = to_pb(*n.result);
                   }
                 },
             },
             s);
  return out;
}

leaf::result<applied_state> from_pb(const metadpb::applied_state& s) {
  switch (s.kind_case()) {
    case metadpb::applied_state::kNone:
      return applied_state{applied_none{}};
    case metadpb::applied_state::kKv: {
      applied_kv kv;
      if (s.kv().has_prev()) {
        kv.prev = from_pb(s.kv().prev());
      }
      if (s.kv().has_result()) {
        kv.result = from_pb(s.kv().result());
      }
      return applied_state{std::move(kv)};
    }
    case metadpb::applied_state::kSeq:
      return applied_state{applied_seq{s.seq()}};
    case metadpb::applied_state::kNode: {
      applied_node n;
      if (s.node().has_prev()) {
        n.prev = from_pb(s.node().prev());
      }
      if (s.node().has_result()) {
        n.result = from_pb(s.node().result());
      }
      return applied_state{std::move(n)};
    }
    default:
      return new_error(logic_error::MALFORMED_MESSAGE, "applied_state kind not set");
  }
}

metadpb::log_id to_pb(const raft::log_id& id) {
  metadpb::log_id out;
  out.set_term(id.term);
  out.set_index(id.index);
  return out;
}

raft::log_id from_pb(const metadpb::log_id& id) { return raft::log_id{id.term(), id.index()}; }

metadpb::membership to_pb(const raft::membership& m) {
  metadpb::membership out;
  for (auto id : m.voters) {
    out.add_voters(id);
  }
  for (auto id : m.learners) {
    out.add_learners(id);
  }
  return out;
}

raft::membership from_pb(const metadpb::membership& m) {
  raft::membership out;
  out.voters.insert(m.voters().begin(), m.voters().end());
  out.learners.insert(m.learners().begin(), m.learners().end());
  return out;
}

metadpb::forward_error to_pb(const std::error_code& ec) {
  metadpb::forward_error out;
  out.set_category(ec.category().name());
  out.set_code(ec.value());
  out.set_message(ec.message());
  return out;
}

std::error_code from_pb(const metadpb::forward_error& err) {
  std::string_view category = err.category();
  if (category == get_raft_error_category().name()) {
    return {err.code(), get_raft_error_category()};
  }
  if (category == get_storage_error_category().name()) {
    return {err.code(), get_storage_error_category()};
  }
  if (category == get_network_error_category().name()) {
    return {err.code(), get_network_error_category()};
  }
  if (category == get_logic_error_category().name()) {
    return {err.code(), get_logic_error_category()};
  }
  if (category == get_rocksdb_err_category().name()) {
    return {err.code(), get_rocksdb_err_category()};
  }
  return make_error_code(raft_error::UNKNOWN_ERROR);
}

}  // namespace metad::pb
