#include "types/meta_types.h"

#include <fmt/format.h>

#include "basic/overloaded.h"

namespace metad {

std::string node::to_string() const {
  return fmt::format("node{{name:{}, endpoint:{}, grpc_api_addr:{}}}", name, endpoint, grpc_api_addr.value_or(""));
}

bool match_seq_satisfied(const match_seq& cond, std::uint64_t current_seq) {
  return std::visit(overloaded{
                        [](const match_any&) { return true; },
                        [&](const match_exact& m) { return current_seq == m.seq; },
                        [&](const match_ge& m) { return current_seq >= m.seq; },
                    },
                    cond);
}

std::string to_string(const match_seq& cond) {
  return std::visit(overloaded{
                        [](const match_any&) -> std::string { return "any"; },
                        [](const match_exact& m) { return fmt::format("=={}", m.seq); },
                        [](const match_ge& m) { return fmt::format(">={}", m.seq); },
                    },
                    cond);
}

upsert_kv upsert_kv::update(std::string key, std::string value, match_seq seq) {
  return upsert_kv{std::move(key), seq, op_update{std::move(value)}, std::nullopt};
}

upsert_kv upsert_kv::remove(std::string key, match_seq seq) {
  return upsert_kv{std::move(key), seq, op_delete{}, std::nullopt};
}

std::string to_string(const cmd& c) {
  return std::visit(overloaded{
                        [](const upsert_kv& u) {
                          const char* op = std::holds_alternative<op_update>(u.value) ? "update" : "delete";
                          return fmt::format("upsert_kv({} {} seq:{})", op, u.key, to_string(u.seq));
                        },
                        [](const incr_seq& i) { return fmt::format("incr_seq({})", i.key); },
                        [](const add_node& a) { return fmt::format("add_node({} {})", a.id, a.node.to_string()); },
                        [](const remove_node& r) { return fmt::format("remove_node({})", r.id); },
                    },
                    c);
}

std::string to_string(const applied_state& state) {
  auto seq_of = [](const std::optional<seqv>& v) { return v ? fmt::format("{}", v->seq) : std::string("none"); };
  return std::visit(overloaded{
                        [](const applied_none&) -> std::string { return "none"; },
                        [&](const applied_kv& kv) {
                          return fmt::format("kv(prev:{} result:{})", seq_of(kv.prev), seq_of(kv.result));
                        },
                        [](const applied_seq& s) { return fmt::format("seq({})", s.seq); },
                        [](const applied_node& n) {
                          return fmt::format("node(prev:{} result:{})", n.prev ? n.prev->to_string() : "none",
                                             n.result ? n.result->to_string() : "none");
                        },
                    },
                    state);
}

}  // namespace metad
