#include "error/meta_error.h"

#include <fmt/format.h>

#include "basic/overloaded.h"
#include "error/network_error.h"
#include "error/raft_error.h"

namespace metad {

std::string describe(const meta_error& err) {
  return std::visit(overloaded{
                        [](const forward_to_leader& f) {
                          return f.leader_id ? fmt::format("forward to leader {}", *f.leader_id)
                                             : std::string("forward to leader: leader unknown");
                        },
                        [](const std::error_code& ec) {
                          return fmt::format("{}: {}", ec.category().name(), ec.message());
                        },
                    },
                    err);
}

bool is_retryable(const meta_error& err) {
  return std::visit(overloaded{
                        [](const forward_to_leader&) { return true; },
                        [](const std::error_code& ec) {
                          return ec.category() == get_network_error_category() || ec == raft_error::TIMEOUT ||
                                 ec == raft_error::PROPOSAL_DROPPED;
                        },
                    },
                    err);
}

}  // namespace metad
