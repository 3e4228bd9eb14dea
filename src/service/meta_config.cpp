#include "service/meta_config.h"

#include <fmt/format.h>

#include "error/error.h"
#include "error/raft_error.h"

namespace metad::service {

std::string meta_config::raft_api_advertise_host_endpoint() const {
  return fmt::format("{}:{}", raft_api_host, raft_api_port);
}

node meta_config::get_node() const {
  return node{fmt::format("{}", id), raft_api_advertise_host_endpoint(), grpc_api_address};
}

leaf::result<void> meta_config::validate() const {
  if (raft_dir.empty()) {
    return new_error(raft_error::CONFIG_INVALID, "raft_dir must not be empty");
  }
  if (raft_api_host.empty() || raft_api_port == 0) {
    return new_error(raft_error::CONFIG_INVALID,
                     fmt::format("invalid raft api endpoint {}", raft_api_advertise_host_endpoint()));
  }
  if (forward_timeout.count() <= 0 || startup_timeout.count() <= 0) {
    return new_error(raft_error::CONFIG_INVALID, "timeouts must be greater than 0");
  }
  return raft.validate();
}

}  // namespace metad::service
