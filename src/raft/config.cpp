#include "raft/config.h"

#include "error/error.h"
#include "error/raft_error.h"

namespace metad::raft {

leaf::result<void> raft_config::validate() const {
  if (heartbeat_interval.count() <= 0) {
    return new_error(raft_error::CONFIG_INVALID, "heartbeat interval must be greater than 0");
  }
  if (election_timeout_min <= heartbeat_interval) {
    return new_error(raft_error::CONFIG_INVALID, "election timeout must be greater than heartbeat interval");
  }
  if (election_timeout_max <= election_timeout_min) {
    return new_error(raft_error::CONFIG_INVALID, "election timeout max must be greater than min");
  }
  if (send_timeout.count() <= 0 || install_snapshot_timeout.count() <= 0) {
    return new_error(raft_error::CONFIG_INVALID, "rpc timeout must be greater than 0");
  }
  if (write_timeout.count() <= 0) {
    return new_error(raft_error::CONFIG_INVALID, "write timeout must be greater than 0");
  }
  if (max_payload_entries == 0) {
    return new_error(raft_error::CONFIG_INVALID, "max payload entries must be greater than 0");
  }
  if (snapshot_logs_since_last == 0) {
    return new_error(raft_error::CONFIG_INVALID, "snapshot_logs_since_last must be greater than 0");
  }
  return {};
}

}  // namespace metad::raft
