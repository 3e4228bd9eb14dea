#include "raft/wait.h"

#include <fmt/format.h>

#include <absl/strings/str_join.h>

#include "basic/enum_name.h"
#include "basic/logger.h"
#include "coroutine/channel.h"
#include "error/raft_error.h"

namespace metad::raft {

asio::awaitable<expected<raft_metrics>> wait::metrics(std::function<bool(const raft_metrics&)> pred,
                                                      std::string msg) {
  auto deadline = std::chrono::steady_clock::now() + timeout_;
  while (true) {
    auto [latest, version] = watch_->borrow_with_version();
    if (pred(latest)) {
      LOG_DEBUG("wait {} done: {}", msg, latest.to_string());
      co_return latest;
    }
    if (watch_->is_closed()) {
      co_return tl::unexpected(make_error_code(raft_error::STOPPED));
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      LOG_DEBUG("wait {} timeout, latest: {}", msg, latest.to_string());
      co_return tl::unexpected(make_error_code(raft_error::TIMEOUT));
    }

    auto changed = co_await coro::with_timeout(watch_->changed(version), deadline - now);
    if (!changed) {
      if (changed.error() == raft_error::TIMEOUT) {
        LOG_DEBUG("wait {} timeout, latest: {}", msg, watch_->borrow().to_string());
      }
      co_return tl::unexpected(changed.error());
    }
  }
}

asio::awaitable<expected<raft_metrics>> wait::log(std::uint64_t index, std::string msg) {
  co_return co_await metrics(
      [index](const raft_metrics& m) { return m.last_log_index >= index && m.last_applied.index >= index; },
      fmt::format("{} log {}", msg, index));
}

asio::awaitable<expected<raft_metrics>> wait::state(server_state want, std::string msg) {
  co_return co_await metrics([want](const raft_metrics& m) { return m.state == want; },
                             fmt::format("{} state {}", msg, enum_name(want)));
}

asio::awaitable<expected<raft_metrics>> wait::current_leader(node_id leader, std::string msg) {
  co_return co_await metrics([leader](const raft_metrics& m) { return m.current_leader == leader; },
                             fmt::format("{} leader {}", msg, leader));
}

asio::awaitable<expected<raft_metrics>> wait::members(std::set<node_id> voters, std::string msg) {
  auto desc = fmt::format("{} voters [{}]", msg, absl::StrJoin(voters, ","));
  co_return co_await metrics(
      [voters = std::move(voters)](const raft_metrics& m) { return m.membership.voters == voters; },
      std::move(desc));
}

asio::awaitable<expected<raft_metrics>> wait::learners(std::set<node_id> learners, std::string msg) {
  auto desc = fmt::format("{} learners [{}]", msg, absl::StrJoin(learners, ","));
  co_return co_await metrics(
      [learners = std::move(learners)](const raft_metrics& m) { return m.membership.learners == learners; },
      std::move(desc));
}

asio::awaitable<expected<raft_metrics>> wait::snapshot(log_id want, std::string msg) {
  co_return co_await metrics([want](const raft_metrics& m) { return m.snapshot && *m.snapshot >= want; },
                             fmt::format("{} snapshot {}", msg, want.to_string()));
}

}  // namespace metad::raft
