#include <fmt/format.h>

#include <map>
#include <utility>

#include "error/leaf_expected.h"
#include "error/raft_error.h"
#include "pb/codec.h"
#include "raft/quorum.h"
#include "raft/raft_node.h"

namespace metad::raft {

std::chrono::milliseconds raft_node::random_election_timeout() {
  std::uniform_int_distribution<std::int64_t> dist(config_.election_timeout_min.count(),
                                                   config_.election_timeout_max.count() - 1);
  return std::chrono::milliseconds(dist(rng_));
}

asio::awaitable<void> raft_node::election_loop() {
  while (!stopped_) {
    auto signaled = co_await election_signal_.async_receive_for(random_election_timeout());
    if (!signaled) {
      break;
    }
    if (*signaled) {
      // 收到 leader 消息或投出选票，重新计时
      continue;
    }
    if (stopped_ || state_ == server_state::leader || !membership_.is_voter(id_)) {
      continue;
    }
    LOGGER_INFO(logger_, "node {} election timeout at term {}, leader {}", id_, current_term_,
                leader_id_ ? fmt::format("{}", *leader_id_) : std::string("none"));
    co_await campaign();
  }
  LOGGER_DEBUG(logger_, "node {} election loop exit", id_);
}

asio::awaitable<void> raft_node::campaign() {
  if (stopped_ || state_ == server_state::leader || !membership_.is_voter(id_)) {
    co_return;
  }

  state_ = server_state::candidate;
  current_term_ += 1;
  voted_for_ = id_;
  leader_id_.reset();
  if (auto result = leaf_to_expected_void([&]() { return save_hard_state(); }); !result) {
    LOGGER_ERROR(logger_, "persist vote for term {} failed: {}", current_term_, result.error().message());
    state_ = follower_state();
    publish_metrics();
    co_return;
  }
  publish_metrics();

  const auto term = current_term_;
  quorum::majority_config config(membership_.voters);
  std::map<std::uint64_t, bool> votes{{id_, true}};
  if (config.vote_result_statistics(votes) == quorum::vote_result::VOTE_WON) {
    become_leader();
    co_return;
  }

  metadpb::vote_request req;
  req.set_term(term);
  req.set_candidate_id(id_);
  *req.mutable_last_log_id() = pb::to_pb(last_log_id_);

  using vote_reply = std::pair<node_id, expected<metadpb::vote_response>>;
  std::vector<node_id> peers;
  for (auto v : membership_.voters) {
    if (v != id_) {
      peers.push_back(v);
    }
  }
  auto replies = std::make_shared<coro::channel<vote_reply>>(strand_, peers.size());
  LOGGER_INFO(logger_, "node {} start campaign at term {}, last log {}", id_, term, last_log_id_.to_string());
  for (auto peer : peers) {
    asio::co_spawn(
        strand_,
        [self = shared_from_this(), peer, req, replies]() -> asio::awaitable<void> {
          auto resp = co_await self->network_->vote(peer, req);
          replies->try_send(std::error_code{}, vote_reply{peer, std::move(resp)});
        },
        asio::detached);
  }

  for (std::size_t received = 0; received < peers.size(); ++received) {
    auto [ec, reply] = co_await replies->async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
      co_return;
    }
    if (stopped_ || state_ != server_state::candidate || current_term_ != term) {
      co_return;
    }

    auto& [peer, resp] = reply;
    if (!resp) {
      LOGGER_DEBUG(logger_, "vote request to {} failed: {}", peer, resp.error().message());
      votes[peer] = false;
    } else {
      if (resp->term() > current_term_) {
        become_follower(resp->term(), std::nullopt);
        co_return;
      }
      votes[peer] = resp->vote_granted();
    }

    switch (config.vote_result_statistics(votes)) {
      case quorum::vote_result::VOTE_WON:
        become_leader();
        co_return;
      case quorum::vote_result::VOTE_LOST:
        LOGGER_INFO(logger_, "node {} lost election at term {}", id_, term);
        state_ = follower_state();
        publish_metrics();
        co_return;
      case quorum::vote_result::VOTE_PENDING:
        break;
    }
  }
}

expected<metadpb::vote_response> raft_node::handle_vote_impl(const metadpb::vote_request& req) {
  if (stopped_) {
    return unexpected(raft_error::STOPPED);
  }

  metadpb::vote_response resp;
  *resp.mutable_last_log_id() = pb::to_pb(last_log_id_);
  resp.set_term(current_term_);
  resp.set_vote_granted(false);
  if (req.term() < current_term_) {
    return resp;
  }

  // leader 仍然有效时拒绝投票，避免被移除或隔离的节点打断集群
  auto now = std::chrono::steady_clock::now();
  bool leader_alive = state_ == server_state::leader ||
                      (leader_id_ && now - last_heard_leader_ < config_.election_timeout_min);
  if (req.candidate_id() != id_ && leader_alive) {
    LOGGER_DEBUG(logger_, "reject vote from {} at term {}: leader {} is alive", req.candidate_id(), req.term(),
                 leader_id_ ? fmt::format("{}", *leader_id_) : std::string("self"));
    return resp;
  }

  if (req.term() > current_term_) {
    become_follower(req.term(), std::nullopt);
  }
  resp.set_term(current_term_);

  auto candidate_last = pb::from_pb(req.last_log_id());
  bool up_to_date = candidate_last >= last_log_id_;
  bool can_vote = !voted_for_ || *voted_for_ == req.candidate_id();
  if (can_vote && up_to_date) {
    voted_for_ = req.candidate_id();
    if (auto result = leaf_to_expected_void([&]() { return save_hard_state(); }); !result) {
      return tl::unexpected(result.error());
    }
    resp.set_vote_granted(true);
    election_signal_.try_send();
    LOGGER_INFO(logger_, "node {} vote for {} at term {}", id_, req.candidate_id(), current_term_);
  }
  return resp;
}

asio::awaitable<expected<metadpb::vote_response>> raft_node::handle_vote(metadpb::vote_request req) {
  co_return co_await asio::co_spawn(
      strand_,
      [self = shared_from_this(), req = std::move(req)]() -> asio::awaitable<expected<metadpb::vote_response>> {
        co_return self->handle_vote_impl(req);
      },
      asio::use_awaitable);
}

void raft_node::become_leader() {
  state_ = server_state::leader;
  leader_id_ = id_;
  LOGGER_INFO(logger_, "node {} became leader at term {}", id_, current_term_);
  sync_replication_targets();
  // 当前任期的空日志，提交后之前任期的日志随之提交
  auto ent = next_entry(metadpb::ENTRY_BLANK);
  if (auto result = leaf_to_expected_void([&]() { return append_local({ent}); }); !result) {
    LOGGER_ERROR(logger_, "append blank entry at term {} failed: {}", current_term_, result.error().message());
    become_follower(current_term_, std::nullopt);
    return;
  }
  publish_metrics();
}

void raft_node::become_follower(std::uint64_t term, std::optional<node_id> leader) {
  if (term > current_term_) {
    current_term_ = term;
    voted_for_.reset();
    if (auto result = leaf_to_expected_void([&]() { return save_hard_state(); }); !result) {
      LOGGER_ERROR(logger_, "persist term {} failed: {}", term, result.error().message());
    }
  }
  bool was_leader = state_ == server_state::leader;
  if (state_ != server_state::shutdown) {
    state_ = follower_state();
  }
  leader_id_ = leader;
  if (was_leader) {
    LOGGER_INFO(logger_, "node {} step down at term {}", id_, current_term_);
    stop_replication();
    fail_pending(make_error_code(raft_error::PROPOSAL_DROPPED));
  }
  publish_metrics();
}

}  // namespace metad::raft
