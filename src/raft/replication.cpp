#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "error/leaf_expected.h"
#include "error/raft_error.h"
#include "error/storage_error.h"
#include "pb/codec.h"
#include "raft/quorum.h"
#include "raft/raft_node.h"

namespace metad::raft {

void raft_node::start_replication(node_id target) {
  auto notifier = std::make_shared<coro::signal_channel_endpoint>(strand_);
  progress_[target] = replication_progress{last_log_id_.index + 1, 0, notifier};
  LOGGER_DEBUG(logger_, "leader {} start replication to {} from {}", id_, target, last_log_id_.index + 1);
  auto self = shared_from_this();
  auto term = current_term_;
  waiter_->add([self, target, term, notifier]() { return self->replication_loop(target, term, notifier); });
}

void raft_node::stop_replication() {
  for (auto& [target, progress] : progress_) {
    progress.notifier->close();
  }
  progress_.clear();
}

// 让复制目标与当前成员配置一致。新成员立即开始复制；已移除的成员在配置提交后停止
void raft_node::sync_replication_targets() {
  if (state_ != server_state::leader || stopped_) {
    return;
  }
  auto members = membership_.all_members();
  for (auto target : members) {
    if (target != id_ && !progress_.contains(target)) {
      start_replication(target);
    }
  }
  if (membership_index_ > last_applied_.index) {
    return;
  }
  for (auto iter = progress_.begin(); iter != progress_.end();) {
    if (!members.contains(iter->first)) {
      LOGGER_INFO(logger_, "leader {} stop replication to removed member {}", id_, iter->first);
      iter->second.notifier->close();
      iter = progress_.erase(iter);
    } else {
      ++iter;
    }
  }
}

void raft_node::notify_replication() {
  for (auto& [target, progress] : progress_) {
    progress.notifier->try_send();
  }
}

asio::awaitable<void> raft_node::replication_loop(node_id target, std::uint64_t term,
                                                  std::shared_ptr<coro::signal_channel_endpoint> notifier) {
  while (!stopped_ && notifier->is_open() && state_ == server_state::leader && current_term_ == term) {
    auto result = co_await replicate_once(target, term);
    if (result == replicate_result::more) {
      continue;
    }
    // 空闲或失败时等待新日志或心跳间隔
    auto signaled = co_await notifier->async_receive_for(config_.heartbeat_interval);
    if (!signaled) {
      break;
    }
  }
  LOGGER_DEBUG(logger_, "leader {} replication to {} at term {} exit", id_, target, term);
}

asio::awaitable<raft_node::replicate_result> raft_node::replicate_once(node_id target, std::uint64_t term) {
  auto iter = progress_.find(target);
  if (iter == progress_.end()) {
    co_return replicate_result::failed;
  }
  auto next = iter->second.next_index;
  if (next < storage_->first_index()) {
    co_return co_await send_snapshot(target, term);
  }

  auto prev_index = next - 1;
  auto prev_term = leaf_to_expected([&]() { return storage_->term(prev_index); });
  if (!prev_term) {
    if (prev_term.error() == storage_error::COMPACTED) {
      co_return co_await send_snapshot(target, term);
    }
    LOGGER_ERROR(logger_, "read term of {} for {} failed: {}", prev_index, target, prev_term.error().message());
    co_return replicate_result::failed;
  }

  metadpb::append_entries_request req;
  req.set_term(term);
  req.set_leader_id(id_);
  req.mutable_prev_log_id()->set_term(*prev_term);
  req.mutable_prev_log_id()->set_index(prev_index);
  req.set_leader_commit(committed_);
  if (next <= last_log_id_.index) {
    auto hi = std::min(last_log_id_.index + 1, next + config_.max_payload_entries);
    auto entries = leaf_to_expected([&]() { return storage_->entries(next, hi); });
    if (!entries) {
      if (entries.error() == storage_error::COMPACTED) {
        co_return co_await send_snapshot(target, term);
      }
      LOGGER_ERROR(logger_, "read entries [{}, {}) for {} failed: {}", next, hi, target, entries.error().message());
      co_return replicate_result::failed;
    }
    for (auto& ent : *entries) {
      *req.add_entries() = std::move(ent);
    }
  }

  auto sent = static_cast<std::uint64_t>(req.entries_size());
  auto resp = co_await network_->append_entries(target, std::move(req));
  if (stopped_ || state_ != server_state::leader || current_term_ != term) {
    co_return replicate_result::failed;
  }
  if (!resp) {
    LOGGER_TRACE(logger_, "append entries to {} failed: {}", target, resp.error().message());
    co_return replicate_result::failed;
  }
  if (resp->term() > current_term_) {
    LOGGER_INFO(logger_, "leader {} sees higher term {} from {}", id_, resp->term(), target);
    become_follower(resp->term(), std::nullopt);
    co_return replicate_result::failed;
  }

  iter = progress_.find(target);
  if (iter == progress_.end()) {
    co_return replicate_result::failed;
  }
  auto& progress = iter->second;
  if (!resp->success()) {
    auto conflict = resp->conflict_index();
    progress.next_index = std::max<std::uint64_t>(1, std::min(conflict, progress.next_index - 1));
    LOGGER_DEBUG(logger_, "append entries to {} rejected, conflict {}, next {}", target, conflict,
                 progress.next_index);
    co_return replicate_result::more;
  }

  auto matched = std::min(resp->matched_index(), prev_index + sent);
  if (matched > progress.matched) {
    progress.matched = matched;
  }
  progress.next_index = std::max(progress.next_index, progress.matched + 1);
  advance_commit();

  iter = progress_.find(target);
  if (iter == progress_.end() || state_ != server_state::leader) {
    co_return replicate_result::failed;
  }
  co_return iter->second.next_index <= last_log_id_.index ? replicate_result::more : replicate_result::idle;
}

asio::awaitable<raft_node::replicate_result> raft_node::send_snapshot(node_id target, std::uint64_t term) {
  auto snapshot = leaf_to_expected([&]() { return storage_->current_snapshot(); });
  if (!snapshot) {
    LOGGER_ERROR(logger_, "load snapshot for {} failed: {}", target, snapshot.error().message());
    co_return replicate_result::failed;
  }
  if (!*snapshot) {
    LOGGER_ERROR(logger_, "no snapshot available for {}", target);
    co_return replicate_result::failed;
  }

  auto snapshot_id = pb::from_pb((*snapshot)->meta.last_log_id());
  LOGGER_INFO(logger_, "leader {} send snapshot {} to {}", id_, snapshot_id.to_string(), target);
  metadpb::install_snapshot_request req;
  req.set_term(term);
  req.set_leader_id(id_);
  *req.mutable_meta() = std::move((*snapshot)->meta);
  req.set_data(std::move((*snapshot)->data));

  auto resp = co_await network_->install_snapshot(target, std::move(req));
  if (stopped_ || state_ != server_state::leader || current_term_ != term) {
    co_return replicate_result::failed;
  }
  if (!resp) {
    LOGGER_WARN(logger_, "install snapshot on {} failed: {}", target, resp.error().message());
    co_return replicate_result::failed;
  }
  if (resp->term() > current_term_) {
    become_follower(resp->term(), std::nullopt);
    co_return replicate_result::failed;
  }

  auto iter = progress_.find(target);
  if (iter == progress_.end()) {
    co_return replicate_result::failed;
  }
  iter->second.matched = std::max(iter->second.matched, snapshot_id.index);
  iter->second.next_index = iter->second.matched + 1;
  advance_commit();
  co_return replicate_result::more;
}

void raft_node::advance_commit() {
  if (state_ != server_state::leader) {
    return;
  }
  std::map<std::uint64_t, quorum::log_index> acked;
  for (auto v : membership_.voters) {
    if (v == id_) {
      acked[v] = last_log_id_.index;
    } else if (auto iter = progress_.find(v); iter != progress_.end()) {
      acked[v] = iter->second.matched;
    }
  }
  quorum::map_ack_indexer indexer(std::move(acked));
  auto index = quorum::majority_config(membership_.voters).committed_index(&indexer);
  if (index == quorum::INVALID_LOG_INDEX || index <= committed_) {
    return;
  }

  // 只能通过计数提交当前任期的日志
  auto term = leaf_to_expected([&]() { return storage_->term(index); });
  if (!term || *term != current_term_) {
    return;
  }
  update_commit(index);
  notify_replication();
}

expected<metadpb::append_entries_response> raft_node::handle_append_entries_impl(
    const metadpb::append_entries_request& req) {
  if (stopped_) {
    return unexpected(raft_error::STOPPED);
  }

  metadpb::append_entries_response resp;
  resp.set_term(current_term_);
  resp.set_success(false);
  if (req.term() < current_term_) {
    return resp;
  }
  if (req.term() > current_term_ || state_ == server_state::candidate || state_ == server_state::leader ||
      leader_id_ != req.leader_id()) {
    become_follower(req.term(), req.leader_id());
  }
  heard_from_leader();
  resp.set_term(current_term_);

  auto prev = pb::from_pb(req.prev_log_id());
  if (prev.index > last_log_id_.index) {
    resp.set_conflict_index(last_log_id_.index + 1);
    return resp;
  }
  auto local_prev_term = leaf_to_expected([&]() { return storage_->term(prev.index); });
  if (!local_prev_term && local_prev_term.error() != storage_error::COMPACTED) {
    return tl::unexpected(local_prev_term.error());
  }
  // 已清理的日志必然已提交，视为匹配
  if (local_prev_term && *local_prev_term != prev.term) {
    LOGGER_DEBUG(logger_, "prev log {} mismatch, local term {}", prev.to_string(), *local_prev_term);
    resp.set_conflict_index(prev.index);
    return resp;
  }

  auto first_index = storage_->first_index();
  pb::entry_list to_append;
  bool truncated = false;
  for (const auto& ent : req.entries()) {
    if (!to_append.empty()) {
      to_append.push_back(ent);
      continue;
    }
    if (ent.index() < first_index || ent.index() <= last_applied_.index) {
      continue;
    }
    if (ent.index() > last_log_id_.index) {
      to_append.push_back(ent);
      continue;
    }
    auto local_term = leaf_to_expected([&]() { return storage_->term(ent.index()); });
    if (!local_term) {
      if (local_term.error() == storage_error::COMPACTED) {
        continue;
      }
      return tl::unexpected(local_term.error());
    }
    if (*local_term == ent.term()) {
      continue;
    }
    LOGGER_INFO(logger_, "truncate logs since {} on conflict, local term {} leader term {}", ent.index(),
                *local_term, ent.term());
    if (auto result = leaf_to_expected_void([&]() { return storage_->truncate_since(ent.index()); }); !result) {
      return tl::unexpected(result.error());
    }
    last_log_id_ = storage_->last_log_id();
    truncated = true;
    to_append.push_back(ent);
  }

  if (truncated) {
    if (auto result = leaf_to_expected_void([&]() { return reload_membership(); }); !result) {
      return tl::unexpected(result.error());
    }
  }
  if (auto result = leaf_to_expected_void([&]() { return append_local(to_append); }); !result) {
    return tl::unexpected(result.error());
  }
  if (truncated) {
    state_ = follower_state();
  }

  auto matched = prev.index + static_cast<std::uint64_t>(req.entries_size());
  resp.set_success(true);
  resp.set_matched_index(matched);
  update_commit(std::min(req.leader_commit(), matched));
  if (stopped_) {
    return unexpected(raft_error::STOPPED);
  }
  publish_metrics();
  return resp;
}

asio::awaitable<expected<metadpb::append_entries_response>> raft_node::handle_append_entries(
    metadpb::append_entries_request req) {
  co_return co_await asio::co_spawn(
      strand_,
      [self = shared_from_this(),
       req = std::move(req)]() -> asio::awaitable<expected<metadpb::append_entries_response>> {
        co_return self->handle_append_entries_impl(req);
      },
      asio::use_awaitable);
}

expected<metadpb::install_snapshot_response> raft_node::handle_install_snapshot_impl(
    const metadpb::install_snapshot_request& req) {
  if (stopped_) {
    return unexpected(raft_error::STOPPED);
  }

  metadpb::install_snapshot_response resp;
  resp.set_term(current_term_);
  if (req.term() < current_term_) {
    return resp;
  }
  if (req.term() > current_term_ || state_ == server_state::candidate || state_ == server_state::leader ||
      leader_id_ != req.leader_id()) {
    become_follower(req.term(), req.leader_id());
  }
  heard_from_leader();
  resp.set_term(current_term_);

  auto snapshot_id = pb::from_pb(req.meta().last_log_id());
  if (snapshot_id.index <= last_applied_.index) {
    LOGGER_DEBUG(logger_, "ignore snapshot {}, already applied {}", snapshot_id.to_string(),
                 last_applied_.to_string());
    return resp;
  }

  LOGGER_INFO(logger_, "node {} install snapshot {} from {}", id_, snapshot_id.to_string(), req.leader_id());
  if (auto result = leaf_to_expected_void([&]() { return storage_->install_snapshot(req.meta(), req.data()); });
      !result) {
    LOGGER_ERROR(logger_, "install snapshot {} failed: {}", snapshot_id.to_string(), result.error().message());
    return tl::unexpected(result.error());
  }

  last_log_id_ = storage_->last_log_id();
  last_applied_ = snapshot_id;
  snapshot_last_ = snapshot_id;
  if (committed_ < snapshot_id.index) {
    committed_ = snapshot_id.index;
    if (auto result = leaf_to_expected_void([&]() { return save_hard_state(); }); !result) {
      return tl::unexpected(result.error());
    }
  }
  if (auto result = leaf_to_expected_void([&]() { return reload_membership(); }); !result) {
    return tl::unexpected(result.error());
  }
  state_ = follower_state();
  if (auto result = leaf_to_expected_void([&]() { return apply_committed(); }); !result) {
    LOGGER_CRITICAL(logger_, "apply after snapshot {} failed: {}, halt raft node {}", snapshot_id.to_string(),
                    result.error().message(), id_);
    halt(result.error());
    return tl::unexpected(result.error());
  }
  publish_metrics();
  return resp;
}

asio::awaitable<expected<metadpb::install_snapshot_response>> raft_node::handle_install_snapshot(
    metadpb::install_snapshot_request req) {
  co_return co_await asio::co_spawn(
      strand_,
      [self = shared_from_this(),
       req = std::move(req)]() -> asio::awaitable<expected<metadpb::install_snapshot_response>> {
        co_return self->handle_install_snapshot_impl(req);
      },
      asio::use_awaitable);
}

}  // namespace metad::raft
