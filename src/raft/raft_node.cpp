#include "raft/raft_node.h"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "error/error.h"
#include "error/leaf_expected.h"
#include "error/raft_error.h"
#include "error/storage_error.h"
#include "pb/codec.h"

namespace metad::raft {

raft_node::raft_node(node_id id, raft_config config, asio::any_io_executor executor,
                     pro::proxy<storage_builder> storage, pro::proxy<network_builder> network,
                     std::shared_ptr<logger_interface> logger)
    : id_(id),
      config_(config),
      policy_(config),
      strand_(asio::make_strand(executor)),
      storage_(std::move(storage)),
      network_(std::move(network)),
      logger_(std::move(logger)),
      rng_(std::random_device{}() ^ id),
      election_signal_(strand_),
      waiter_(coro::make_co_spawn_waiter(strand_)),
      metrics_(std::make_shared<metrics_watch>(raft_metrics{.id = id})) {
  last_published_ = metrics_->borrow();
}

leaf::result<void> raft_node::start() {
  if (started_) {
    return {};
  }
  BOOST_LEAF_AUTO(init, storage_->initial_state());
  current_term_ = init.hard_state.current_term();
  if (init.hard_state.has_voted_for()) {
    voted_for_ = init.hard_state.voted_for();
  }
  last_log_id_ = init.last_log_id;
  last_applied_ = init.last_applied;
  membership_ = std::move(init.membership);
  membership_index_ = init.membership_index;
  snapshot_last_ = init.snapshot_last;
  committed_ = std::max(init.hard_state.committed(), last_applied_.index);
  state_ = follower_state();
  started_ = true;
  LOGGER_INFO(logger_, "raft node {} start, term:{} last_log:{} applied:{} committed:{} membership:{{{}}}", id_,
              current_term_, last_log_id_.to_string(), last_applied_.to_string(), committed_,
              membership_.to_string());

  // 重放已提交但尚未应用到状态机的日志，失败则拒绝启动
  METAD_LEAF_CHECK(apply_committed());
  publish_metrics();

  auto self = shared_from_this();
  waiter_->add([self]() { return self->election_loop(); });
  if (membership_.voters == std::set<node_id>{id_}) {
    waiter_->add([self]() { return self->campaign(); });
  }
  return {};
}

asio::awaitable<std::size_t> raft_node::shutdown() {
  co_return co_await asio::co_spawn(
      strand_, [self = shared_from_this()]() { return self->shutdown_impl(); }, asio::use_awaitable);
}

void raft_node::halt(std::error_code ec) {
  if (stopped_) {
    return;
  }
  stopped_ = true;
  state_ = server_state::shutdown;
  election_signal_.close();
  stop_replication();
  fail_pending(ec);
  publish_metrics();
  metrics_->close();
}

asio::awaitable<std::size_t> raft_node::shutdown_impl() {
  if (joined_) {
    co_return 0;
  }
  joined_ = true;
  LOGGER_INFO(logger_, "raft node {} shutting down", id_);
  halt(make_error_code(raft_error::STOPPED));
  auto joined = co_await waiter_->wait_all();
  // 释放存储，目录锁随最后一个引用一起释放
  storage_.reset();
  LOGGER_INFO(logger_, "raft node {} stopped, joined {} tasks", id_, joined);
  co_return joined;
}

asio::awaitable<expected<void>> raft_node::initialize(membership m) {
  co_return co_await asio::co_spawn(
      strand_, [self = shared_from_this(), m = std::move(m)]() mutable { return self->initialize_impl(std::move(m)); },
      asio::use_awaitable);
}

asio::awaitable<expected<void>> raft_node::initialize_impl(membership m) {
  if (stopped_) {
    co_return unexpected(raft_error::STOPPED);
  }
  if (last_log_id_.index != 0 || current_term_ != 0) {
    co_return unexpected(raft_error::ALREADY_INITIALIZED);
  }
  if (m.voters.empty()) {
    co_return unexpected(raft_error::CONFIG_INVALID);
  }

  metadpb::entry ent;
  ent.set_term(0);
  ent.set_index(1);
  ent.set_type(metadpb::ENTRY_MEMBERSHIP);
  *ent.mutable_membership() = pb::to_pb(m);
  auto result = leaf_to_expected_void([&]() { return append_local({ent}); });
  if (!result) {
    LOGGER_ERROR(logger_, "initialize {} failed: {}", m.to_string(), result.error().message());
    co_return result;
  }
  LOGGER_INFO(logger_, "raft node {} initialized with {}", id_, m.to_string());
  state_ = follower_state();
  publish_metrics();

  if (m.voters == std::set<node_id>{id_}) {
    co_await campaign();
  }
  co_return ok();
}

asio::awaitable<expected<client_write_response>> raft_node::client_write(log_entry entry) {
  co_return co_await asio::co_spawn(
      strand_,
      [self = shared_from_this(), entry = std::move(entry)]() mutable {
        return self->client_write_impl(std::move(entry));
      },
      asio::use_awaitable);
}

asio::awaitable<expected<client_write_response>> raft_node::client_write_impl(log_entry entry) {
  if (stopped_) {
    co_return unexpected(raft_error::STOPPED);
  }
  if (state_ != server_state::leader) {
    co_return unexpected(raft_error::NOT_LEADER);
  }

  auto ent = next_entry(metadpb::ENTRY_NORMAL);
  *ent.mutable_normal() = pb::to_pb(entry);
  auto id = pb::entry_log_id(ent);
  auto chan = std::make_shared<pending_channel>(strand_, 1);
  pending_[id.index] = chan;
  if (auto result = leaf_to_expected_void([&]() { return append_local({ent}); }); !result) {
    pending_.erase(id.index);
    co_return tl::unexpected(result.error());
  }

  auto applied = co_await wait_applied(id.index, std::move(chan));
  if (!applied) {
    co_return tl::unexpected(applied.error());
  }
  co_return client_write_response{id, std::move(*applied)};
}

asio::awaitable<expected<applied_state>> raft_node::wait_applied(std::uint64_t index,
                                                                 std::shared_ptr<pending_channel> chan) {
  auto receive = [](std::shared_ptr<pending_channel> chan) -> asio::awaitable<expected<applied_state>> {
    auto [ec, applied] = co_await chan->async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
      co_return tl::unexpected(ec);
    }
    co_return applied;
  };
  // 超时后 pending_ 中的条目保留，提交后照常应用，结果留在 channel 缓冲中
  auto result = co_await coro::with_timeout(receive(std::move(chan)), config_.write_timeout, raft_error::TIMEOUT);
  if (!result && result.error() == raft_error::TIMEOUT) {
    LOGGER_WARN(logger_, "proposal {} not applied within {}ms", index, config_.write_timeout.count());
  }
  co_return result;
}

asio::awaitable<expected<void>> raft_node::change_membership(std::set<node_id> voters) {
  co_return co_await asio::co_spawn(
      strand_,
      [self = shared_from_this(), voters = std::move(voters)]() mutable {
        return self->change_membership_impl(std::move(voters));
      },
      asio::use_awaitable);
}

asio::awaitable<expected<void>> raft_node::change_membership_impl(std::set<node_id> voters) {
  if (stopped_) {
    co_return unexpected(raft_error::STOPPED);
  }
  if (state_ != server_state::leader) {
    co_return unexpected(raft_error::NOT_LEADER);
  }
  if (voters.empty()) {
    co_return unexpected(raft_error::CONFIG_INVALID);
  }
  for (auto v : voters) {
    if (!membership_.contains(v)) {
      LOGGER_WARN(logger_, "change membership: {} is not a member of {}", v, membership_.to_string());
      co_return unexpected(raft_error::LEARNER_NOT_FOUND);
    }
  }

  membership target;
  target.voters = voters;
  for (auto l : membership_.learners) {
    if (!voters.contains(l)) {
      target.learners.insert(l);
    }
  }
  if (target == membership_) {
    co_return ok();
  }
  co_return co_await propose_membership(std::move(target));
}

asio::awaitable<expected<void>> raft_node::add_learner(node_id id) {
  co_return co_await asio::co_spawn(
      strand_, [self = shared_from_this(), id]() { return self->add_learner_impl(id); }, asio::use_awaitable);
}

asio::awaitable<expected<void>> raft_node::add_learner_impl(node_id id) {
  if (stopped_) {
    co_return unexpected(raft_error::STOPPED);
  }
  if (state_ != server_state::leader) {
    co_return unexpected(raft_error::NOT_LEADER);
  }
  if (membership_.contains(id)) {
    co_return ok();
  }
  auto target = membership_;
  target.learners.insert(id);
  co_return co_await propose_membership(std::move(target));
}

asio::awaitable<expected<void>> raft_node::remove_learner(node_id id) {
  co_return co_await asio::co_spawn(
      strand_, [self = shared_from_this(), id]() { return self->remove_learner_impl(id); }, asio::use_awaitable);
}

asio::awaitable<expected<void>> raft_node::remove_learner_impl(node_id id) {
  if (stopped_) {
    co_return unexpected(raft_error::STOPPED);
  }
  if (state_ != server_state::leader) {
    co_return unexpected(raft_error::NOT_LEADER);
  }
  if (!membership_.is_learner(id)) {
    co_return ok();
  }
  auto target = membership_;
  target.learners.erase(id);
  co_return co_await propose_membership(std::move(target));
}

asio::awaitable<expected<void>> raft_node::propose_membership(membership m) {
  // 同一时刻只允许一个未提交的成员变更
  if (membership_index_ > committed_) {
    co_return unexpected(raft_error::MEMBERSHIP_CHANGE_IN_PROGRESS);
  }

  auto ent = next_entry(metadpb::ENTRY_MEMBERSHIP);
  *ent.mutable_membership() = pb::to_pb(m);
  auto index = ent.index();
  auto chan = std::make_shared<pending_channel>(strand_, 1);
  pending_[index] = chan;
  LOGGER_INFO(logger_, "propose membership {} at index {}", m.to_string(), index);
  if (auto result = leaf_to_expected_void([&]() { return append_local({ent}); }); !result) {
    pending_.erase(index);
    co_return tl::unexpected(result.error());
  }

  auto applied = co_await wait_applied(index, std::move(chan));
  if (!applied) {
    co_return tl::unexpected(applied.error());
  }
  co_return ok();
}

metadpb::entry raft_node::next_entry(metadpb::entry_type type) const {
  metadpb::entry ent;
  ent.set_term(current_term_);
  ent.set_index(last_log_id_.index + 1);
  ent.set_type(type);
  return ent;
}

server_state raft_node::follower_state() const {
  return membership_.is_voter(id_) ? server_state::follower : server_state::learner;
}

leaf::result<void> raft_node::append_local(const pb::entry_list& entries) {
  if (entries.empty()) {
    return {};
  }
  METAD_LEAF_CHECK(storage_->append(entries));
  last_log_id_ = pb::entry_log_id(entries.back());

  bool membership_changed = false;
  for (const auto& ent : entries) {
    if (ent.type() == metadpb::ENTRY_MEMBERSHIP) {
      // 成员配置在写入日志时即生效
      membership_ = pb::from_pb(ent.membership());
      membership_index_ = ent.index();
      membership_changed = true;
    }
  }

  if (state_ == server_state::leader) {
    if (membership_changed) {
      sync_replication_targets();
    }
    notify_replication();
    advance_commit();
  } else if (membership_changed && state_ != server_state::candidate && state_ != server_state::shutdown) {
    state_ = follower_state();
  }
  publish_metrics();
  return {};
}

leaf::result<void> raft_node::save_hard_state() {
  metadpb::hard_state hs;
  hs.set_current_term(current_term_);
  if (voted_for_) {
    hs.set_voted_for(*voted_for_);
  }
  hs.set_committed(committed_);
  return storage_->save_hard_state(hs);
}

leaf::result<void> raft_node::reload_membership() {
  BOOST_LEAF_AUTO(effective, storage_->effective_membership());
  membership_ = std::move(effective.first);
  membership_index_ = effective.second;
  return {};
}

void raft_node::update_commit(std::uint64_t committed) {
  committed = std::min(committed, last_log_id_.index);
  if (committed <= committed_ || stopped_) {
    return;
  }
  committed_ = committed;
  if (auto result = leaf_to_expected_void([&]() { return save_hard_state(); }); !result) {
    LOGGER_CRITICAL(logger_, "persist committed {} failed: {}, halt raft node {}", committed_,
                    result.error().message(), id_);
    halt(result.error());
    return;
  }
  if (auto result = leaf_to_expected_void([&]() { return apply_committed(); }); !result) {
    LOGGER_CRITICAL(logger_, "apply committed up to {} failed: {}, halt raft node {}", committed_,
                    result.error().message(), id_);
    halt(result.error());
  }
}

leaf::result<void> raft_node::apply_committed() {
  bool leader_removed = false;
  while (last_applied_.index < committed_) {
    auto lo = last_applied_.index + 1;
    auto hi = std::min(committed_ + 1, lo + config_.max_payload_entries);
    BOOST_LEAF_AUTO(entries, storage_->entries(lo, hi));
    if (entries.empty()) {
      return new_error(storage_error::CORRUPTED, fmt::format("committed entries [{}, {}) missing", lo, hi));
    }
    BOOST_LEAF_AUTO(results, storage_->apply(entries));
    if (results.size() != entries.size()) {
      return new_error(storage_error::CORRUPTED, fmt::format("applied {} results for {} entries at [{}, {})",
                                                             results.size(), entries.size(), lo, hi));
    }

    bool membership_applied = false;
    for (std::size_t i = 0; i < entries.size(); ++i) {
      const auto& ent = entries[i];
      last_applied_ = pb::entry_log_id(ent);
      if (ent.type() == metadpb::ENTRY_MEMBERSHIP) {
        membership_applied = true;
      }
      resolve_pending(ent.index(), std::move(results[i]));
    }
    LOGGER_TRACE(logger_, "applied up to {}", last_applied_.to_string());

    if (membership_applied && state_ == server_state::leader) {
      sync_replication_targets();
      if (!membership_.is_voter(id_)) {
        leader_removed = true;
      }
    }
  }

  if (leader_removed) {
    LOGGER_INFO(logger_, "leader {} removed from voters {}, step down", id_, membership_.to_string());
    become_follower(current_term_, std::nullopt);
  }
  maybe_build_snapshot();
  publish_metrics();
  return {};
}

void raft_node::resolve_pending(std::uint64_t index, applied_state result) {
  auto iter = pending_.find(index);
  if (iter == pending_.end()) {
    return;
  }
  iter->second->try_send(std::error_code{}, std::move(result));
  pending_.erase(iter);
}

void raft_node::fail_pending(std::error_code ec) {
  for (auto& [index, chan] : pending_) {
    LOGGER_DEBUG(logger_, "drop pending proposal {}: {}", index, ec.message());
    chan->try_send(ec, applied_state{applied_none{}});
  }
  pending_.clear();
}

void raft_node::maybe_build_snapshot() {
  if (stopped_ || snapshot_building_) {
    return;
  }
  auto snapshot_index = snapshot_last_ ? snapshot_last_->index : 0;
  if (!policy_.should_build(last_applied_.index, snapshot_index)) {
    return;
  }
  snapshot_building_ = true;
  LOGGER_INFO(logger_, "build snapshot at {}, last snapshot {}", last_applied_.to_string(), snapshot_index);
  auto view = storage_->snapshot_view();
  auto self = shared_from_this();
  waiter_->add([self, view = std::move(view)]() mutable { return self->build_snapshot(std::move(view)); });
}

asio::awaitable<void> raft_node::build_snapshot(sm::state_data view) {
  // 序列化与落盘在后台线程执行，完成后回到 strand_
  auto self = shared_from_this();
  auto meta = co_await asio::co_spawn(
      snapshot_pool_.get_executor(),
      [self, view = std::move(view)]() -> asio::awaitable<expected<metadpb::snapshot_meta>> {
        co_return leaf_to_expected([&]() { return self->storage_->save_snapshot(view); });
      },
      asio::use_awaitable);
  snapshot_building_ = false;
  if (!meta) {
    LOGGER_ERROR(logger_, "build snapshot failed: {}", meta.error().message());
    co_return;
  }
  if (stopped_) {
    co_return;
  }

  snapshot_last_ = pb::from_pb(meta->last_log_id());
  LOGGER_INFO(logger_, "snapshot {} saved at {}", meta->snapshot_id(), snapshot_last_->to_string());
  if (auto upto = policy_.purge_upto(snapshot_last_->index)) {
    if (auto result = leaf_to_expected_void([&]() { return storage_->purge_upto(*upto); }); !result) {
      LOGGER_ERROR(logger_, "purge logs upto {} failed: {}", *upto, result.error().message());
    }
  }
  publish_metrics();
}

void raft_node::publish_metrics() {
  raft_metrics m;
  m.id = id_;
  m.state = state_;
  m.current_term = current_term_;
  m.last_log_index = last_log_id_.index;
  m.last_applied = last_applied_;
  m.current_leader = leader_id_;
  m.membership = membership_;
  m.snapshot = snapshot_last_;
  if (m == last_published_) {
    return;
  }
  last_published_ = m;
  metrics_->send(std::move(m));
}

void raft_node::heard_from_leader() {
  last_heard_leader_ = std::chrono::steady_clock::now();
  election_signal_.try_send();
}

}  // namespace metad::raft
