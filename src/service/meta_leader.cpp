#include "service/meta_leader.h"

#include "error/leaf_expected.h"
#include "error/logic_error.h"
#include "error/raft_error.h"
#include "pb/codec.h"
#include "service/meta_node.h"

namespace metad::service {

meta_error meta_leader::to_meta_error(std::error_code ec) const {
  if (ec == raft_error::NOT_LEADER) {
    return forward_to_leader{node_->raft_->current_leader()};
  }
  return ec;
}

asio::awaitable<meta_result<metadpb::forward_response>> meta_leader::handle(metadpb::forward_request req) {
  metadpb::forward_response resp;
  switch (req.body_case()) {
    case metadpb::forward_request::kJoin: {
      auto joined = co_await join(std::move(*req.mutable_join()));
      if (!joined) {
        co_return tl::make_unexpected(joined.error());
      }
      resp.set_join(true);
      break;
    }
    case metadpb::forward_request::kLeave: {
      auto left = co_await leave(std::move(*req.mutable_leave()));
      if (!left) {
        co_return tl::make_unexpected(left.error());
      }
      resp.set_leave(true);
      break;
    }
    case metadpb::forward_request::kWrite: {
      auto entry = leaf_to_expected([&]() { return pb::from_pb(req.write()); });
      if (!entry) {
        co_return tl::make_unexpected(meta_error{entry.error()});
      }
      auto applied = co_await write(std::move(*entry));
      if (!applied) {
        co_return tl::make_unexpected(applied.error());
      }
      *resp.mutable_write() = pb::to_pb(*applied);
      break;
    }
    default:
      co_return tl::make_unexpected(meta_error{make_error_code(logic_error::MALFORMED_MESSAGE)});
  }
  co_return resp;
}

asio::awaitable<meta_result<applied_state>> meta_leader::write(log_entry entry) {
  auto resp = co_await node_->raft_->client_write(std::move(entry));
  if (!resp) {
    co_return tl::make_unexpected(to_meta_error(resp.error()));
  }
  co_return std::move(resp->data);
}

asio::awaitable<meta_result<void>> meta_leader::join(metadpb::join_request req) {
  auto id = req.node_id();
  node n;
  n.name = std::to_string(id);
  n.endpoint = req.endpoint();
  if (req.has_grpc_api_addr()) {
    n.grpc_api_addr = req.grpc_api_addr();
  }

  // 先写节点描述，复制开始前 leader 就能解析新成员的地址
  auto added = co_await write(log_entry{add_node{id, n}});
  if (!added) {
    co_return tl::make_unexpected(added.error());
  }

  auto m = node_->raft_->metrics().membership;
  if (m.contains(id)) {
    LOGGER_INFO(node_->logger_, "node {} already in membership {}, endpoint updated to {}", id, m.to_string(),
                n.endpoint);
    co_return meta_result<void>{};
  }

  auto learner = co_await node_->raft_->add_learner(id);
  if (!learner) {
    co_return tl::make_unexpected(to_meta_error(learner.error()));
  }
  LOGGER_INFO(node_->logger_, "node {} joined as learner at {}", id, n.endpoint);
  co_return meta_result<void>{};
}

asio::awaitable<meta_result<void>> meta_leader::leave(metadpb::leave_request req) {
  auto id = req.node_id();
  auto m = node_->raft_->metrics().membership;
  auto registered = node_->get_node(id).has_value();
  if (!m.contains(id) && !registered) {
    LOGGER_INFO(node_->logger_, "node {} not in cluster, nothing to leave", id);
    co_return meta_result<void>{};
  }

  if (m.is_voter(id)) {
    auto voters = m.voters;
    voters.erase(id);
    if (voters.empty()) {
      co_return tl::make_unexpected(meta_error{make_error_code(raft_error::CONFIG_INVALID)});
    }
    if (auto changed = co_await change_membership(std::move(voters)); !changed) {
      co_return tl::make_unexpected(changed.error());
    }
  } else if (m.is_learner(id)) {
    auto removed = co_await node_->raft_->remove_learner(id);
    if (!removed) {
      co_return tl::make_unexpected(to_meta_error(removed.error()));
    }
  }

  if (registered) {
    // leader 移除自己后已经下台，这里会返回 forward_to_leader，调用方重试即可
    auto removed = co_await write(log_entry{remove_node{id}});
    if (!removed) {
      co_return tl::make_unexpected(removed.error());
    }
  }
  LOGGER_INFO(node_->logger_, "node {} left cluster", id);
  co_return meta_result<void>{};
}

asio::awaitable<meta_result<void>> meta_leader::change_membership(std::set<node_id> voters) {
  auto changed = co_await node_->raft_->change_membership(std::move(voters));
  if (!changed) {
    co_return tl::make_unexpected(to_meta_error(changed.error()));
  }
  co_return meta_result<void>{};
}

}  // namespace metad::service
