#include "service/meta_network.h"

#include "error/error.h"
#include "error/network_error.h"

namespace metad::service {

expected<std::string> meta_network::resolve(node_id target) const {
  auto store = store_.lock();
  if (!store) {
    return unexpected(network_error::NODE_NOT_FOUND);
  }
  auto n = store->get_node(target);
  if (!n) {
    LOGGER_TRACE(logger_, "node {} not found in registry", target);
    return unexpected(network_error::NODE_NOT_FOUND);
  }
  return n->endpoint;
}

asio::awaitable<expected<metadpb::append_entries_response>> meta_network::append_entries(
    node_id target, metadpb::append_entries_request req) {
  auto endpoint = resolve(target);
  CO_CHECK_EXPECTED(endpoint);
  co_return co_await router_->append_entries(*endpoint, std::move(req), config_.send_timeout);
}

asio::awaitable<expected<metadpb::vote_response>> meta_network::vote(node_id target, metadpb::vote_request req) {
  auto endpoint = resolve(target);
  CO_CHECK_EXPECTED(endpoint);
  co_return co_await router_->vote(*endpoint, std::move(req), config_.send_timeout);
}

asio::awaitable<expected<metadpb::install_snapshot_response>> meta_network::install_snapshot(
    node_id target, metadpb::install_snapshot_request req) {
  auto endpoint = resolve(target);
  CO_CHECK_EXPECTED(endpoint);
  co_return co_await router_->install_snapshot(*endpoint, std::move(req), config_.install_snapshot_timeout);
}

}  // namespace metad::service
