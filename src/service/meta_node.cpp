#include "service/meta_node.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "error/error.h"
#include "error/leaf_expected.h"
#include "error/raft_error.h"
#include "pb/codec.h"

namespace metad::service {

meta_result<metadpb::forward_response> decode_forward_response(metadpb::forward_response resp) {
  if (resp.has_forward()) {
    forward_to_leader f;
    if (resp.forward().has_leader_id()) {
      f.leader_id = resp.forward().leader_id();
    }
    return tl::make_unexpected(meta_error{f});
  }
  if (resp.has_error()) {
    return tl::make_unexpected(meta_error{pb::from_pb(resp.error())});
  }
  return std::move(resp);
}

metadpb::forward_response encode_forward_result(const meta_result<metadpb::forward_response>& result) {
  if (result) {
    return *result;
  }
  metadpb::forward_response resp;
  if (const auto* f = std::get_if<forward_to_leader>(&result.error())) {
    auto* out = resp.mutable_forward();
    if (f->leader_id) {
      out->set_leader_id(*f->leader_id);
    }
  } else {
    *resp.mutable_error() = pb::to_pb(std::get<std::error_code>(result.error()));
  }
  return resp;
}

meta_node::meta_node(private_tag, asio::any_io_executor executor, meta_config config,
                     std::shared_ptr<local_router> router, std::shared_ptr<logger_interface> logger)
    : executor_(executor), config_(std::move(config)), router_(std::move(router)), logger_(std::move(logger)) {}

meta_result<meta_node_ptr> meta_node::create(asio::any_io_executor executor, const meta_config& config,
                                             std::shared_ptr<local_router> router, store::meta_store_ptr store,
                                             std::shared_ptr<logger_interface> logger) {
  auto node = std::make_shared<meta_node>(private_tag{}, executor, config, router, logger);
  node->opened_ = store->is_opened();
  node->store_ = store;
  node->network_ = std::make_shared<meta_network>(router, store, config.raft, logger);
  node->raft_ = std::make_shared<raft::raft_node>(config.id, config.raft, executor,
                                                  pro::proxy<raft::storage_builder>(store),
                                                  pro::proxy<raft::network_builder>(node->network_), logger);

  // 先注册服务，raft 启动后即可收到其他节点的请求
  router->register_service(config.raft_api_advertise_host_endpoint(), node);
  auto started = leaf_to_expected_void([&]() { return node->raft_->start(); });
  if (!started) {
    router->unregister_service(config.raft_api_advertise_host_endpoint());
    LOGGER_ERROR(logger, "start raft node {} failed: {}", config.id, started.error().message());
    return tl::make_unexpected(meta_error{started.error()});
  }
  return node;
}

asio::awaitable<meta_result<meta_node_ptr>> meta_node::open_create_boot(asio::any_io_executor executor,
                                                                        meta_config config, open_options options,
                                                                        std::shared_ptr<local_router> router,
                                                                        std::shared_ptr<logger_interface> logger) {
  if (auto valid = leaf_to_expected_void([&]() { return config.validate(); }); !valid) {
    co_return tl::make_unexpected(meta_error{valid.error()});
  }
  LOGGER_INFO(logger, "open_create_boot node {} at {}, open:{} create:{} initialize:{} join:[{}]", config.id,
              config.raft_dir, options.open, options.create, options.initialize_cluster,
              fmt::join(options.join_endpoints, ","));

  auto store = leaf_to_expected([&]() {
    return store::meta_store::open_create(config.raft_dir, config.id, options.open, options.create, logger);
  });
  if (!store) {
    LOGGER_ERROR(logger, "open store {} failed: {}", config.raft_dir, store.error().message());
    co_return tl::make_unexpected(meta_error{store.error()});
  }

  auto node = create(executor, config, router, *store, logger);
  if (!node) {
    co_return tl::make_unexpected(node.error());
  }

  auto& n = *node;
  if (n->is_opened()) {
    LOGGER_INFO(logger, "node {} reopened, skip cluster initialization", config.id);
    co_return n;
  }

  meta_result<void> booted;
  if (options.initialize_cluster) {
    booted = co_await n->init_cluster();
  } else if (!options.join_endpoints.empty()) {
    booted = co_await n->join_cluster(options.join_endpoints);
  }
  if (!booted) {
    LOGGER_ERROR(logger, "boot node {} failed: {}", config.id, describe(booted.error()));
    co_await n->stop();
    co_return tl::make_unexpected(booted.error());
  }
  co_return n;
}

asio::awaitable<meta_result<meta_node_ptr>> meta_node::boot(asio::any_io_executor executor, meta_config config,
                                                            std::shared_ptr<local_router> router,
                                                            std::shared_ptr<logger_interface> logger) {
  open_options options;
  options.open = false;
  options.create = true;
  options.initialize_cluster = true;
  co_return co_await open_create_boot(executor, std::move(config), std::move(options), std::move(router),
                                      std::move(logger));
}

asio::awaitable<meta_result<void>> meta_node::init_cluster() {
  raft::membership m;
  m.voters.insert(config_.id);
  if (auto initialized = co_await raft_->initialize(m); !initialized) {
    co_return tl::make_unexpected(meta_error{initialized.error()});
  }
  auto leader = co_await raft_->wait(config_.startup_timeout).state(raft::server_state::leader, "boot");
  if (!leader) {
    co_return tl::make_unexpected(meta_error{leader.error()});
  }
  auto added = co_await add_node(config_.id, config_.get_node());
  if (!added) {
    co_return tl::make_unexpected(added.error());
  }
  LOGGER_INFO(logger_, "node {} booted as single node cluster", config_.id);
  co_return meta_result<void>{};
}

asio::awaitable<meta_result<void>> meta_node::join_cluster(std::vector<std::string> endpoints) {
  auto self_node = config_.get_node();
  metadpb::forward_request req;
  req.set_forward_to_leader(1);
  auto* join = req.mutable_join();
  join->set_node_id(config_.id);
  join->set_endpoint(self_node.endpoint);
  if (self_node.grpc_api_addr) {
    join->set_grpc_api_addr(*self_node.grpc_api_addr);
  }

  meta_error last_error = make_error_code(raft_error::CONFIG_INVALID);
  for (const auto& endpoint : endpoints) {
    if (endpoint == self_node.endpoint) {
      continue;
    }
    auto resp = co_await forward_to(endpoint, req);
    if (resp) {
      LOGGER_INFO(logger_, "node {} joined cluster via {}", config_.id, endpoint);
      co_return meta_result<void>{};
    }
    LOGGER_WARN(logger_, "join via {} failed: {}", endpoint, describe(resp.error()));
    last_error = resp.error();
  }
  co_return tl::make_unexpected(last_error);
}

asio::awaitable<std::size_t> meta_node::stop() {
  if (stopped_) {
    co_return 0;
  }
  stopped_ = true;
  router_->unregister_service(config_.raft_api_advertise_host_endpoint());
  auto joined = co_await raft_->shutdown();
  store_.reset();
  LOGGER_INFO(logger_, "node {} stopped", config_.id);
  co_return joined;
}

asio::awaitable<expected<metadpb::append_entries_response>> meta_node::append_entries(
    metadpb::append_entries_request req) {
  co_return co_await raft_->handle_append_entries(std::move(req));
}

asio::awaitable<expected<metadpb::vote_response>> meta_node::vote(metadpb::vote_request req) {
  co_return co_await raft_->handle_vote(std::move(req));
}

asio::awaitable<expected<metadpb::install_snapshot_response>> meta_node::install_snapshot(
    metadpb::install_snapshot_request req) {
  co_return co_await raft_->handle_install_snapshot(std::move(req));
}

asio::awaitable<expected<metadpb::forward_response>> meta_node::forward(metadpb::forward_request req) {
  auto result = co_await handle_forwardable_request(std::move(req));
  co_return encode_forward_result(result);
}

meta_result<meta_leader> meta_node::as_leader() {
  auto m = raft_->metrics();
  if (stopped_ || m.state != raft::server_state::leader || m.current_leader != config_.id) {
    return tl::make_unexpected(meta_error{forward_to_leader{m.current_leader}});
  }
  return meta_leader(shared_from_this());
}

asio::awaitable<meta_result<metadpb::forward_response>> meta_node::handle_forwardable_request(
    metadpb::forward_request req) {
  if (stopped_) {
    co_return tl::make_unexpected(meta_error{make_error_code(raft_error::STOPPED)});
  }
  if (auto leader = as_leader()) {
    co_return co_await leader->handle(std::move(req));
  }

  auto current = raft_->current_leader();
  if (req.forward_to_leader() == 0 || !current || *current == config_.id) {
    co_return tl::make_unexpected(meta_error{forward_to_leader{current}});
  }
  auto leader_node = get_node(*current);
  if (!leader_node) {
    LOGGER_DEBUG(logger_, "leader {} endpoint unknown", *current);
    co_return tl::make_unexpected(meta_error{forward_to_leader{current}});
  }

  req.set_forward_to_leader(req.forward_to_leader() - 1);
  LOGGER_DEBUG(logger_, "node {} forward request to leader {} at {}", config_.id, *current, leader_node->endpoint);
  co_return co_await forward_to(leader_node->endpoint, std::move(req));
}

asio::awaitable<meta_result<metadpb::forward_response>> meta_node::forward_to(const std::string& endpoint,
                                                                              metadpb::forward_request req) {
  auto resp = co_await router_->forward(endpoint, std::move(req), config_.forward_timeout);
  if (!resp) {
    co_return tl::make_unexpected(meta_error{resp.error()});
  }
  co_return decode_forward_response(std::move(*resp));
}

asio::awaitable<meta_result<applied_state>> meta_node::write(log_entry entry) {
  metadpb::forward_request req;
  req.set_forward_to_leader(1);
  *req.mutable_write() = pb::to_pb(entry);
  auto resp = co_await handle_forwardable_request(std::move(req));
  if (!resp) {
    co_return tl::make_unexpected(resp.error());
  }
  if (!resp->has_write()) {
    co_return tl::make_unexpected(meta_error{make_error_code(logic_error::MALFORMED_MESSAGE)});
  }
  auto applied = leaf_to_expected([&]() { return pb::from_pb(resp->write()); });
  if (!applied) {
    co_return tl::make_unexpected(meta_error{applied.error()});
  }
  co_return std::move(*applied);
}

asio::awaitable<meta_result<applied_state>> meta_node::add_node(node_id id, node n) {
  co_return co_await write(log_entry{metad::add_node{id, std::move(n)}});
}

std::optional<node> meta_node::get_node(node_id id) const {
  if (!store_) {
    return std::nullopt;
  }
  return store_->get_node(id);
}

std::map<node_id, node> meta_node::get_nodes() const {
  if (!store_) {
    return {};
  }
  return store_->get_nodes();
}

std::optional<seqv> meta_node::get_kv(std::string_view key) const {
  if (!store_) {
    return std::nullopt;
  }
  return store_->get_kv(key);
}

std::vector<std::pair<std::string, seqv>> meta_node::prefix_list_kv(std::string_view prefix) const {
  if (!store_) {
    return {};
  }
  return store_->prefix_list_kv(prefix);
}

}  // namespace metad::service
