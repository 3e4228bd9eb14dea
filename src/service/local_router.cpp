#include "service/local_router.h"

#include "basic/logger.h"
#include "coroutine/channel.h"
#include "error/error.h"
#include "error/network_error.h"

namespace metad::service {

void local_router::register_service(const std::string& endpoint, std::weak_ptr<raft_service> service) {
  std::lock_guard<std::mutex> lock(mutex_);
  services_[endpoint] = std::move(service);
  LOG_DEBUG("router register {}", endpoint);
}

void local_router::unregister_service(const std::string& endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  services_.erase(endpoint);
  LOG_DEBUG("router unregister {}", endpoint);
}

void local_router::isolate(const std::string& endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  isolated_.insert(endpoint);
}

void local_router::restore(const std::string& endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  isolated_.erase(endpoint);
}

bool local_router::is_registered(const std::string& endpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return services_.contains(endpoint);
}

std::shared_ptr<raft_service> local_router::lookup(const std::string& endpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (isolated_.contains(endpoint)) {
    return nullptr;
  }
  auto iter = services_.find(endpoint);
  if (iter == services_.end()) {
    return nullptr;
  }
  return iter->second.lock();
}

asio::awaitable<expected<metadpb::append_entries_response>> local_router::append_entries(
    const std::string& endpoint, metadpb::append_entries_request req, std::chrono::milliseconds timeout) {
  auto service = lookup(endpoint);
  if (!service) {
    co_return unexpected(network_error::UNREACHABLE);
  }
  co_return co_await coro::with_timeout(service->append_entries(std::move(req)), timeout, network_error::TIMEOUT);
}

asio::awaitable<expected<metadpb::vote_response>> local_router::vote(const std::string& endpoint,
                                                                     metadpb::vote_request req,
                                                                     std::chrono::milliseconds timeout) {
  auto service = lookup(endpoint);
  if (!service) {
    co_return unexpected(network_error::UNREACHABLE);
  }
  co_return co_await coro::with_timeout(service->vote(std::move(req)), timeout, network_error::TIMEOUT);
}

asio::awaitable<expected<metadpb::install_snapshot_response>> local_router::install_snapshot(
    const std::string& endpoint, metadpb::install_snapshot_request req, std::chrono::milliseconds timeout) {
  auto service = lookup(endpoint);
  if (!service) {
    co_return unexpected(network_error::UNREACHABLE);
  }
  co_return co_await coro::with_timeout(service->install_snapshot(std::move(req)), timeout,
                                        network_error::TIMEOUT);
}

asio::awaitable<expected<metadpb::forward_response>> local_router::forward(const std::string& endpoint,
                                                                           metadpb::forward_request req,
                                                                           std::chrono::milliseconds timeout) {
  auto service = lookup(endpoint);
  if (!service) {
    co_return unexpected(network_error::UNREACHABLE);
  }
  co_return co_await coro::with_timeout(service->forward(std::move(req)), timeout, network_error::TIMEOUT);
}

}  // namespace metad::service
