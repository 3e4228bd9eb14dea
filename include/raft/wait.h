#pragma once
#ifndef _METAD_RAFT_WAIT_H_
#define _METAD_RAFT_WAIT_H_
#include <asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>

#include "coroutine/watch.h"
#include "error/expected.h"
#include "raft/types.h"

namespace metad::raft {

using metrics_watch = coro::watch<raft_metrics>;

// 订阅 metrics 流，直到谓词成立或超时
class wait {
 public:
  wait(std::shared_ptr<metrics_watch> watch, std::chrono::milliseconds timeout)
      : watch_(std::move(watch)), timeout_(timeout) {}

  asio::awaitable<expected<raft_metrics>> metrics(std::function<bool(const raft_metrics&)> pred, std::string msg);

  // 日志已写入且已应用到 index
  asio::awaitable<expected<raft_metrics>> log(std::uint64_t index, std::string msg = {});

  asio::awaitable<expected<raft_metrics>> state(server_state want, std::string msg = {});

  asio::awaitable<expected<raft_metrics>> current_leader(node_id leader, std::string msg = {});

  asio::awaitable<expected<raft_metrics>> members(std::set<node_id> voters, std::string msg = {});

  asio::awaitable<expected<raft_metrics>> learners(std::set<node_id> learners, std::string msg = {});

  asio::awaitable<expected<raft_metrics>> snapshot(log_id want, std::string msg = {});

 private:
  std::shared_ptr<metrics_watch> watch_;
  std::chrono::milliseconds timeout_;
};

}  // namespace metad::raft

#endif  // _METAD_RAFT_WAIT_H_
