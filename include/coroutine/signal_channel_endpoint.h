#pragma once
#ifndef _METAD_SIGNAL_CHANNEL_ENDPOINT_H_
#define _METAD_SIGNAL_CHANNEL_ENDPOINT_H_
#include <asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <chrono>

#include "coroutine/channel.h"
#include "error/expected.h"
#include "error/raft_error.h"

namespace metad::coro {

// 单 strand 内的唤醒信号。缓冲为 1，多次 try_send 合并为一次唤醒
class signal_channel_endpoint {
 public:
  explicit signal_channel_endpoint(asio::any_io_executor executor) : chan_(executor, 1) {}

  bool try_send() {
    if (stopped_) {
      return false;
    }
    return chan_.try_send(asio::error_code{});
  }

  asio::awaitable<expected<void>> async_receive() {
    if (stopped_) {
      co_return tl::unexpected(raft_error::STOPPED);
    }
    auto [ec] = co_await chan_.async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec || stopped_) {
      co_return tl::unexpected(raft_error::STOPPED);
    }
    co_return ok();
  }

  // 等待信号或超时；收到信号返回 true，超时返回 false
  asio::awaitable<expected<bool>> async_receive_for(std::chrono::steady_clock::duration timeout) {
    using namespace asio::experimental::awaitable_operators;
    if (stopped_) {
      co_return tl::unexpected(raft_error::STOPPED);
    }
    asio::steady_timer timer(co_await asio::this_coro::executor, timeout);
    auto result = co_await (chan_.async_receive(asio::as_tuple(asio::use_awaitable)) ||
                            timer.async_wait(asio::as_tuple(asio::use_awaitable)));
    if (stopped_) {
      co_return tl::unexpected(raft_error::STOPPED);
    }
    if (result.index() == 0) {
      auto [ec] = std::get<0>(result);
      if (ec) {
        co_return tl::unexpected(raft_error::STOPPED);
      }
      co_return true;
    }
    co_return false;
  }

  void close() {
    stopped_ = true;
    chan_.close();
  }

  bool is_open() const { return !stopped_; }

 private:
  signal_channel chan_;
  bool stopped_ = false;
};

}  // namespace metad::coro

#endif  // _METAD_SIGNAL_CHANNEL_ENDPOINT_H_
