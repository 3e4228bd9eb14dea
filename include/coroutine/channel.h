#pragma once
#ifndef _METAD_CHANNEL_H_
#define _METAD_CHANNEL_H_
#include <asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <chrono>
#include <variant>

#include "error/expected.h"
#include "error/raft_error.h"

namespace metad::coro {

template <typename T>
using channel = asio::experimental::channel<void(asio::error_code, T)>;

using signal_channel = asio::experimental::channel<void(asio::error_code)>;

// 跨 strand 使用的通道：发送方和接收方可以运行在不同线程
template <typename T>
using concurrent_channel = asio::experimental::concurrent_channel<void(asio::error_code, T)>;

using concurrent_signal_channel = asio::experimental::concurrent_channel<void(asio::error_code)>;

// 为协程操作加上超时；超时返回 timeout_error，被取消的一侧由 awaitable operators 负责回收
template <typename T, typename E>
asio::awaitable<expected<T>> with_timeout(asio::awaitable<expected<T>> op, std::chrono::steady_clock::duration timeout,
                                          E timeout_error) {
  using namespace asio::experimental::awaitable_operators;
  asio::steady_timer timer(co_await asio::this_coro::executor, timeout);
  auto result = co_await (std::move(op) || timer.async_wait(asio::as_tuple(asio::use_awaitable)));
  if (result.index() == 0) {
    co_return std::move(std::get<0>(result));
  }
  co_return tl::unexpected(make_error_code(timeout_error));
}

template <typename T>
asio::awaitable<expected<T>> with_timeout(asio::awaitable<expected<T>> op,
                                          std::chrono::steady_clock::duration timeout) {
  co_return co_await with_timeout(std::move(op), timeout, raft_error::TIMEOUT);
}

}  // namespace metad::coro

#endif  // _METAD_CHANNEL_H_
