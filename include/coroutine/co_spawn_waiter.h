#pragma once
#ifndef _METAD_CO_SPAWN_WAITER_H_
#define _METAD_CO_SPAWN_WAITER_H_
#include <cstddef>
#include <functional>
#include <memory>

#include "coroutine/channel.h"

namespace metad::coro {

// 跟踪一组后台协程，wait_all 在全部退出后返回
class co_spawn_waiter : public std::enable_shared_from_this<co_spawn_waiter> {
 public:
  using task = std::function<asio::awaitable<void>()>;

  co_spawn_waiter(asio::any_io_executor executor, std::size_t capacity)
      : executor_(executor), exit_chan_(executor, capacity) {}

  void add(task func) {
    auto self = shared_from_this();
    ++count_;
    asio::co_spawn(
        executor_,
        [self, func = std::move(func)]() -> asio::awaitable<void> {
          co_await func();
          co_await self->exit_chan_.async_send(asio::error_code{}, asio::as_tuple(asio::use_awaitable));
        },
        asio::detached);
  }

  asio::awaitable<std::size_t> wait_all() {
    std::size_t joined = 0;
    for (; joined < count_; ++joined) {
      auto [ec] = co_await exit_chan_.async_receive(asio::as_tuple(asio::use_awaitable));
      if (ec) {
        break;
      }
    }
    count_ = 0;
    co_return joined;
  }

  std::size_t size() const { return count_; }

 private:
  asio::any_io_executor executor_;
  signal_channel exit_chan_;
  std::size_t count_{0};
};

inline std::shared_ptr<co_spawn_waiter> make_co_spawn_waiter(asio::any_io_executor exec, std::size_t capacity = 64) {
  return std::make_shared<co_spawn_waiter>(exec, capacity);
}

}  // namespace metad::coro

#endif  // _METAD_CO_SPAWN_WAITER_H_
