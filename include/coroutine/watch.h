#pragma once
#ifndef _METAD_WATCH_H_
#define _METAD_WATCH_H_
#include <algorithm>
#include <asio.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "basic/defer.h"
#include "basic/utility_macros.h"
#include "coroutine/channel.h"
#include "error/expected.h"
#include "error/raft_error.h"

namespace metad::coro {

// 单写多读的最新值广播：send 覆盖当前值并唤醒全部等待者，close 之后 changed 返回 STOPPED
template <typename T>
class watch {
  NOT_COPYABLE_NOT_MOVABLE(watch)
 public:
  explicit watch(T initial) : value_(std::move(initial)) {}

  T borrow() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
  }

  // 值与版本号的一致视图
  std::pair<T, std::uint64_t> borrow_with_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {value_, version_};
  }

  std::uint64_t version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  void send(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    value_ = std::move(value);
    ++version_;
    for (auto& waiter : waiters_) {
      waiter->try_send(asio::error_code{});
    }
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for (auto& waiter : waiters_) {
      waiter->close();
    }
  }

  // 挂起直到版本号不再等于 seen
  asio::awaitable<expected<void>> changed(std::uint64_t seen) {
    auto executor = co_await asio::this_coro::executor;
    std::shared_ptr<concurrent_signal_channel> chan;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        co_return tl::unexpected(raft_error::STOPPED);
      }
      if (version_ != seen) {
        co_return ok();
      }
      chan = std::make_shared<concurrent_signal_channel>(executor, 1);
      waiters_.push_back(chan);
    }
    DEFER(remove_waiter(chan));
    auto [ec] = co_await chan->async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
      co_return tl::unexpected(raft_error::STOPPED);
    }
    co_return ok();
  }

 private:
  void remove_waiter(const std::shared_ptr<concurrent_signal_channel>& chan) {
    std::lock_guard<std::mutex> lock(mutex_);
    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), chan), waiters_.end());
  }

  mutable std::mutex mutex_;
  T value_;
  std::uint64_t version_ = 0;
  bool closed_ = false;
  std::vector<std::shared_ptr<concurrent_signal_channel>> waiters_;
};

}  // namespace metad::coro

#endif  // _METAD_WATCH_H_
