#pragma once
#ifndef _METAD_LEAF_EXPECTED_H_
#define _METAD_LEAF_EXPECTED_H_
#include <system_error>
#include <tl/expected.hpp>
#include <type_traits>

#include "error/error.h"
#include "error/leaf.h"
#include "error/raft_error.h"

namespace metad {

// 把同步 leaf::result 接口转换成协程侧使用的 expected
template <typename F, typename T = std::decay_t<decltype(*std::declval<F>()())>>
tl::expected<T, std::error_code> leaf_to_expected(F&& f) {
  std::error_code ec;

  auto r = boost::leaf::try_handle_some([&]() -> boost::leaf::result<T> { return std::forward<F>(f)(); },
                                        [&](const metad_error& e) -> boost::leaf::result<T> {
                                          ec = e.err_code;
                                          return new_error(e);
                                        });

  if (!r) {
    if (!ec) {
      ec = make_error_code(raft_error::UNKNOWN_ERROR);
    }
    return tl::unexpected{ec};
  }

  return std::move(*r);
}

template <typename F>
tl::expected<void, std::error_code> leaf_to_expected_void(F&& f) {
  std::error_code ec;

  auto r = boost::leaf::try_handle_some([&]() -> boost::leaf::result<void> { return std::forward<F>(f)(); },
                                        [&](const metad_error& e) -> boost::leaf::result<void> {
                                          ec = e.err_code;
                                          return new_error(e);
                                        });

  if (!r) {
    if (!ec) {
      ec = make_error_code(raft_error::UNKNOWN_ERROR);
    }
    return tl::unexpected{ec};
  }

  return {};
}

}  // namespace metad

#endif  // _METAD_LEAF_EXPECTED_H_
