#pragma once
#ifndef _METAD_EXPECTED_H_
#define _METAD_EXPECTED_H_
#include <system_error>
#include <tl/expected.hpp>

namespace metad {
template <typename T>
using expected = tl::expected<T, std::error_code>;

inline expected<void> ok() { return expected<void>{}; }

}  // namespace metad

// 协程内传播错误：expected 失败时直接 co_return
#define CO_CHECK_EXPECTED(result)                 \
  do {                                            \
    if (!(result)) {                              \
      co_return tl::unexpected((result).error()); \
    }                                             \
  } while (0)

#endif  // _METAD_EXPECTED_H_
