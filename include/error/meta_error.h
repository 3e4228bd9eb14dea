#pragma once
#ifndef _METAD_META_ERROR_H_
#define _METAD_META_ERROR_H_
#include <optional>
#include <string>
#include <system_error>
#include <tl/expected.hpp>
#include <variant>

#include "types/meta_types.h"

namespace metad {

// 当前节点不是 leader：调用方应改向 leader_id 重试，leader 未知时稍后重试
struct forward_to_leader {
  std::optional<node_id> leader_id;

  bool operator==(const forward_to_leader&) const = default;
};

using meta_error = std::variant<forward_to_leader, std::error_code>;

template <typename T>
using meta_result = tl::expected<T, meta_error>;

std::string describe(const meta_error& err);

// 网络错误、超时和被丢弃的提案可以重试；带 txid 的写入重试是幂等的
bool is_retryable(const meta_error& err);

inline bool is_forward_to_leader(const meta_error& err) { return std::holds_alternative<forward_to_leader>(err); }

}  // namespace metad

#endif  // _METAD_META_ERROR_H_
