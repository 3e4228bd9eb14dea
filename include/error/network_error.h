#pragma once
#ifndef _METAD_NETWORK_ERROR_H_
#define _METAD_NETWORK_ERROR_H_
#include <string>
#include <system_error>

#include "error/base_error_category.h"
namespace metad {

// 全部属于可重试错误
enum class network_error {
  // 目标 endpoint 未注册或已被隔离
  UNREACHABLE = 1,
  // 请求在超时内没有返回
  TIMEOUT,
  // 目标节点 id 在节点表中找不到 endpoint
  NODE_NOT_FOUND,
};

class network_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "network_error"; }

  std::string message(int ev) const override {
    switch (static_cast<network_error>(ev)) {
      case network_error::UNREACHABLE:
        return "network: endpoint unreachable";
      case network_error::TIMEOUT:
        return "network: request timeout";
      case network_error::NODE_NOT_FOUND:
        return "network: node endpoint not found";
      default:
        return "Unrecognized network error";
    }
  }
};

inline const network_error_category& get_network_error_category() {
  static network_error_category instance;
  return instance;
}

inline std::error_code make_error_code(network_error e) {
  return {static_cast<int>(e), get_network_error_category()};
}

}  // namespace metad

namespace std {

template <>
struct is_error_code_enum<metad::network_error> : true_type {};
}  // namespace std

#endif  // _METAD_NETWORK_ERROR_H_
