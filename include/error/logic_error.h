#pragma once
#ifndef _METAD_LOGIC_ERROR_H_
#define _METAD_LOGIC_ERROR_H_
#include <string>
#include <system_error>

#include "error/base_error_category.h"
namespace metad {

enum class logic_error {
  NULL_POINTER = 1,
  KEY_NOT_FOUND,
  INVALID_PARAM,
  // protobuf 消息缺少必需字段或 oneof 未设置
  MALFORMED_MESSAGE,
};

class logic_error_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "logic_error"; }

  std::string message(int ev) const override {
    switch (static_cast<logic_error>(ev)) {
      case logic_error::NULL_POINTER:
        return "Null pointer error";
      case logic_error::KEY_NOT_FOUND:
        return "Key not found error";
      case logic_error::INVALID_PARAM:
        return "Invalid param error";
      case logic_error::MALFORMED_MESSAGE:
        return "Malformed message error";
      default:
        return "Unrecognized logic error";
    }
  }
};

inline const logic_error_category& get_logic_error_category() {
  static logic_error_category instance;
  return instance;
}

inline std::error_code make_error_code(logic_error e) { return {static_cast<int>(e), get_logic_error_category()}; }
}  // namespace metad

namespace std {

template <>
struct is_error_code_enum<metad::logic_error> : true_type {};
}  // namespace std

#endif  // _METAD_LOGIC_ERROR_H_
