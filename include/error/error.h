#pragma once
#ifndef _METAD_ERROR_H_
#define _METAD_ERROR_H_
#include <source_location>
#include <string>
#include <system_error>
#include <tl/expected.hpp>

#include "error/leaf.h"  // IWYU pragma: keep

namespace metad {

template <typename T>
concept can_make_error_code = requires(T t) {
  { make_error_code(t) } -> std::same_as<std::error_code>;
};

template <typename T>
concept metad_err_types = can_make_error_code<T> || std::is_error_code_enum_v<T>;

template <typename T>
concept err_types = metad_err_types<T> || std::is_same_v<T, std::error_code>;

// leaf 错误对象：所有同步接口通过 new_error 抛出，由 try_handle_some 按此类型捕获
struct metad_error {
  std::error_code err_code;
  std::string message;
  std::source_location location;

  metad_error(std::error_code code, std::source_location location) : err_code(code), location(location) {}

  metad_error(std::error_code code, std::string msg, std::source_location location)
      : err_code(code), message(std::move(msg)), location(location) {}

  template <metad_err_types err_type>
  metad_error(err_type code, std::source_location location) : err_code(make_error_code(code)), location(location) {}

  template <metad_err_types err_type>
  metad_error(err_type code, std::string msg, std::source_location location)
      : err_code(make_error_code(code)), message(std::move(msg)), location(location) {}
};

template <err_types err_type>
bool operator==(const metad_error& error, const err_type& code) {
  return error.err_code == code;
}

template <err_types error_code_type, typename error_msg_type>
auto new_error(error_code_type code, error_msg_type&& msg,
               std::source_location location = std::source_location::current()) {
  return boost::leaf::new_error(
      metad_error{code, std::string(std::forward<error_msg_type>(msg)), std::move(location)});
}

template <err_types error_code_type>
auto new_error(error_code_type code, std::source_location location = std::source_location::current()) {
  return boost::leaf::new_error(metad_error{code, std::move(location)});
}

inline auto new_error(const metad_error& err) { return boost::leaf::new_error(err); }

template <metad_err_types error_code_type>
inline auto unexpected(error_code_type error_code) {
  return tl::unexpected(make_error_code(error_code));
}

inline auto unexpected(std::error_code error_code) { return tl::unexpected(error_code); }

}  // namespace metad

#endif  // _METAD_ERROR_H_
