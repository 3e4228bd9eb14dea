#pragma once
#ifndef _METAD_ROCKSDB_ERR_H_
#define _METAD_ROCKSDB_ERR_H_
#include <rocksdb/status.h>

#include <string>
#include <system_error>

#include "error/base_error_category.h"
namespace metad {

// meta_store 只区分这几类 rocksdb 失败，其余归为 other
enum class rocksdb_err {
  io_error = 1,
  corruption,
  busy,
  invalid_argument,
  not_supported,
  other,
};

class rocksdb_err_category : public base_error_category {
 public:
  const char* name() const noexcept override { return "rocksdb"; }

  std::string message(int ev) const override {
    switch (static_cast<rocksdb_err>(ev)) {
      case rocksdb_err::io_error:
        return "rocksdb I/O error";
      case rocksdb_err::corruption:
        return "rocksdb data corruption";
      case rocksdb_err::busy:
        return "rocksdb busy, try again";
      case rocksdb_err::invalid_argument:
        return "rocksdb invalid argument";
      case rocksdb_err::not_supported:
        return "rocksdb operation not supported";
      default:
        return "rocksdb error";
    }
  }
};

inline const std::error_category& get_rocksdb_err_category() {
  static rocksdb_err_category instance;
  return instance;
}

inline std::error_code make_error_code(rocksdb_err e) { return {static_cast<int>(e), get_rocksdb_err_category()}; }

// 只对失败的 status 调用
inline std::error_code make_error_code(const rocksdb::Status& s) noexcept {
  if (s.IsIOError()) {
    return make_error_code(rocksdb_err::io_error);
  }
  if (s.IsCorruption()) {
    return make_error_code(rocksdb_err::corruption);
  }
  if (s.IsBusy() || s.IsTryAgain() || s.IsTimedOut()) {
    return make_error_code(rocksdb_err::busy);
  }
  if (s.IsInvalidArgument()) {
    return make_error_code(rocksdb_err::invalid_argument);
  }
  if (s.IsNotSupported()) {
    return make_error_code(rocksdb_err::not_supported);
  }
  return make_error_code(rocksdb_err::other);
}

}  // namespace metad

namespace std {
template <>
struct is_error_code_enum<metad::rocksdb_err> : true_type {};
}  // namespace std

#endif  // _METAD_ROCKSDB_ERR_H_
