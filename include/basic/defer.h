#pragma once
#ifndef _METAD_DEFER_H_
#define _METAD_DEFER_H_
#include <utility>

#include "basic/utility_macros.h"
namespace metad {

template <typename F>
class defer_template {
  NOT_COPYABLE(defer_template)
  F func_;

 public:
  explicit defer_template(F&& func) : func_(std::forward<F>(func)) {}
  ~defer_template() { func_(); }
};

template <typename F>
defer_template<F> make_defer(F&& f) {
  return defer_template<F>(std::forward<F>(f));
}

}  // namespace metad

#define METAD_CONCAT_IMPL(a, b) a##b
#define METAD_CONCAT(a, b) METAD_CONCAT_IMPL(a, b)
#define DEFER(...) auto METAD_CONCAT(_defer_, __LINE__) = ::metad::make_defer([&]() { __VA_ARGS__; })

#endif  // _METAD_DEFER_H_
