#pragma once
#ifndef _METAD_ENUM_NAME_H_
#define _METAD_ENUM_NAME_H_
#include <string_view>

#include "magic_enum.hpp"
namespace metad {

template <typename T>
inline std::string_view enum_name(T value) {
  return magic_enum::enum_name(value);
}

}  // namespace metad

#endif  // _METAD_ENUM_NAME_H_
