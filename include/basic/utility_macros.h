#pragma once
#ifndef _METAD_UTILITY_MACROS_H_
#define _METAD_UTILITY_MACROS_H_

#define NOT_COPYABLE(Type)     \
  Type(const Type &) = delete; \
  Type &operator=(const Type &) = delete;

#define MOVABLE_BUT_NOT_COPYABLE(Type) \
  Type(Type &&) = default;             \
  Type &operator=(Type &&) = default;  \
  Type(const Type &) = delete;         \
  Type &operator=(const Type &) = delete;

#define NOT_COPYABLE_NOT_MOVABLE(Type)    \
  Type(const Type &) = delete;            \
  Type &operator=(const Type &) = delete; \
  Type(Type &&) = delete;                 \
  Type &operator=(Type &&) = delete;

#ifndef METAD_UNUSED
#define METAD_UNUSED(x) (void)(x)
#endif

#endif  // _METAD_UTILITY_MACROS_H_
