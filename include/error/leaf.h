#pragma once
#ifndef _METAD_LEAF_H_
#define _METAD_LEAF_H_

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wimplicit-fallthrough"
#endif

#include <leaf.hpp>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

// clang-format off
#if defined(__GNUC__) || defined(__clang__)
#  define METAD_LEAF_CHECK(expr)                           \
     do {                                                  \
         _Pragma("GCC diagnostic push")                    \
         _Pragma("GCC diagnostic ignored \"-Wpedantic\"")  \
         BOOST_LEAF_CHECK(expr);                           \
         _Pragma("GCC diagnostic pop")                     \
     } while (0)
#else
#  define METAD_LEAF_CHECK(expr) BOOST_LEAF_CHECK(expr)
#endif
// clang-format on

namespace metad {
namespace leaf {
using namespace boost::leaf;
template <typename T>
using result = boost::leaf::result<T>;
}  // namespace leaf
}  // namespace metad

#endif  // _METAD_LEAF_H_
