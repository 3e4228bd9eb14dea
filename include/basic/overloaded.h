#pragma once
#ifndef _METAD_OVERLOADED_H_
#define _METAD_OVERLOADED_H_

namespace metad {

// std::visit 的多 lambda 组合
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace metad

#endif  // _METAD_OVERLOADED_H_
