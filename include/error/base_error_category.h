#pragma once
#ifndef _METAD_BASE_ERROR_CATEGORY_H_
#define _METAD_BASE_ERROR_CATEGORY_H_
#include <string>
#include <system_error>
namespace metad {

class base_error_category : public std::error_category {
 public:
  const char* name() const noexcept override = 0;
  std::string message(int ev) const override = 0;
};

}  // namespace metad

#endif  // _METAD_BASE_ERROR_CATEGORY_H_
