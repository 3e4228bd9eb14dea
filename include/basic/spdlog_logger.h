#pragma once
#ifndef _METAD_SPDLOG_LOGGER_H_
#define _METAD_SPDLOG_LOGGER_H_
#include <spdlog/spdlog.h>

#include <string>

#include "basic/logger.h"
namespace metad {

// 默认实现，转发到 spdlog 的 default logger。prefix 非空时追加在每行前面，例如 "[node-1]"
class spdlog_logger : public logger_interface {
 public:
  spdlog_logger() = default;
  explicit spdlog_logger(std::string prefix) : prefix_(std::move(prefix)) {}

  bool should_log(log_level level) const override {
    return spdlog::default_logger()->should_log(static_cast<spdlog::level::level_enum>(level));
  }

  void log_impl(log_level level, std::string_view msg, std::source_location loc) override {
    auto lvl = static_cast<spdlog::level::level_enum>(level);
    if (prefix_.empty()) {
      spdlog::log(lvl, "[{}:{}] {}", loc.file_name(), loc.line(), msg);
    } else {
      spdlog::log(lvl, "[{}:{}] {} {}", loc.file_name(), loc.line(), prefix_, msg);
    }
  }

 private:
  std::string prefix_;
};

}  // namespace metad

#endif  // _METAD_SPDLOG_LOGGER_H_
