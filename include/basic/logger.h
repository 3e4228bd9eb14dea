#pragma once
#ifndef _METAD_LOGGER_H_
#define _METAD_LOGGER_H_
#include <fmt/core.h>

#include <memory>
#include <source_location>
#include <string_view>
namespace metad {

enum class log_level {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  critical = 5,
  off = 6,
};

// 组件日志接口：每个 meta_node / raft_node 持有一个 shared_ptr，测试中可替换为带节点前缀的实现
class logger_interface {
 public:
  virtual ~logger_interface() = default;

  virtual bool should_log(log_level level) const = 0;

  virtual void log_impl(log_level level, std::string_view msg, std::source_location loc) = 0;

  template <typename... Args>
  void log(log_level level, std::source_location loc, fmt::format_string<Args...> fmt_str, Args&&... args) {
    log_impl(level, fmt::format(fmt_str, std::forward<Args>(args)...), loc);
  }

  void log(log_level level, std::source_location loc, std::string_view msg) { log_impl(level, msg, loc); }
};

template <typename T>
logger_interface& get_logger_ref(T& l) {
  return l;
}

template <typename T>
logger_interface& get_logger_ref(std::unique_ptr<T>& l) {
  return *l;
}

template <typename T>
logger_interface& get_logger_ref(std::shared_ptr<T>& l) {
  return *l;
}

template <typename T>
logger_interface& get_logger_ref(const std::shared_ptr<T>& l) {
  return *l;
}

#define LOGGER_CALL(logger_obj, level, ...)                                          \
  do {                                                                               \
    auto& _logger = ::metad::get_logger_ref(logger_obj);                             \
    if (_logger.should_log(::metad::log_level::level)) {                             \
      _logger.log(::metad::log_level::level, std::source_location::current(), __VA_ARGS__); \
    }                                                                                \
  } while (0)

#define LOGGER_TRACE(obj, ...) LOGGER_CALL(obj, trace, __VA_ARGS__)
#define LOGGER_DEBUG(obj, ...) LOGGER_CALL(obj, debug, __VA_ARGS__)
#define LOGGER_INFO(obj, ...) LOGGER_CALL(obj, info, __VA_ARGS__)
#define LOGGER_WARN(obj, ...) LOGGER_CALL(obj, warn, __VA_ARGS__)
#define LOGGER_ERROR(obj, ...) LOGGER_CALL(obj, error, __VA_ARGS__)
#define LOGGER_CRITICAL(obj, ...) LOGGER_CALL(obj, critical, __VA_ARGS__)

void set_default_logger(std::shared_ptr<logger_interface> l);

logger_interface& default_logger();

std::shared_ptr<logger_interface> default_logger_ptr();

#define LOG_TRACE(...) LOGGER_TRACE(::metad::default_logger(), __VA_ARGS__)
#define LOG_DEBUG(...) LOGGER_DEBUG(::metad::default_logger(), __VA_ARGS__)
#define LOG_INFO(...) LOGGER_INFO(::metad::default_logger(), __VA_ARGS__)
#define LOG_WARN(...) LOGGER_WARN(::metad::default_logger(), __VA_ARGS__)
#define LOG_ERROR(...) LOGGER_ERROR(::metad::default_logger(), __VA_ARGS__)
#define LOG_CRITICAL(...) LOGGER_CRITICAL(::metad::default_logger(), __VA_ARGS__)

}  // namespace metad

#endif  // _METAD_LOGGER_H_
