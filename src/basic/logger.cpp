#include "basic/logger.h"

#include <mutex>

#include "basic/spdlog_logger.h"

namespace metad {

static std::mutex& logger_mutex() {
  static std::mutex mtx;
  return mtx;
}

static std::shared_ptr<logger_interface>& global_logger_ptr() {
  static std::shared_ptr<logger_interface> instance;
  return instance;
}

void set_default_logger(std::shared_ptr<logger_interface> l) {
  std::lock_guard<std::mutex> lock(logger_mutex());
  global_logger_ptr() = std::move(l);
}

std::shared_ptr<logger_interface> default_logger_ptr() {
  std::lock_guard<std::mutex> lock(logger_mutex());
  auto& ptr = global_logger_ptr();
  if (!ptr) {
    ptr = std::make_shared<spdlog_logger>();
  }
  return ptr;
}

logger_interface& default_logger() { return *default_logger_ptr(); }

}  // namespace metad
