#ifndef QSTORE_BASE_LOGGER_HPP
#define QSTORE_BASE_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace qstore::base {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object, shared between all callers using the same tag
   */
  Logger createLogger(const std::string &tag);

  /**
   * Apply a level to every registered logger and to loggers created later
   * @param level spdlog level
   */
  void setLogLevel(spdlog::level::level_enum level);
}  // namespace qstore::base

#endif  // QSTORE_BASE_LOGGER_HPP
