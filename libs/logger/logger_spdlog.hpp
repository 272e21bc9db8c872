/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_LOGGER_LOGGER_SPDLOG_HPP
#define COURIER_LOGGER_LOGGER_SPDLOG_HPP

#include "logger/logger.hpp"

#include <map>
#include <memory>
#include <string>

namespace spdlog {
  class logger;
}

namespace logger {

  /// Patterns for logging depending on the log level.
  class LogPatterns {
   public:
    /// Set a logging pattern for the given level.
    void setPattern(LogLevel level, std::string pattern);

    /**
     * Get the logging pattern for the given level. If not set, get the
     * next present more verbose level pattern, if any, or the default
     * pattern.
     */
    std::string getPattern(LogLevel level) const;

    /// Fill the patterns absent here with the ones from base.
    void inherit(const LogPatterns &base);

   private:
    std::map<LogLevel, std::string> patterns_;
  };

  struct LoggerConfig {
    LogLevel log_level;
    LogPatterns patterns;
  };
  using ConstLoggerConfigPtr = std::shared_ptr<const LoggerConfig>;

  /// Patterns used when nothing else is configured.
  LogPatterns getDefaultLogPatterns();

  class LoggerSpdlog : public Logger {
   public:
    /**
     * @param tag - the tagname used in log records, usually the full path of
     * the logger in the manager tree
     * @param config - logging level and patterns
     */
    LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config);

   private:
    void logInternal(Level level, const std::string &s) const override;

    bool shouldLog(Level level) const override;

    const std::string tag_;
    const ConstLoggerConfigPtr config_;
    const std::shared_ptr<spdlog::logger> logger_;
  };

}  // namespace logger

#endif  // COURIER_LOGGER_LOGGER_SPDLOG_HPP
