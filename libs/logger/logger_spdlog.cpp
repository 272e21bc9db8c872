/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_spdlog.hpp"

#include <iterator>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

  const std::string kDefaultPattern =
      R"([%Y-%m-%d %H:%M:%S.%F][th:%t][%=8l][%n]: %v)";

  spdlog::level::level_enum getSpdlogLogLevel(logger::LogLevel level) {
    switch (level) {
      case logger::LogLevel::kTrace:
        return spdlog::level::trace;
      case logger::LogLevel::kDebug:
        return spdlog::level::debug;
      case logger::LogLevel::kInfo:
        return spdlog::level::info;
      case logger::LogLevel::kWarn:
        return spdlog::level::warn;
      case logger::LogLevel::kError:
        return spdlog::level::err;
      case logger::LogLevel::kCritical:
        return spdlog::level::critical;
    }
    return spdlog::level::info;
  }

  /// spdlog keeps a global registry of named loggers.
  std::shared_ptr<spdlog::logger> getOrCreateLogger(const std::string &tag) {
    static std::mutex registry_mutex;
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto logger = spdlog::get(tag);
    if (not logger) {
      logger = spdlog::stdout_color_mt(tag);
    }
    return logger;
  }

}  // namespace

namespace logger {

  void LogPatterns::setPattern(LogLevel level, std::string pattern) {
    patterns_[level] = std::move(pattern);
  }

  std::string LogPatterns::getPattern(LogLevel level) const {
    // exact match or the closest more verbose level
    auto it = patterns_.upper_bound(level);
    if (it != patterns_.begin()) {
      return std::prev(it)->second;
    }
    return kDefaultPattern;
  }

  void LogPatterns::inherit(const LogPatterns &base) {
    for (const auto &pattern : base.patterns_) {
      patterns_.emplace(pattern.first, pattern.second);
    }
  }

  LogPatterns getDefaultLogPatterns() {
    LogPatterns patterns;
    patterns.setPattern(LogLevel::kTrace, kDefaultPattern);
    return patterns;
  }

  LoggerSpdlog::LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config)
      : tag_(std::move(tag)),
        config_(std::move(config)),
        logger_(getOrCreateLogger(tag_)) {
    logger_->set_level(getSpdlogLogLevel(config_->log_level));
    logger_->set_pattern(config_->patterns.getPattern(config_->log_level));
  }

  void LoggerSpdlog::logInternal(Level level, const std::string &s) const {
    logger_->log(getSpdlogLogLevel(level), s);
  }

  bool LoggerSpdlog::shouldLog(Level level) const {
    return config_->log_level <= level;
  }

}  // namespace logger
