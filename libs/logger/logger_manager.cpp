/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_manager.hpp"

namespace {
  std::string joinTags(const std::string &parent, const std::string &child) {
    return parent + "/" + child;
  }
}  // namespace

namespace logger {

  LoggerManagerTree::LoggerManagerTree(ConstLoggerConfigPtr config)
      : node_tag_{}, full_tag_{}, config_(std::move(config)) {}

  LoggerManagerTree::LoggerManagerTree(LoggerConfig config)
      : LoggerManagerTree(
            std::make_shared<const LoggerConfig>(std::move(config))) {}

  LoggerManagerTree::LoggerManagerTree(std::string full_tag,
                                       std::string node_tag,
                                       ConstLoggerConfigPtr config)
      : node_tag_(std::move(node_tag)),
        full_tag_(std::move(full_tag)),
        config_(std::move(config)) {}

  LoggerPtr LoggerManagerTree::getLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (not logger_) {
      logger_ = std::make_shared<LoggerSpdlog>(
          full_tag_.empty() ? std::string{"courier"} : full_tag_, config_);
    }
    return logger_;
  }

  LoggerManagerTreePtr LoggerManagerTree::getChild(const std::string &tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_.find(tag);
    if (it != children_.end()) {
      return it->second;
    }
    return makeChild(tag, boost::none, boost::none);
  }

  LoggerManagerTreePtr LoggerManagerTree::registerChild(
      std::string tag,
      boost::optional<LogLevel> log_level,
      boost::optional<LogPatterns> patterns) {
    std::lock_guard<std::mutex> lock(mutex_);
    return makeChild(
        std::move(tag), std::move(log_level), std::move(patterns));
  }

  LoggerManagerTreePtr LoggerManagerTree::makeChild(
      std::string tag,
      boost::optional<LogLevel> log_level,
      boost::optional<LogPatterns> patterns) {
    LoggerConfig child_config{log_level.value_or(config_->log_level),
                              patterns.value_or(LogPatterns{})};
    child_config.patterns.inherit(config_->patterns);
    auto full_tag = full_tag_.empty() ? tag : joinTags(full_tag_, tag);
    // constructor is private, so make_shared is not available
    LoggerManagerTreePtr child(new LoggerManagerTree(
        std::move(full_tag),
        tag,
        std::make_shared<const LoggerConfig>(std::move(child_config))));
    children_[std::move(tag)] = child;
    return child;
  }

}  // namespace logger
