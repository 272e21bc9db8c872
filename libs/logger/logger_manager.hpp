/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_LOGGER_LOGGER_MANAGER_HPP
#define COURIER_LOGGER_LOGGER_MANAGER_HPP

#include "logger/logger_manager_fwd.hpp"

#include <map>
#include <mutex>
#include <string>

#include <boost/optional.hpp>
#include "logger/logger_fwd.hpp"
#include "logger/logger_spdlog.hpp"

namespace logger {

  /**
   * A node of the logger configuration tree. Each node owns its logger
   * config, produces loggers tagged with its full path and creates children
   * which inherit the unset parts of the config.
   */
  class LoggerManagerTree {
   public:
    /// Create the root node.
    explicit LoggerManagerTree(ConstLoggerConfigPtr config);

    explicit LoggerManagerTree(LoggerConfig config);

    /// Get the logger of this node.
    LoggerPtr getLogger();

    /**
     * Get a child node. If it is not registered, a new one inheriting this
     * node config is created.
     * @param tag - the child tag
     */
    LoggerManagerTreePtr getChild(const std::string &tag);

    /**
     * Register a child node with overriden settings.
     * @param tag - the child tag
     * @param log_level - the level, or none to inherit it
     * @param patterns - the patterns, unset levels are inherited
     * @return the registered child
     */
    LoggerManagerTreePtr registerChild(
        std::string tag,
        boost::optional<LogLevel> log_level,
        boost::optional<LogPatterns> patterns);

   private:
    LoggerManagerTree(std::string full_tag,
                      std::string node_tag,
                      ConstLoggerConfigPtr config);

    LoggerManagerTreePtr makeChild(std::string tag,
                                   boost::optional<LogLevel> log_level,
                                   boost::optional<LogPatterns> patterns);

    const std::string node_tag_;
    const std::string full_tag_;
    const ConstLoggerConfigPtr config_;
    LoggerPtr logger_;
    std::map<std::string, LoggerManagerTreePtr> children_;
    std::mutex mutex_;
  };

}  // namespace logger

#endif  // COURIER_LOGGER_LOGGER_MANAGER_HPP
