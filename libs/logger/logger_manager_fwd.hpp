/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_LOGGER_LOGGER_MANAGER_FWD_HPP
#define COURIER_LOGGER_LOGGER_MANAGER_FWD_HPP

#include <memory>

namespace logger {

  class LoggerManagerTree;

  using LoggerManagerTreePtr = std::shared_ptr<LoggerManagerTree>;

}  // namespace logger

#endif  // COURIER_LOGGER_LOGGER_MANAGER_FWD_HPP
