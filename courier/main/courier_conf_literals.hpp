/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_CONF_LITERALS_HPP
#define COURIER_CONF_LITERALS_HPP

#include <string>
#include <unordered_map>

#include "logger/logger.hpp"

namespace config_members {
  extern const char *LocalNetwork;
  extern const char *Configurators;
  extern const char *Operators;
  extern const char *MaxBatchGasLimit;
  extern const char *MessageGas;
  extern const char *DefaultGas;
  extern const char *GasByTag;
  extern const char *Adapters;
  extern const char *Name;
  extern const char *BaseFee;
  extern const char *GasPrice;
  extern const char *Routes;
  extern const char *Remote;
  extern const char *Tenant;
  extern const char *Threshold;
  extern const char *Primary;
  extern const char *RecoveryIndex;
  extern const char *Subsidies;
  extern const char *Amount;
  extern const char *Refund;
  extern const char *LogSection;
  extern const char *LogLevel;
  extern const char *LogPatternsSection;
  extern const char *LogChildrenSection;
  extern const std::unordered_map<std::string, logger::LogLevel> LogLevels;
}  // namespace config_members

#endif  // COURIER_CONF_LITERALS_HPP
