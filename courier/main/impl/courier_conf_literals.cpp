/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/courier_conf_literals.hpp"

namespace config_members {
  const char *LocalNetwork = "local_network";
  const char *Configurators = "configurators";
  const char *Operators = "operators";
  const char *MaxBatchGasLimit = "max_batch_gas_limit";
  const char *MessageGas = "message_gas";
  const char *DefaultGas = "default";
  const char *GasByTag = "tags";
  const char *Adapters = "adapters";
  const char *Name = "name";
  const char *BaseFee = "base_fee";
  const char *GasPrice = "gas_price";
  const char *Routes = "routes";
  const char *Remote = "remote";
  const char *Tenant = "tenant";
  const char *Threshold = "threshold";
  const char *Primary = "primary";
  const char *RecoveryIndex = "recovery_index";
  const char *Subsidies = "subsidies";
  const char *Amount = "amount";
  const char *Refund = "refund";
  const char *LogSection = "log";
  const char *LogLevel = "level";
  const char *LogPatternsSection = "patterns";
  const char *LogChildrenSection = "children";
  const std::unordered_map<std::string, logger::LogLevel> LogLevels{
      {"trace", logger::LogLevel::kTrace},
      {"debug", logger::LogLevel::kDebug},
      {"info", logger::LogLevel::kInfo},
      {"warning", logger::LogLevel::kWarn},
      {"error", logger::LogLevel::kError},
      {"critical", logger::LogLevel::kCritical}};
}  // namespace config_members
