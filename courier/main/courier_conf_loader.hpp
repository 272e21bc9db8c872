/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_CONF_LOADER_HPP
#define COURIER_CONF_LOADER_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include "common/result_fwd.hpp"
#include "logger/logger_fwd.hpp"
#include "logger/logger_manager.hpp"
#include "model/types.hpp"

struct CourierConfig {
  struct Adapter {
    std::string name;
    courier::types::Amount base_fee;
    courier::types::Amount gas_price;
  };

  struct Route {
    courier::types::NetworkId remote;
    courier::types::TenantId tenant;
    std::vector<std::string> adapters;
    uint64_t threshold;
    boost::optional<uint64_t> primary;
    boost::optional<uint64_t> recovery_index;
  };

  struct Subsidy {
    courier::types::TenantId tenant;
    courier::types::Amount amount;
    boost::optional<std::string> refund;
  };

  struct MessageGas {
    courier::types::GasLimit default_gas;
    std::map<uint8_t, courier::types::GasLimit> by_tag;
  };

  courier::types::NetworkId local_network;
  std::vector<std::string> configurators;
  boost::optional<std::vector<std::string>> operators;
  courier::types::GasLimit max_batch_gas_limit;
  MessageGas message_gas;
  std::vector<Adapter> adapters;
  std::vector<Route> routes;
  boost::optional<std::vector<Subsidy>> subsidies;
  boost::optional<logger::LoggerManagerTreePtr> logger_manager;
};

/**
 * Parse the courier configuration.
 * @param conf_text - JSON text of the configuration
 * @param log - logger for the parsing process
 * @return the configuration or a description of the first problem, with the
 * JSON path of the offending member
 */
courier::expected::Result<CourierConfig, std::string>
parse_courier_config_text(const std::string &conf_text,
                          std::optional<logger::LoggerPtr> log);

/**
 * Read and parse the courier configuration file.
 * @param conf_path - path to the JSON file
 */
courier::expected::Result<CourierConfig, std::string> parse_courier_config(
    const std::string &conf_path, std::optional<logger::LoggerPtr> log);

#endif  // COURIER_CONF_LOADER_HPP
