/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/application.hpp"

#include <fmt/core.h>
#include "adapter/impl/loopback_adapter.hpp"
#include "auth/access_control.hpp"
#include "common/result_try.hpp"
#include "gateway/gateway.hpp"
#include "gateway/message_handler.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "messages/impl/tagged_message_properties.hpp"
#include "multi_adapter/impl/multi_adapter_impl.hpp"

using namespace courier;

CourierNode::CourierNode(
    const CourierConfig &config,
    std::shared_ptr<courier::gateway::MessageHandler> handler,
    logger::LoggerManagerTreePtr logger_manager)
    : config_(config),
      handler_(std::move(handler)),
      log_manager_(std::move(logger_manager)),
      log_(log_manager_->getLogger()) {
  log_->info("created node for network {}", config_.local_network);
}

CourierNode::~CourierNode() = default;

CourierNode::RunResult CourierNode::init() {
  COURIER_EXPECTED_ERROR_CHECK(initAccessControl());
  COURIER_EXPECTED_ERROR_CHECK(initMessageProperties());
  COURIER_EXPECTED_ERROR_CHECK(initRouter());
  COURIER_EXPECTED_ERROR_CHECK(initGateway());
  COURIER_EXPECTED_ERROR_CHECK(initAdapters());
  COURIER_EXPECTED_ERROR_CHECK(initRoutes());
  COURIER_EXPECTED_ERROR_CHECK(initSubsidies());
  return {};
}

void CourierNode::connect(CourierNode &peer) {
  for (const auto &named : adapters_) {
    if (peer.adapter(named.first) == nullptr) {
      log_->warn("peer {} has no adapter {}, frames will stay queued",
                 peer.local(),
                 named.first);
      continue;
    }
    named.second->connect(peer.local(), peer.router());
  }
}

courier::types::NetworkId CourierNode::local() const {
  return config_.local_network;
}

std::shared_ptr<courier::gateway::Gateway> CourierNode::gateway() const {
  return gateway_;
}

std::shared_ptr<courier::multi_adapter::MultiAdapterImpl> CourierNode::router()
    const {
  return router_;
}

std::shared_ptr<courier::auth::AccessControl> CourierNode::accessControl()
    const {
  return access_control_;
}

const CourierNode::LoopbackAdapters &CourierNode::adapters() const {
  return adapters_;
}

std::shared_ptr<courier::adapter::LoopbackAdapter> CourierNode::adapter(
    const std::string &name) const {
  auto it = adapters_.find(name);
  return it == adapters_.end() ? nullptr : it->second;
}

CourierNode::RunResult CourierNode::initAccessControl() {
  if (config_.configurators.empty()) {
    return expected::makeError<std::string>(
        "at least one configurator is required");
  }
  access_control_ = std::make_shared<auth::AccessControl>(
      config_.configurators,
      config_.operators.value_or(std::vector<std::string>{}),
      log_manager_->getChild("AccessControl")->getLogger());

  log_->info("[Init] => access control");
  return {};
}

CourierNode::RunResult CourierNode::initMessageProperties() {
  message_properties_ = std::make_shared<messages::TaggedMessageProperties>(
      config_.message_gas.default_gas, config_.message_gas.by_tag);

  log_->info("[Init] => message properties");
  return {};
}

CourierNode::RunResult CourierNode::initRouter() {
  router_ = std::make_shared<multi_adapter::MultiAdapterImpl>(
      config_.local_network,
      access_control_,
      message_properties_,
      log_manager_->getChild("Router"));

  log_->info("[Init] => router");
  return {};
}

CourierNode::RunResult CourierNode::initGateway() {
  gateway_ = std::make_shared<gateway::Gateway>(config_.local_network,
                                                router_,
                                                handler_,
                                                message_properties_,
                                                access_control_,
                                                config_.max_batch_gas_limit,
                                                log_manager_->getChild("Gateway"));
  router_->setBatchHandler(gateway_);

  log_->info("[Init] => gateway");
  return {};
}

CourierNode::RunResult CourierNode::initAdapters() {
  auto adapters_log_manager = log_manager_->getChild("Adapters");
  for (const auto &adapter_config : config_.adapters) {
    auto loopback = std::make_shared<adapter::LoopbackAdapter>(
        adapter_config.name,
        config_.local_network,
        adapter_config.base_fee,
        adapter_config.gas_price,
        adapters_log_manager->getChild(adapter_config.name)->getLogger());
    if (not adapters_.emplace(adapter_config.name, std::move(loopback))
                .second) {
      return expected::makeError(
          fmt::format("duplicate adapter name {}", adapter_config.name));
    }
  }

  log_->info("[Init] => {} adapters", adapters_.size());
  return {};
}

CourierNode::RunResult CourierNode::initRoutes() {
  const auto &bootstrap = config_.configurators.front();
  for (const auto &route : config_.routes) {
    std::vector<std::shared_ptr<adapter::Adapter>> route_adapters;
    for (const auto &name : route.adapters) {
      auto adapter = this->adapter(name);
      if (adapter == nullptr) {
        return expected::makeError(fmt::format(
            "route to {} uses unknown adapter {}", route.remote, name));
      }
      route_adapters.push_back(std::move(adapter));
    }
    const auto recovery_index =
        route.recovery_index.value_or(route_adapters.size());
    auto filed = router_->file(bootstrap,
                               route.remote,
                               route.tenant,
                               std::move(route_adapters),
                               route.threshold,
                               route.primary.value_or(0),
                               recovery_index);
    if (auto error = boost::get<expected::Error<multi_adapter::RouterError>>(
            &filed)) {
      return expected::makeError(
          fmt::format("route to {} tenant {}: {}",
                      route.remote,
                      route.tenant,
                      error->error));
    }
  }

  log_->info("[Init] => {} routes", config_.routes.size());
  return {};
}

CourierNode::RunResult CourierNode::initSubsidies() {
  if (not config_.subsidies) {
    return {};
  }
  const auto &bootstrap = config_.configurators.front();
  auto &ledger = gateway_->subsidies();
  for (const auto &subsidy : *config_.subsidies) {
    auto deposited = ledger.deposit(subsidy.tenant, subsidy.amount);
    if (auto error =
            boost::get<expected::Error<gateway::GatewayError>>(&deposited)) {
      return expected::makeError(fmt::format(
          "subsidy of tenant {}: {}", subsidy.tenant, error->error));
    }
    if (subsidy.refund) {
      auto set = ledger.setRefundAddress(
          bootstrap, subsidy.tenant, *subsidy.refund);
      if (auto error = boost::get<expected::Error<gateway::GatewayError>>(
              &set)) {
        return expected::makeError(fmt::format(
            "refund address of tenant {}: {}", subsidy.tenant, error->error));
      }
    }
  }

  log_->info("[Init] => subsidies");
  return {};
}
