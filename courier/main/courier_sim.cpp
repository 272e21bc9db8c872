/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gflags/gflags.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "adapter/impl/loopback_adapter.hpp"
#include "common/hexutils.hpp"
#include "common/result.hpp"
#include "gateway/gateway.hpp"
#include "gateway/message_handler.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "logger/logger_spdlog.hpp"
#include "main/application.hpp"
#include "main/courier_conf_literals.hpp"
#include "main/courier_conf_loader.hpp"
#include "messages/impl/tagged_message_properties.hpp"

static const std::string kLogSettingsFromConfigFile = "config_file";

DEFINE_string(source_config, "", "Configuration of the sending network");
DEFINE_string(destination_config,
              "",
              "Configuration of the receiving network");
DEFINE_uint64(messages, 3, "Number of messages to relay in one batch");
DEFINE_uint64(tenant, 0, "Tenant the messages belong to");
DEFINE_uint32(tag, 0, "Message tag selecting its gas limit");

static bool validateVerbosity(const char *flagname, const std::string &val) {
  if (val == kLogSettingsFromConfigFile) {
    return true;
  }
  const auto it = config_members::LogLevels.find(val);
  if (it == config_members::LogLevels.end()) {
    std::cerr << "Invalid value for " << flagname << ": should be one of '"
              << kLogSettingsFromConfigFile;
    for (const auto &level : config_members::LogLevels) {
      std::cerr << "', '" << level.first;
    }
    std::cerr << "'." << std::endl;
    return false;
  }
  return true;
}

/// Verbosity flag for spdlog configuration
DEFINE_string(verbosity, kLogSettingsFromConfigFile, "Log verbosity");
DEFINE_validator(verbosity, &validateVerbosity);

namespace {
  logger::LoggerManagerTreePtr getDefaultLogManager() {
    return std::make_shared<logger::LoggerManagerTree>(logger::LoggerConfig{
        logger::kDefaultLogLevel, logger::getDefaultLogPatterns()});
  }

  /// Prints every delivered message.
  class LoggingMessageHandler : public courier::gateway::MessageHandler {
   public:
    explicit LoggingMessageHandler(logger::LoggerPtr log)
        : log_(std::move(log)) {}

    courier::expected::Result<void, std::string> handle(
        courier::types::NetworkId source,
        const courier::types::Bytes &message) override {
      log_->info("delivered from {}: {}",
                 source,
                 courier::bytestringToHexstring(
                     std::string{message.begin(), message.end()}));
      ++delivered_;
      return {};
    }

    size_t delivered() const {
      return delivered_;
    }

   private:
    logger::LoggerPtr log_;
    size_t delivered_ = 0;
  };

  std::unique_ptr<CourierNode> makeNode(
      const std::string &path,
      std::shared_ptr<courier::gateway::MessageHandler> handler,
      const logger::LoggerManagerTreePtr &default_log_manager,
      const logger::LoggerPtr &log) {
    auto config_result = parse_courier_config(path, {log});
    if (auto e = boost::get<courier::expected::Error<std::string>>(
            &config_result)) {
      log->error("Failed reading the configuration {}: {}", path, e->error);
      return nullptr;
    }
    auto config = std::move(config_result).assumeValue();
    auto log_manager = FLAGS_verbosity == kLogSettingsFromConfigFile
        ? config.logger_manager.value_or(default_log_manager)
        : default_log_manager;
    auto node = std::make_unique<CourierNode>(
        config,
        std::move(handler),
        log_manager->getChild(fmt::format("Net{}", config.local_network)));
    auto init = node->init();
    if (auto e = boost::get<courier::expected::Error<std::string>>(&init)) {
      log->error("Failed to initialize network {}: {}",
                 config.local_network,
                 e->error);
      return nullptr;
    }
    return node;
  }
}  // namespace

int main(int argc, char *argv[]) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  logger::LoggerManagerTreePtr log_manager = getDefaultLogManager();
  if (FLAGS_verbosity != kLogSettingsFromConfigFile) {
    logger::LoggerConfig cfg;
    cfg.log_level = config_members::LogLevels.at(FLAGS_verbosity);
    log_manager = std::make_shared<logger::LoggerManagerTree>(std::move(cfg));
  }
  logger::LoggerPtr log = log_manager->getChild("Sim")->getLogger();

  auto source_handler = std::make_shared<LoggingMessageHandler>(
      log_manager->getChild("SourceHandler")->getLogger());
  auto destination_handler = std::make_shared<LoggingMessageHandler>(
      log_manager->getChild("DestinationHandler")->getLogger());

  auto source =
      makeNode(FLAGS_source_config, source_handler, log_manager, log);
  auto destination = makeNode(
      FLAGS_destination_config, destination_handler, log_manager, log);
  if (not source or not destination) {
    gflags::ShutDownCommandLineFlags();
    return EXIT_FAILURE;
  }
  source->connect(*destination);
  destination->connect(*source);

  const auto remote = destination->local();
  courier::expected::Result<courier::gateway::Gateway::SendReceipts,
                            courier::gateway::GatewayError>
      sent;
  try {
    sent = source->gateway()->withBatch([&] {
      for (uint64_t i = 0; i < FLAGS_messages; ++i) {
        auto message = courier::messages::TaggedMessageProperties::makeMessage(
            static_cast<uint8_t>(FLAGS_tag),
            FLAGS_tenant,
            courier::types::Bytes{static_cast<uint8_t>(i)});
        auto queued = source->gateway()->send(remote, message);
        if (auto e = boost::get<
                courier::expected::Error<courier::gateway::GatewayError>>(
                &queued)) {
          throw std::runtime_error(e->error.toString());
        }
      }
    });
  } catch (const std::exception &e) {
    log->error("Batching aborted: {}", e.what());
    gflags::ShutDownCommandLineFlags();
    return EXIT_FAILURE;
  }
  if (auto e = boost::get<
          courier::expected::Error<courier::gateway::GatewayError>>(&sent)) {
    log->error("Batch was not sent: {}", e->error);
    gflags::ShutDownCommandLineFlags();
    return EXIT_FAILURE;
  }
  for (const auto &receipt : sent.assumeValue()) {
    log->info("sent {}", receipt);
  }

  size_t frames = 0;
  for (const auto &named : source->adapters()) {
    frames += named.second->deliverAll();
  }
  log->info("pumped {} frames, {} of {} messages delivered",
            frames,
            destination_handler->delivered(),
            FLAGS_messages);

  gflags::ShutDownCommandLineFlags();
  return destination_handler->delivered() == FLAGS_messages ? EXIT_SUCCESS
                                                            : EXIT_FAILURE;
}
