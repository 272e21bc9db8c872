/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_APPLICATION_HPP
#define COURIER_APPLICATION_HPP

#include <map>
#include <memory>
#include <string>

#include "common/result.hpp"
#include "logger/logger_fwd.hpp"
#include "logger/logger_manager_fwd.hpp"
#include "main/courier_conf_loader.hpp"

namespace courier {
  namespace adapter {
    class LoopbackAdapter;
  }
  namespace auth {
    class AccessControl;
  }
  namespace gateway {
    class Gateway;
    class MessageHandler;
  }  // namespace gateway
  namespace messages {
    class MessageProperties;
  }
  namespace multi_adapter {
    class MultiAdapterImpl;
  }
}  // namespace courier

/**
 * One relay endpoint: the router, the gateway on top of it and the loopback
 * adapters described by the configuration.
 */
class CourierNode {
 public:
  using RunResult = courier::expected::Result<void, std::string>;
  using LoopbackAdapters =
      std::map<std::string, std::shared_ptr<courier::adapter::LoopbackAdapter>>;

  /**
   * @param config - parsed configuration
   * @param handler - receiver of delivered messages
   * @param logger_manager - the logger manager to use
   */
  CourierNode(const CourierConfig &config,
              std::shared_ptr<courier::gateway::MessageHandler> handler,
              logger::LoggerManagerTreePtr logger_manager);

  virtual ~CourierNode();

  /**
   * Initialization of whole objects in system
   */
  virtual RunResult init();

  /**
   * Route frames sent by this node to the peer router, using the adapters
   * with matching names on both sides.
   */
  void connect(CourierNode &peer);

  courier::types::NetworkId local() const;

  std::shared_ptr<courier::gateway::Gateway> gateway() const;

  std::shared_ptr<courier::multi_adapter::MultiAdapterImpl> router() const;

  std::shared_ptr<courier::auth::AccessControl> accessControl() const;

  const LoopbackAdapters &adapters() const;

  /// @return adapter by configured name, or nullptr
  std::shared_ptr<courier::adapter::LoopbackAdapter> adapter(
      const std::string &name) const;

 protected:
  // -----------------------| component initialization |------------------------
  virtual RunResult initAccessControl();

  virtual RunResult initMessageProperties();

  virtual RunResult initRouter();

  virtual RunResult initGateway();

  virtual RunResult initAdapters();

  RunResult initRoutes();

  RunResult initSubsidies();

  const CourierConfig config_;

  std::shared_ptr<courier::gateway::MessageHandler> handler_;

  std::shared_ptr<courier::auth::AccessControl> access_control_;

  std::shared_ptr<courier::messages::MessageProperties> message_properties_;

  std::shared_ptr<courier::multi_adapter::MultiAdapterImpl> router_;

  std::shared_ptr<courier::gateway::Gateway> gateway_;

  LoopbackAdapters adapters_;

  logger::LoggerManagerTreePtr log_manager_;
  logger::LoggerPtr log_;
};

#endif  // COURIER_APPLICATION_HPP
