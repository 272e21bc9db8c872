/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_GATEWAY_GATEWAY_HPP
#define COURIER_GATEWAY_GATEWAY_HPP

#include "multi_adapter/batch_handler.hpp"

#include <map>
#include <memory>
#include <set>
#include <vector>

#include <boost/optional.hpp>
#include "auth/access_control.hpp"
#include "common/result_try.hpp"
#include "crypto/hash_types.hpp"
#include "gateway/gateway_error.hpp"
#include "gateway/message_handler.hpp"
#include "gateway/subsidy_ledger.hpp"
#include "logger/logger_fwd.hpp"
#include "logger/logger_manager_fwd.hpp"
#include "messages/message_properties.hpp"
#include "multi_adapter/multi_adapter.hpp"

namespace courier {
  namespace gateway {

    /// Lifecycle of an outbound batch inside the gateway
    enum class BatchStage {
      kAccumulating,
      kQuoted,
      kFunded,
      kSent,
    };

    const char *toString(BatchStage stage);

    /**
     * Entry point of domain logic into the relay. Outbound, collects
     * messages into one batch per (remote, tenant), pays the router quote
     * from the tenant subsidy and sends. Inbound, dispatches delivered
     * batches to the message handler one message at a time.
     */
    class Gateway : public multi_adapter::BatchHandler {
     public:
      using SendReceipts = std::vector<multi_adapter::SendReceipt>;

      /**
       * @param local - network this gateway runs on
       * @param router - outbound quorum router
       * @param handler - receiver of delivered messages
       * @param message_properties - tenant and gas of a message
       * @param access_control - role checks for administrative calls
       * @param max_batch_gas_limit - upper bound of gas of one batch
       * @param log_manager - log manager
       */
      Gateway(types::NetworkId local,
              std::shared_ptr<multi_adapter::MultiAdapter> router,
              std::shared_ptr<MessageHandler> handler,
              std::shared_ptr<messages::MessageProperties> message_properties,
              std::shared_ptr<auth::AccessControl> access_control,
              types::GasLimit max_batch_gas_limit,
              logger::LoggerManagerTreePtr log_manager);

      SubsidyLedger &subsidies();

      const SubsidyLedger &subsidies() const;

      // --- outbound ---

      /**
       * Queue the message for remote. Outside of a batching scope the batch
       * is flushed right away.
       */
      expected::Result<void, GatewayError> send(types::NetworkId remote,
                                                const types::Bytes &message);

      /// Open a batching scope. Scopes do not nest.
      expected::Result<void, GatewayError> startBatching();

      /**
       * Close the batching scope and send every batch touched in it. All
       * of them are quoted first, and nothing is sent if some tenant can not
       * pay for its batches in total.
       * @return receipts in first touched order
       */
      expected::Result<SendReceipts, GatewayError> endBatching();

      /**
       * Run fn inside a batching scope. If fn throws, the messages it queued
       * are dropped and the exception propagates.
       */
      template <typename F>
      expected::Result<SendReceipts, GatewayError> withBatch(F &&fn) {
        COURIER_EXPECTED_ERROR_CHECK(startBatching());
        try {
          std::forward<F>(fn)();
        } catch (...) {
          rollbackBatching();
          throw;
        }
        return endBatching();
      }

      /// Send the pending batch for (remote, tenant)
      expected::Result<multi_adapter::SendReceipt, GatewayError> flush(
          types::NetworkId remote, types::TenantId tenant);

      /// Drop the pending batch for (remote, tenant). Operator only.
      expected::Result<void, GatewayError> discardPending(
          const types::AccountId &caller,
          types::NetworkId remote,
          types::TenantId tenant);

      /// Stop or resume sends for (remote, tenant). Configurator only.
      expected::Result<void, GatewayError> setOutgoingBlocked(
          const types::AccountId &caller,
          types::NetworkId remote,
          types::TenantId tenant,
          bool blocked);

      bool isOutgoingBlocked(types::NetworkId remote,
                             types::TenantId tenant) const;

      bool isBatching() const;

      /// @return number of queued messages for (remote, tenant)
      size_t pendingCount(types::NetworkId remote,
                          types::TenantId tenant) const;

      boost::optional<BatchStage> stage(types::NetworkId remote,
                                        types::TenantId tenant) const;

      std::vector<types::RouteKey> pendingRoutes() const;

      // --- inbound ---

      multi_adapter::DispatchReport handleBatch(
          types::NetworkId source,
          const std::vector<types::Bytes> &messages) override;

      /**
       * Dispatch a message again whose earlier dispatch failed
       * @return error if it never failed or failed again
       */
      expected::Result<void, GatewayError> retry(types::NetworkId source,
                                                 const types::Bytes &message);

      /// @return how many dispatches of the message are still failed
      size_t failedCount(types::NetworkId source, const hash256_t &hash) const;

     private:
      struct PendingBatch {
        std::vector<types::Bytes> messages;
        types::GasLimit gas = 0;
        BatchStage stage = BatchStage::kAccumulating;
      };

      /// Quote of a pending batch made before funding
      struct Quote {
        types::RouteKey key;
        types::Bytes batch;
        types::GasLimit gas;
        types::Amount cost;
      };

      using FailureKey = std::pair<types::NetworkId, hash256_t>;

      expected::Result<Quote, GatewayError> quote(const types::RouteKey &key);

      /// Check the combined cost of quotes per tenant against balances
      expected::Result<void, GatewayError> fund(
          const std::vector<Quote> &quotes);

      expected::Result<multi_adapter::SendReceipt, GatewayError> sendQuoted(
          const Quote &quote);

      void setStage(const types::RouteKey &key, BatchStage stage);

      void rollbackBatching();

      /// @return whether the handler accepted the message
      bool dispatch(types::NetworkId source, const types::Bytes &message);

      expected::Result<void, GatewayError> checkRole(
          const types::AccountId &caller, auth::Role role) const;

      const types::NetworkId local_;
      std::shared_ptr<multi_adapter::MultiAdapter> router_;
      std::shared_ptr<MessageHandler> handler_;
      std::shared_ptr<messages::MessageProperties> message_properties_;
      std::shared_ptr<auth::AccessControl> access_control_;
      const types::GasLimit max_batch_gas_limit_;
      SubsidyLedger subsidies_;

      std::map<types::RouteKey, PendingBatch> pending_;
      std::set<types::RouteKey> blocked_;

      bool batching_;
      /// routes touched in the batching scope, in first touched order
      std::vector<types::RouteKey> scope_routes_;
      /// message count of each touched route when the scope touched it
      std::map<types::RouteKey, size_t> scope_marks_;

      std::map<FailureKey, size_t> failures_;

      logger::LoggerPtr log_;
    };

  }  // namespace gateway
}  // namespace courier

#endif  // COURIER_GATEWAY_GATEWAY_HPP
