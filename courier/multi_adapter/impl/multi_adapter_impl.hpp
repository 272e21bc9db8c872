/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MULTI_ADAPTER_MULTI_ADAPTER_IMPL_HPP
#define COURIER_MULTI_ADAPTER_MULTI_ADAPTER_IMPL_HPP

#include "adapter/inbound_handler.hpp"
#include "multi_adapter/multi_adapter.hpp"

#include <memory>
#include <vector>

#include <boost/optional.hpp>
#include "auth/access_control.hpp"
#include "logger/logger_fwd.hpp"
#include "logger/logger_manager_fwd.hpp"
#include "messages/message_properties.hpp"
#include "multi_adapter/adapter_registry.hpp"
#include "multi_adapter/batch_handler.hpp"
#include "multi_adapter/vote_storage.hpp"

namespace courier {
  namespace multi_adapter {

    /**
     * Quorum router between the local network and its remotes. Fans batches
     * out over the configured adapters and forwards an inbound batch to the
     * batch handler once enough distinct adapters reported its hash.
     */
    class MultiAdapterImpl : public MultiAdapter,
                             public adapter::InboundHandler {
     public:
      MultiAdapterImpl(
          types::NetworkId local,
          std::shared_ptr<auth::AccessControl> access_control,
          std::shared_ptr<messages::MessageProperties> message_properties,
          logger::LoggerManagerTreePtr log_manager);

      types::NetworkId local() const;

      /// Register the receiver of delivered batches
      void setBatchHandler(std::weak_ptr<BatchHandler> handler);

      /**
       * Replace the adapter setup for (remote, tenant). Configurator only.
       * @param adapters - ordered adapters, sending ones first
       * @param threshold - distinct member votes required for delivery
       * @param primary_index - adapter carrying the full batch
       * @param recovery_index - first receive-only adapter
       */
      expected::Result<void, RouterError> file(
          const types::AccountId &caller,
          types::NetworkId remote,
          types::TenantId tenant,
          std::vector<std::shared_ptr<adapter::Adapter>> adapters,
          size_t threshold,
          size_t primary_index,
          size_t recovery_index);

      /// Remove the setup for (remote, tenant). Configurator only.
      expected::Result<void, RouterError> unfile(
          const types::AccountId &caller,
          types::NetworkId remote,
          types::TenantId tenant);

      /// @return setup applying to (remote, tenant), or nullptr
      AdapterRegistry::SetupPtr setup(types::NetworkId remote,
                                      types::TenantId tenant) const;

      expected::Result<types::Amount, RouterError> estimate(
          types::NetworkId remote,
          types::TenantId tenant,
          const types::Bytes &batch,
          types::GasLimit gas_limit) const override;

      expected::Result<SendReceipt, RouterError> send(
          types::NetworkId remote,
          types::TenantId tenant,
          const types::Bytes &batch,
          types::GasLimit gas_limit,
          types::Amount payment,
          const types::AccountId &refund) override;

      expected::Result<InboundOutcome, RouterError> handle(
          types::NetworkId source,
          const types::Bytes &payload,
          const types::AdapterId &reporter) override;

      /**
       * Supply the batch bytes of a stuck hash as an adapter delivery would,
       * without a vote. Operator only.
       */
      expected::Result<InboundOutcome, RouterError> recover(
          const types::AccountId &caller,
          types::NetworkId source,
          const types::Bytes &payload);

      boost::optional<VoteState> voteState(types::NetworkId source,
                                           const hash256_t &hash) const;

      /// @return undelivered hashes reported from source
      std::vector<hash256_t> pendingHashes(types::NetworkId source) const;

      /**
       * Drop an undelivered record, e.g. one opened by proofs for a hash
       * whose batch never existed. Operator only. Delivered records are kept.
       */
      expected::Result<void, RouterError> purge(const types::AccountId &caller,
                                                types::NetworkId source,
                                                const hash256_t &hash);

     private:
      /// Classified inbound frame
      struct Frame {
        hash256_t hash;
        boost::optional<std::vector<types::Bytes>> messages;
      };

      expected::Result<Frame, RouterError> classify(
          const types::Bytes &payload) const;

      expected::Result<void, RouterError> checkSingleTenant(
          const std::vector<types::Bytes> &messages) const;

      expected::Result<std::shared_ptr<BatchHandler>, RouterError>
      checkInbound(types::NetworkId source) const;

      expected::Result<void, RouterError> checkRole(
          const types::AccountId &caller, auth::Role role) const;

      /// Deliver the record if its payload is held and votes suffice
      InboundOutcome tryDeliver(types::NetworkId source,
                                const hash256_t &hash,
                                VoteRecord &record,
                                BatchHandler &handler,
                                bool duplicate_vote);

      const types::NetworkId local_;
      std::shared_ptr<auth::AccessControl> access_control_;
      std::shared_ptr<messages::MessageProperties> message_properties_;
      AdapterRegistry registry_;
      VoteStorage votes_;
      std::weak_ptr<BatchHandler> batch_handler_;

      logger::LoggerPtr log_;
    };

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MULTI_ADAPTER_MULTI_ADAPTER_IMPL_HPP
