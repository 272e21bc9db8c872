/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_ADAPTER_LOOPBACK_ADAPTER_HPP
#define COURIER_ADAPTER_LOOPBACK_ADAPTER_HPP

#include "adapter/adapter.hpp"

#include <deque>
#include <map>
#include <memory>

#include <boost/optional.hpp>
#include "adapter/inbound_handler.hpp"
#include "logger/logger_fwd.hpp"

namespace courier {
  namespace adapter {

    /**
     * In-process binding. Frames are queued per remote network and handed
     * to the inbound handler connected for that network when pumped, which
     * lets the caller reorder, drop or corrupt them.
     */
    class LoopbackAdapter : public Adapter {
     public:
      using DeliveryResult =
          expected::Result<multi_adapter::InboundOutcome,
                           multi_adapter::RouterError>;

      /**
       * @param id - adapter identity, the same on both ends
       * @param local - network this adapter sends from
       * @param base_fee - fixed part of every quote
       * @param gas_price - price of one unit of forwarded gas
       * @param log - logger
       */
      LoopbackAdapter(types::AdapterId id,
                      types::NetworkId local,
                      types::Amount base_fee,
                      types::Amount gas_price,
                      logger::LoggerPtr log);

      const types::AdapterId &id() const override;

      expected::Result<AdapterReceipt, std::string> send(
          types::NetworkId remote,
          const types::Bytes &payload,
          types::GasLimit gas_limit,
          const types::AccountId &refund) override;

      types::Amount estimate(types::NetworkId remote,
                             const types::Bytes &payload,
                             types::GasLimit gas_limit) const override;

      /// Route frames for remote to the given handler
      void connect(types::NetworkId remote,
                   std::weak_ptr<InboundHandler> handler);

      /// Make subsequent sends fail, as an unreachable transport would
      void setFailing(bool failing);

      /// @return number of frames waiting for delivery to remote
      size_t queued(types::NetworkId remote) const;

      /**
       * Deliver the oldest frame queued for remote.
       * @return the handler result, or none if the queue is empty or no
       * handler is connected
       */
      boost::optional<DeliveryResult> deliverNext(types::NetworkId remote);

      /// Deliver every queued frame. @return number of frames delivered
      size_t deliverAll();

      /// Drop the oldest frame queued for remote. @return whether dropped
      bool dropNext(types::NetworkId remote);

      /// Flip a bit in the oldest frame queued for remote
      bool corruptNext(types::NetworkId remote);

     private:
      const types::AdapterId id_;
      const types::NetworkId local_;
      const types::Amount base_fee_;
      const types::Amount gas_price_;
      bool failing_;
      uint64_t sequence_;
      std::map<types::NetworkId, std::deque<types::Bytes>> queues_;
      std::map<types::NetworkId, std::weak_ptr<InboundHandler>> handlers_;

      logger::LoggerPtr log_;
    };

  }  // namespace adapter
}  // namespace courier

#endif  // COURIER_ADAPTER_LOOPBACK_ADAPTER_HPP
