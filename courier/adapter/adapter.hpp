/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_ADAPTER_ADAPTER_HPP
#define COURIER_ADAPTER_ADAPTER_HPP

#include <string>

#include "common/result.hpp"
#include "model/types.hpp"

namespace courier {
  namespace adapter {

    /// Transport acknowledgement of an accepted send
    struct AdapterReceipt {
      types::AdapterId adapter;
      /// Transport specific reference, e.g. a message id
      std::string reference;

      bool operator==(const AdapterReceipt &other) const {
        return adapter == other.adapter and reference == other.reference;
      }
    };

    /**
     * Transport binding to remote networks. The core relies only on
     * "eventually delivers at most what was sent, or nothing".
     */
    class Adapter {
     public:
      virtual ~Adapter() = default;

      /// Identity used for inbound votes
      virtual const types::AdapterId &id() const = 0;

      /**
       * Send raw bytes to the remote network
       * @param remote - destination network
       * @param payload - batch or proof frame
       * @param gas_limit - gas to forward to the destination execution
       * @param refund - account receiving unspent relay cost
       * @return receipt or transport error description
       */
      virtual expected::Result<AdapterReceipt, std::string> send(
          types::NetworkId remote,
          const types::Bytes &payload,
          types::GasLimit gas_limit,
          const types::AccountId &refund) = 0;

      /// @return cost of sending the payload with the given gas limit
      virtual types::Amount estimate(types::NetworkId remote,
                                     const types::Bytes &payload,
                                     types::GasLimit gas_limit) const = 0;
    };

  }  // namespace adapter
}  // namespace courier

#endif  // COURIER_ADAPTER_ADAPTER_HPP
