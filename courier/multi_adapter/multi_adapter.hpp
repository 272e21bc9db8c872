/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MULTI_ADAPTER_MULTI_ADAPTER_HPP
#define COURIER_MULTI_ADAPTER_MULTI_ADAPTER_HPP

#include <string>
#include <vector>

#include "adapter/adapter.hpp"
#include "common/result.hpp"
#include "crypto/hash_types.hpp"
#include "model/types.hpp"
#include "multi_adapter/router_error.hpp"

namespace courier {
  namespace multi_adapter {

    struct SendReceipt {
      hash256_t hash;
      types::Amount cost;
      std::vector<adapter::AdapterReceipt> receipts;
      /// proof adapters which refused the frame after the batch went out
      std::vector<types::AdapterId> failed;

      std::string toString() const;
    };

    /// Outbound side of the quorum router
    class MultiAdapter {
     public:
      virtual ~MultiAdapter() = default;

      /**
       * Quote a send
       * @return sum of the estimates of every sending adapter for the frame
       * it would carry
       */
      virtual expected::Result<types::Amount, RouterError> estimate(
          types::NetworkId remote,
          types::TenantId tenant,
          const types::Bytes &batch,
          types::GasLimit gas_limit) const = 0;

      /**
       * Send the batch through the primary adapter and its proof through
       * every other sending adapter. Fails only if the primary refuses the
       * batch; once it went out, proof failures are listed in the receipt.
       * @param payment - funds available, at least the estimate
       * @param refund - account for unspent relay cost
       */
      virtual expected::Result<SendReceipt, RouterError> send(
          types::NetworkId remote,
          types::TenantId tenant,
          const types::Bytes &batch,
          types::GasLimit gas_limit,
          types::Amount payment,
          const types::AccountId &refund) = 0;
    };

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MULTI_ADAPTER_MULTI_ADAPTER_HPP
