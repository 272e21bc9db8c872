/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MULTI_ADAPTER_INBOUND_OUTCOME_HPP
#define COURIER_MULTI_ADAPTER_INBOUND_OUTCOME_HPP

#include <cstddef>
#include <string>

#include "crypto/hash_types.hpp"

namespace courier {
  namespace multi_adapter {

    enum class InboundStatus {
      /// votes recorded, payload bytes not seen yet
      kAwaitingPayload,
      /// payload held, not enough votes
      kPendingQuorum,
      /// this call delivered the batch
      kDelivered,
      /// the batch had been delivered before, nothing changed
      kAlreadyDelivered,
    };

    const char *toString(InboundStatus status);

    /// Result of one inbound frame
    struct InboundOutcome {
      hash256_t hash;
      InboundStatus status;
      /// votes counted towards the threshold after this call
      size_t votes;
      /// the reporter had already voted for this hash
      bool duplicate_vote;

      std::string toString() const;
    };

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MULTI_ADAPTER_INBOUND_OUTCOME_HPP
