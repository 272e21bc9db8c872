/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MULTI_ADAPTER_VOTE_RECORD_HPP
#define COURIER_MULTI_ADAPTER_VOTE_RECORD_HPP

#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include "model/types.hpp"
#include "multi_adapter/adapter_setup.hpp"

namespace courier {
  namespace multi_adapter {

    using Voters = std::set<types::AdapterId>;

    /// Votes recorded, batch bytes not received yet
    struct AwaitingPayload {
      Voters voters;
    };

    /// Batch received and decoded, waiting for enough votes
    struct PendingQuorum {
      Voters voters;
      std::vector<types::Bytes> messages;
    };

    /// Terminal, only the voters remain for inspection
    struct Delivered {
      Voters voters;
    };

    /// Read-only view of a record for operator tooling
    struct VoteState {
      std::string state;
      std::vector<types::AdapterId> voters;
      bool payload_held;

      std::string toString() const;
    };

    /// Tally of one (source network, batch hash) pair
    class VoteRecord {
     public:
      using State = boost::variant<AwaitingPayload, PendingQuorum, Delivered>;

      VoteRecord();

      bool isDelivered() const;

      bool hasPayload() const;

      /**
       * Record a vote.
       * @return false if the adapter had voted already or the record is
       * delivered, in which case nothing changes
       */
      bool addVote(const types::AdapterId &voter);

      /**
       * Hold the decoded batch. Does nothing if a batch is held already or
       * the record is delivered.
       */
      void attachPayload(std::vector<types::Bytes> messages);

      /// @return held batch, if any
      boost::optional<const std::vector<types::Bytes> &> messages() const;

      const Voters &voters() const;

      /// @return number of voters which are members of setup
      size_t countVotes(const AdapterSetup &setup) const;

      /**
       * Move to Delivered, handing out the held batch.
       * @return the batch, or none if no batch is held
       */
      boost::optional<std::vector<types::Bytes>> markDelivered();

      VoteState snapshot() const;

     private:
      State state_;
    };

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MULTI_ADAPTER_VOTE_RECORD_HPP
