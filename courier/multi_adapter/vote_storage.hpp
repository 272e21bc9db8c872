/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MULTI_ADAPTER_VOTE_STORAGE_HPP
#define COURIER_MULTI_ADAPTER_VOTE_STORAGE_HPP

#include <map>
#include <vector>

#include <boost/optional.hpp>
#include "crypto/hash_types.hpp"
#include "model/types.hpp"
#include "multi_adapter/vote_record.hpp"

namespace courier {
  namespace multi_adapter {

    /// Vote records per source network and batch hash
    class VoteStorage {
     public:
      /// @return record for the pair, created empty if absent
      VoteRecord &getOrCreate(types::NetworkId source, const hash256_t &hash);

      boost::optional<const VoteRecord &> find(types::NetworkId source,
                                               const hash256_t &hash) const;

      /// @return true if a record was removed
      bool erase(types::NetworkId source, const hash256_t &hash);

      /// @return hashes from source which are not delivered yet
      std::vector<hash256_t> pending(types::NetworkId source) const;

      size_t size() const;

     private:
      std::map<types::NetworkId, std::map<hash256_t, VoteRecord>> records_;
    };

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MULTI_ADAPTER_VOTE_STORAGE_HPP
