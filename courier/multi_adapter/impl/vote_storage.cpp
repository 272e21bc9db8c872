/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "multi_adapter/vote_storage.hpp"

using courier::multi_adapter::VoteRecord;
using courier::multi_adapter::VoteStorage;

VoteRecord &VoteStorage::getOrCreate(types::NetworkId source,
                                     const hash256_t &hash) {
  return records_[source][hash];
}

boost::optional<const VoteRecord &> VoteStorage::find(
    types::NetworkId source, const hash256_t &hash) const {
  auto network = records_.find(source);
  if (network == records_.end()) {
    return boost::none;
  }
  auto record = network->second.find(hash);
  if (record == network->second.end()) {
    return boost::none;
  }
  return record->second;
}

bool VoteStorage::erase(types::NetworkId source, const hash256_t &hash) {
  auto network = records_.find(source);
  if (network == records_.end()) {
    return false;
  }
  return network->second.erase(hash) > 0;
}

std::vector<courier::hash256_t> VoteStorage::pending(
    types::NetworkId source) const {
  std::vector<hash256_t> hashes;
  auto network = records_.find(source);
  if (network == records_.end()) {
    return hashes;
  }
  for (const auto &entry : network->second) {
    if (not entry.second.isDelivered()) {
      hashes.push_back(entry.first);
    }
  }
  return hashes;
}

size_t VoteStorage::size() const {
  size_t total = 0;
  for (const auto &network : records_) {
    total += network.second.size();
  }
  return total;
}
