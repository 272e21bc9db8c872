/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MODEL_TYPES_HPP
#define COURIER_MODEL_TYPES_HPP

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

#include <fmt/core.h>

namespace courier {
  namespace types {

    /// Identifier of a ledger network
    using NetworkId = uint16_t;
    /// Owner scope of a message, a pool in the ledger domain
    using TenantId = uint64_t;
    /// Stable identity of an adapter, used as the voter id
    using AdapterId = std::string;
    /// Caller identity for role checks, also used as refund address
    using AccountId = std::string;
    /// Amount of the native currency
    using Amount = uint64_t;
    using GasLimit = uint64_t;
    using Bytes = std::vector<uint8_t>;

    /// Tenant whose configuration applies when no tenant specific one exists
    constexpr TenantId kGlobalTenant = 0;

    /// Key of per destination state
    struct RouteKey {
      NetworkId network;
      TenantId tenant;

      bool operator<(const RouteKey &other) const {
        return std::tie(network, tenant)
            < std::tie(other.network, other.tenant);
      }

      bool operator==(const RouteKey &other) const {
        return network == other.network and tenant == other.tenant;
      }

      std::string toString() const {
        return fmt::format("network {} tenant {}", network, tenant);
      }
    };

  }  // namespace types
}  // namespace courier

#endif  // COURIER_MODEL_TYPES_HPP
