/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MULTI_ADAPTER_ADAPTER_REGISTRY_HPP
#define COURIER_MULTI_ADAPTER_ADAPTER_REGISTRY_HPP

#include <map>
#include <memory>
#include <vector>

#include "common/result.hpp"
#include "logger/logger_fwd.hpp"
#include "model/types.hpp"
#include "multi_adapter/adapter_setup.hpp"
#include "multi_adapter/router_error.hpp"

namespace courier {
  namespace multi_adapter {

    /**
     * Keyed store of adapter setups. A stored setup is immutable, filing
     * replaces it as a whole.
     */
    class AdapterRegistry {
     public:
      using SetupPtr = std::shared_ptr<const AdapterSetup>;

      AdapterRegistry(types::NetworkId local, logger::LoggerPtr log);

      /// Validate and store the setup, replacing the previous one for key
      expected::Result<void, RouterError> file(const types::RouteKey &key,
                                               AdapterSetup setup);

      /// @return whether a setup was removed
      bool unfile(const types::RouteKey &key);

      /**
       * Find the setup for the tenant, falling back to the setup of
       * kGlobalTenant
       */
      SetupPtr find(types::NetworkId remote, types::TenantId tenant) const;

      /// @return whether the adapter is registered for remote under any tenant
      bool isKnownAdapter(types::NetworkId remote,
                          const types::AdapterId &id) const;

      std::vector<types::RouteKey> routes() const;

     private:
      const types::NetworkId local_;
      std::map<types::RouteKey, SetupPtr> setups_;
      logger::LoggerPtr log_;
    };

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MULTI_ADAPTER_ADAPTER_REGISTRY_HPP
