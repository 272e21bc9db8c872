/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MULTI_ADAPTER_ADAPTER_SETUP_HPP
#define COURIER_MULTI_ADAPTER_ADAPTER_SETUP_HPP

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include "adapter/adapter.hpp"
#include "common/result.hpp"

namespace courier {
  namespace multi_adapter {

    constexpr size_t kMaxAdapterCount = 8;

    /**
     * Registration of adapters for one (remote network, tenant) pair.
     * Adapters at [0, recovery_index) send and vote, adapters at
     * [recovery_index, size) only vote.
     */
    struct AdapterSetup {
      std::vector<std::shared_ptr<adapter::Adapter>> adapters;
      /// distinct member votes required for delivery
      size_t threshold;
      /// adapter carrying the full batch outbound
      size_t primary_index;
      /// first receive-only adapter
      size_t recovery_index;

      boost::optional<size_t> indexOf(const types::AdapterId &id) const;

      bool contains(const types::AdapterId &id) const;

      std::string toString() const;
    };

    /**
     * Check the registration invariants:
     * 1 <= threshold <= recovery_index <= adapters.size() <= kMaxAdapterCount,
     * primary_index < recovery_index, adapters present with unique ids.
     * @return error description if violated
     */
    expected::Result<void, std::string> validate(const AdapterSetup &setup);

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MULTI_ADAPTER_ADAPTER_SETUP_HPP
