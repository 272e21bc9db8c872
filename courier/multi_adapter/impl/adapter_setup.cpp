/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "multi_adapter/adapter_setup.hpp"

#include <set>

#include <fmt/core.h>
#include "common/string_builder.hpp"

using courier::multi_adapter::AdapterSetup;

boost::optional<size_t> AdapterSetup::indexOf(
    const types::AdapterId &id) const {
  for (size_t i = 0; i < adapters.size(); ++i) {
    if (adapters[i] and adapters[i]->id() == id) {
      return i;
    }
  }
  return boost::none;
}

bool AdapterSetup::contains(const types::AdapterId &id) const {
  return static_cast<bool>(indexOf(id));
}

std::string AdapterSetup::toString() const {
  std::vector<types::AdapterId> ids;
  for (const auto &adapter : adapters) {
    ids.push_back(adapter ? adapter->id() : "(null)");
  }
  return detail::PrettyStringBuilder()
      .init("AdapterSetup")
      .appendNamed("adapters", ids)
      .appendNamed("threshold", threshold)
      .appendNamed("primary_index", primary_index)
      .appendNamed("recovery_index", recovery_index)
      .finalize();
}

courier::expected::Result<void, std::string>
courier::multi_adapter::validate(const AdapterSetup &setup) {
  const auto size = setup.adapters.size();
  if (size == 0) {
    return expected::makeError(std::string{"no adapters given"});
  }
  if (size > kMaxAdapterCount) {
    return expected::makeError(fmt::format(
        "{} adapters given, at most {} allowed", size, kMaxAdapterCount));
  }
  std::set<types::AdapterId> ids;
  for (const auto &adapter : setup.adapters) {
    if (not adapter) {
      return expected::makeError(std::string{"null adapter given"});
    }
    if (not ids.insert(adapter->id()).second) {
      return expected::makeError(
          fmt::format("adapter {} is given twice", adapter->id()));
    }
  }
  if (setup.threshold == 0) {
    return expected::makeError(std::string{"threshold must be positive"});
  }
  if (setup.recovery_index > size) {
    return expected::makeError(
        fmt::format("recovery index {} exceeds adapter count {}",
                    setup.recovery_index,
                    size));
  }
  if (setup.threshold > setup.recovery_index) {
    return expected::makeError(
        fmt::format("threshold {} exceeds recovery index {}",
                    setup.threshold,
                    setup.recovery_index));
  }
  if (setup.primary_index >= setup.recovery_index) {
    return expected::makeError(
        fmt::format("primary index {} is not a sending adapter, recovery "
                    "index is {}",
                    setup.primary_index,
                    setup.recovery_index));
  }
  return expected::makeValue();
}
