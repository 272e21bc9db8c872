/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "multi_adapter/adapter_registry.hpp"

#include <fmt/core.h>
#include "logger/logger.hpp"

using courier::multi_adapter::AdapterRegistry;
using courier::multi_adapter::RouterError;

AdapterRegistry::AdapterRegistry(types::NetworkId local,
                                 logger::LoggerPtr log)
    : local_(local), log_(std::move(log)) {}

courier::expected::Result<void, RouterError> AdapterRegistry::file(
    const types::RouteKey &key, AdapterSetup setup) {
  if (key.network == local_) {
    return expected::makeError(
        RouterError{RouterError::Code::kInvalidSetup,
                    fmt::format("network {} is the local network", local_)});
  }
  if (auto invalid = validate(setup); expected::hasError(invalid)) {
    return expected::makeError(RouterError{
        RouterError::Code::kInvalidSetup,
        fmt::format("{}: {}", key, std::move(invalid).assumeError())});
  }
  log_->info("filed {} for {}", setup, key);
  setups_[key] = std::make_shared<const AdapterSetup>(std::move(setup));
  return expected::makeValue();
}

bool AdapterRegistry::unfile(const types::RouteKey &key) {
  if (setups_.erase(key) == 0) {
    return false;
  }
  log_->info("unfiled {}", key);
  return true;
}

AdapterRegistry::SetupPtr AdapterRegistry::find(types::NetworkId remote,
                                                types::TenantId tenant) const {
  auto it = setups_.find(types::RouteKey{remote, tenant});
  if (it == setups_.end() and tenant != types::kGlobalTenant) {
    it = setups_.find(types::RouteKey{remote, types::kGlobalTenant});
  }
  return it == setups_.end() ? nullptr : it->second;
}

bool AdapterRegistry::isKnownAdapter(types::NetworkId remote,
                                     const types::AdapterId &id) const {
  for (auto it = setups_.lower_bound(types::RouteKey{remote, 0});
       it != setups_.end() and it->first.network == remote;
       ++it) {
    if (it->second->contains(id)) {
      return true;
    }
  }
  return false;
}

std::vector<courier::types::RouteKey> AdapterRegistry::routes() const {
  std::vector<types::RouteKey> keys;
  keys.reserve(setups_.size());
  for (const auto &entry : setups_) {
    keys.push_back(entry.first);
  }
  return keys;
}
