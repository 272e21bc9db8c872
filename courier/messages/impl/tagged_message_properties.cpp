/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "messages/impl/tagged_message_properties.hpp"

using courier::messages::TaggedMessageProperties;

TaggedMessageProperties::TaggedMessageProperties(
    types::GasLimit default_gas, std::map<uint8_t, types::GasLimit> gas_by_tag)
    : default_gas_(default_gas), gas_by_tag_(std::move(gas_by_tag)) {}

courier::types::TenantId TaggedMessageProperties::tenantOf(
    const types::Bytes &message) const {
  if (message.size() < kHeaderSize) {
    return types::kGlobalTenant;
  }
  types::TenantId tenant = 0;
  for (size_t i = 1; i < kHeaderSize; ++i) {
    tenant = (tenant << 8) | message[i];
  }
  return tenant;
}

courier::types::GasLimit TaggedMessageProperties::gasLimitOf(
    const types::Bytes &message) const {
  if (message.empty()) {
    return default_gas_;
  }
  auto it = gas_by_tag_.find(message.front());
  return it == gas_by_tag_.end() ? default_gas_ : it->second;
}

courier::types::Bytes TaggedMessageProperties::makeMessage(
    uint8_t tag, types::TenantId tenant, const types::Bytes &body) {
  types::Bytes message;
  message.reserve(kHeaderSize + body.size());
  message.push_back(tag);
  for (int shift = 56; shift >= 0; shift -= 8) {
    message.push_back(static_cast<uint8_t>(tenant >> shift));
  }
  message.insert(message.end(), body.begin(), body.end());
  return message;
}
