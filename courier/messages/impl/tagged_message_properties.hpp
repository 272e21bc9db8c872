/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MESSAGES_TAGGED_MESSAGE_PROPERTIES_HPP
#define COURIER_MESSAGES_TAGGED_MESSAGE_PROPERTIES_HPP

#include "messages/message_properties.hpp"

#include <map>

namespace courier {
  namespace messages {

    /**
     * Properties of messages laid out as [tag: u8][tenant: u64 big-endian]
     * [body]. Gas is looked up by tag. Messages too short to carry a tenant
     * belong to kGlobalTenant.
     */
    class TaggedMessageProperties : public MessageProperties {
     public:
      static constexpr size_t kHeaderSize = 1 + sizeof(types::TenantId);

      TaggedMessageProperties(types::GasLimit default_gas,
                              std::map<uint8_t, types::GasLimit> gas_by_tag);

      types::TenantId tenantOf(const types::Bytes &message) const override;

      types::GasLimit gasLimitOf(const types::Bytes &message) const override;

      /// Build a message in this layout
      static types::Bytes makeMessage(uint8_t tag,
                                      types::TenantId tenant,
                                      const types::Bytes &body);

     private:
      types::GasLimit default_gas_;
      std::map<uint8_t, types::GasLimit> gas_by_tag_;
    };

  }  // namespace messages
}  // namespace courier

#endif  // COURIER_MESSAGES_TAGGED_MESSAGE_PROPERTIES_HPP
