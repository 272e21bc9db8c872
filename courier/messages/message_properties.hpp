/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MESSAGES_MESSAGE_PROPERTIES_HPP
#define COURIER_MESSAGES_MESSAGE_PROPERTIES_HPP

#include "model/types.hpp"

namespace courier {
  namespace messages {

    /// Domain knowledge the transport layer needs about a sub-message
    class MessageProperties {
     public:
      virtual ~MessageProperties() = default;

      /// @return tenant owning the message, kGlobalTenant if unknown
      virtual types::TenantId tenantOf(const types::Bytes &message) const = 0;

      /// @return gas needed to execute the message on the destination
      virtual types::GasLimit gasLimitOf(
          const types::Bytes &message) const = 0;
    };

  }  // namespace messages
}  // namespace courier

#endif  // COURIER_MESSAGES_MESSAGE_PROPERTIES_HPP
