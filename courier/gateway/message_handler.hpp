/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_GATEWAY_MESSAGE_HANDLER_HPP
#define COURIER_GATEWAY_MESSAGE_HANDLER_HPP

#include <string>

#include "common/result.hpp"
#include "model/types.hpp"

namespace courier {
  namespace gateway {

    /**
     * Domain logic receiving delivered sub-messages. Must not re-enter the
     * router or the gateway inbound path.
     */
    class MessageHandler {
     public:
      virtual ~MessageHandler() = default;

      /**
       * @param source - network the message came from
       * @param message - one decoded sub-message
       * @return error description if the message could not be applied
       */
      virtual expected::Result<void, std::string> handle(
          types::NetworkId source, const types::Bytes &message) = 0;
    };

  }  // namespace gateway
}  // namespace courier

#endif  // COURIER_GATEWAY_MESSAGE_HANDLER_HPP
