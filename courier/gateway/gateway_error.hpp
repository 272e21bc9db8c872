/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_GATEWAY_GATEWAY_ERROR_HPP
#define COURIER_GATEWAY_GATEWAY_ERROR_HPP

#include <string>

namespace courier {
  namespace gateway {

    struct GatewayError {
      enum class Code {
        // outbound validation
        kInvalidMessage,
        kLocalDestination,
        kOutgoingBlocked,
        kBatchGasLimitExceeded,
        // funding
        kInsufficientSubsidy,
        kUnknownTenant,
        kOverflow,
        // batching
        kNothingPending,
        kAlreadyBatching,
        kNotBatching,
        // other
        kUnauthorized,
        kRouterFailure,
        kHandlerFailure,
      };

      Code code;
      std::string description;

      std::string toString() const;
    };

    const char *toString(GatewayError::Code code);

  }  // namespace gateway
}  // namespace courier

#endif  // COURIER_GATEWAY_GATEWAY_ERROR_HPP
