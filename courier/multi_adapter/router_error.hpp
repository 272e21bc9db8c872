/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MULTI_ADAPTER_ROUTER_ERROR_HPP
#define COURIER_MULTI_ADAPTER_ROUTER_ERROR_HPP

#include <string>

namespace courier {
  namespace multi_adapter {

    struct RouterError {
      enum class Code {
        // configuration
        kUnauthorized,
        kInvalidSetup,
        kUnknownDestination,
        // transport
        kInsufficientPayment,
        kAdapterFailure,
        kOverflow,
        // inbound
        kMalformedFrame,
        kUnknownAdapter,
        kLocalSource,
        kNoBatchHandler,
        kUnknownBatch,
      };

      Code code;
      std::string description;

      std::string toString() const;
    };

    const char *toString(RouterError::Code code);

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MULTI_ADAPTER_ROUTER_ERROR_HPP
