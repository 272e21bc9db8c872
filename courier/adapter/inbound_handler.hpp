/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_ADAPTER_INBOUND_HANDLER_HPP
#define COURIER_ADAPTER_INBOUND_HANDLER_HPP

#include "common/result.hpp"
#include "model/types.hpp"
#include "multi_adapter/inbound_outcome.hpp"
#include "multi_adapter/router_error.hpp"

namespace courier {
  namespace adapter {

    /// Entry point a binding calls when its transport delivers bytes
    class InboundHandler {
     public:
      virtual ~InboundHandler() = default;

      /**
       * @param source - network the bytes came from
       * @param payload - batch or proof frame as delivered
       * @param reporter - id() of the delivering adapter
       */
      virtual expected::Result<multi_adapter::InboundOutcome,
                               multi_adapter::RouterError>
      handle(types::NetworkId source,
             const types::Bytes &payload,
             const types::AdapterId &reporter) = 0;
    };

  }  // namespace adapter
}  // namespace courier

#endif  // COURIER_ADAPTER_INBOUND_HANDLER_HPP
