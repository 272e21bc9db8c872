/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MULTI_ADAPTER_BATCH_HANDLER_HPP
#define COURIER_MULTI_ADAPTER_BATCH_HANDLER_HPP

#include <vector>

#include "model/types.hpp"

namespace courier {
  namespace multi_adapter {

    struct DispatchReport {
      size_t handled;
      size_t failed;
    };

    /// Receiver of quorum confirmed batches
    class BatchHandler {
     public:
      virtual ~BatchHandler() = default;

      /**
       * Called exactly once per delivered batch
       * @param source - network the batch came from
       * @param messages - decoded sub-messages in framed order
       */
      virtual DispatchReport handleBatch(
          types::NetworkId source,
          const std::vector<types::Bytes> &messages) = 0;
    };

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MULTI_ADAPTER_BATCH_HANDLER_HPP
