/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_MOCK_BATCH_HANDLER_HPP
#define COURIER_MOCK_BATCH_HANDLER_HPP

#include <gmock/gmock.h>

#include "multi_adapter/batch_handler.hpp"
#include "multi_adapter/multi_adapter.hpp"
#include "framework/result_gtest_checkers.hpp"

namespace courier {
  namespace multi_adapter {

    class MockBatchHandler : public BatchHandler {
     public:
      MOCK_METHOD2(handleBatch,
                   DispatchReport(types::NetworkId,
                                  const std::vector<types::Bytes> &));
    };

    class MockMultiAdapter : public MultiAdapter {
     public:
      MOCK_CONST_METHOD4(
          estimate,
          expected::Result<types::Amount, RouterError>(types::NetworkId,
                                                       types::TenantId,
                                                       const types::Bytes &,
                                                       types::GasLimit));

      MOCK_METHOD6(send,
                   expected::Result<SendReceipt, RouterError>(
                       types::NetworkId,
                       types::TenantId,
                       const types::Bytes &,
                       types::GasLimit,
                       types::Amount,
                       const types::AccountId &));
    };

  }  // namespace multi_adapter
}  // namespace courier

#endif  // COURIER_MOCK_BATCH_HANDLER_HPP
