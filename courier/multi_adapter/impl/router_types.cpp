/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fmt/core.h>
#include "common/string_builder.hpp"
#include "multi_adapter/inbound_outcome.hpp"
#include "multi_adapter/multi_adapter.hpp"
#include "multi_adapter/router_error.hpp"

namespace courier {
  namespace multi_adapter {

    const char *toString(RouterError::Code code) {
      switch (code) {
        case RouterError::Code::kUnauthorized:
          return "Unauthorized";
        case RouterError::Code::kInvalidSetup:
          return "InvalidSetup";
        case RouterError::Code::kUnknownDestination:
          return "UnknownDestination";
        case RouterError::Code::kInsufficientPayment:
          return "InsufficientPayment";
        case RouterError::Code::kAdapterFailure:
          return "AdapterFailure";
        case RouterError::Code::kOverflow:
          return "Overflow";
        case RouterError::Code::kMalformedFrame:
          return "MalformedFrame";
        case RouterError::Code::kUnknownAdapter:
          return "UnknownAdapter";
        case RouterError::Code::kLocalSource:
          return "LocalSource";
        case RouterError::Code::kNoBatchHandler:
          return "NoBatchHandler";
        case RouterError::Code::kUnknownBatch:
          return "UnknownBatch";
      }
      return "Unknown";
    }

    std::string RouterError::toString() const {
      return fmt::format("{}: {}", multi_adapter::toString(code), description);
    }

    const char *toString(InboundStatus status) {
      switch (status) {
        case InboundStatus::kAwaitingPayload:
          return "AwaitingPayload";
        case InboundStatus::kPendingQuorum:
          return "PendingQuorum";
        case InboundStatus::kDelivered:
          return "Delivered";
        case InboundStatus::kAlreadyDelivered:
          return "AlreadyDelivered";
      }
      return "Unknown";
    }

    std::string InboundOutcome::toString() const {
      return detail::PrettyStringBuilder()
          .init("InboundOutcome")
          .appendNamed("hash", hash)
          .appendNamed("status", multi_adapter::toString(status))
          .appendNamed("votes", votes)
          .appendNamed("duplicate_vote", duplicate_vote)
          .finalize();
    }

    std::string SendReceipt::toString() const {
      std::vector<std::string> references;
      for (const auto &receipt : receipts) {
        references.push_back(receipt.reference);
      }
      return detail::PrettyStringBuilder()
          .init("SendReceipt")
          .appendNamed("hash", hash)
          .appendNamed("cost", cost)
          .appendNamed("receipts", references)
          .appendNamed("failed", failed)
          .finalize();
    }

  }  // namespace multi_adapter
}  // namespace courier
