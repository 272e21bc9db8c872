/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/subsidy_ledger.hpp"

#include <limits>

#include <fmt/core.h>
#include "common/result_try.hpp"
#include "logger/logger.hpp"

using courier::gateway::GatewayError;
using courier::gateway::SubsidyLedger;

namespace {
  courier::expected::Error<GatewayError> ledgerError(GatewayError::Code code,
                                                     std::string description) {
    return courier::expected::makeError(
        GatewayError{code, std::move(description)});
  }
}  // namespace

SubsidyLedger::SubsidyLedger(
    std::shared_ptr<auth::AccessControl> access_control,
    logger::LoggerPtr log)
    : access_control_(std::move(access_control)), log_(std::move(log)) {}

courier::expected::Result<courier::types::Amount, GatewayError>
SubsidyLedger::deposit(types::TenantId tenant, types::Amount amount) {
  auto &account = accounts_[tenant];
  if (amount > std::numeric_limits<types::Amount>::max() - account.balance) {
    return ledgerError(
        GatewayError::Code::kOverflow,
        fmt::format("deposit of {} overflows the balance of tenant {}",
                    amount,
                    tenant));
  }
  account.balance += amount;
  log_->info("tenant {} funded with {}, balance {}",
             tenant,
             amount,
             account.balance);
  return expected::makeValue(account.balance);
}

courier::expected::Result<courier::gateway::Payout, GatewayError>
SubsidyLedger::withdraw(const types::AccountId &caller,
                        types::TenantId tenant,
                        types::Amount amount) {
  COURIER_EXPECTED_ERROR_CHECK(checkConfigurator(caller));
  auto it = accounts_.find(tenant);
  if (it == accounts_.end()) {
    return ledgerError(GatewayError::Code::kUnknownTenant,
                       fmt::format("tenant {} was never funded", tenant));
  }
  auto &account = it->second;
  if (amount > account.balance) {
    return ledgerError(
        GatewayError::Code::kInsufficientSubsidy,
        fmt::format("tenant {} has {}, {} requested",
                    tenant,
                    account.balance,
                    amount));
  }
  account.balance -= amount;
  Payout payout{account.refund.empty() ? caller : account.refund, amount};
  log_->info("{} withdrew {} of tenant {} to {}, balance {}",
             caller,
             amount,
             tenant,
             payout.to,
             account.balance);
  return expected::makeValue(std::move(payout));
}

courier::expected::Result<void, GatewayError> SubsidyLedger::setRefundAddress(
    const types::AccountId &caller,
    types::TenantId tenant,
    types::AccountId address) {
  COURIER_EXPECTED_ERROR_CHECK(checkConfigurator(caller));
  log_->info("refund address of tenant {} set to {}", tenant, address);
  accounts_[tenant].refund = std::move(address);
  return expected::makeValue();
}

courier::types::Amount SubsidyLedger::balance(types::TenantId tenant) const {
  auto it = accounts_.find(tenant);
  return it == accounts_.end() ? 0 : it->second.balance;
}

courier::types::AccountId SubsidyLedger::refundAddress(
    types::TenantId tenant) const {
  auto it = accounts_.find(tenant);
  return it == accounts_.end() ? types::AccountId{} : it->second.refund;
}

courier::expected::Result<void, GatewayError> SubsidyLedger::debit(
    types::TenantId tenant, types::Amount amount) {
  auto it = accounts_.find(tenant);
  const auto available = it == accounts_.end() ? 0 : it->second.balance;
  if (amount > available) {
    return ledgerError(
        GatewayError::Code::kInsufficientSubsidy,
        fmt::format("tenant {} has {}, {} needed", tenant, available, amount));
  }
  if (amount == 0) {
    return expected::makeValue();
  }
  it->second.balance -= amount;
  log_->debug("tenant {} debited {}, balance {}",
              tenant,
              amount,
              it->second.balance);
  return expected::makeValue();
}

courier::expected::Result<void, GatewayError> SubsidyLedger::checkConfigurator(
    const types::AccountId &caller) const {
  return access_control_->check(caller, auth::Role::kConfigurator)
      .match(
          [](const auto &) -> expected::Result<void, GatewayError> {
            return expected::makeValue();
          },
          [](const auto &error) -> expected::Result<void, GatewayError> {
            return ledgerError(GatewayError::Code::kUnauthorized,
                               error.error.description);
          });
}
