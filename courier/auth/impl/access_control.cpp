/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auth/access_control.hpp"

#include <algorithm>

#include <fmt/core.h>
#include "logger/logger.hpp"

using courier::auth::AccessControl;
using courier::auth::AuthError;

namespace {
  size_t roleIndex(courier::auth::Role role) {
    return static_cast<size_t>(role);
  }
}  // namespace

const char *courier::auth::toString(Role role) {
  switch (role) {
    case Role::kConfigurator:
      return "configurator";
    case Role::kOperator:
      return "operator";
    case Role::COUNT:
      break;
  }
  return "unknown";
}

std::string AuthError::toString() const {
  return fmt::format(
      "{}: {}",
      code == Code::kUnauthorized ? "Unauthorized" : "LastConfigurator",
      description);
}

AccessControl::AccessControl(
    const std::vector<types::AccountId> &configurators,
    const std::vector<types::AccountId> &operators,
    logger::LoggerPtr log)
    : log_(std::move(log)) {
  for (const auto &account : configurators) {
    roles_[account].set(roleIndex(Role::kConfigurator));
  }
  for (const auto &account : operators) {
    roles_[account].set(roleIndex(Role::kOperator));
  }
}

bool AccessControl::hasRole(const types::AccountId &account, Role role) const {
  auto it = roles_.find(account);
  return it != roles_.end() and it->second.test(roleIndex(role));
}

courier::expected::Result<void, AuthError> AccessControl::check(
    const types::AccountId &caller, Role role) const {
  if (not hasRole(caller, role)) {
    return expected::makeError(AuthError{
        AuthError::Code::kUnauthorized,
        fmt::format("{} lacks the {} role", caller, toString(role))});
  }
  return expected::makeValue();
}

courier::expected::Result<void, AuthError> AccessControl::grant(
    const types::AccountId &caller,
    const types::AccountId &account,
    Role role) {
  if (auto error = check(caller, Role::kConfigurator);
      expected::hasError(error)) {
    return error;
  }
  roles_[account].set(roleIndex(role));
  log_->info("{} granted {} to {}", caller, toString(role), account);
  return expected::makeValue();
}

courier::expected::Result<void, AuthError> AccessControl::revoke(
    const types::AccountId &caller,
    const types::AccountId &account,
    Role role) {
  if (auto error = check(caller, Role::kConfigurator);
      expected::hasError(error)) {
    return error;
  }
  if (not hasRole(account, role)) {
    return expected::makeValue();
  }
  if (role == Role::kConfigurator and holders(Role::kConfigurator) == 1) {
    return expected::makeError(
        AuthError{AuthError::Code::kLastConfigurator,
                  fmt::format("{} is the last configurator", account)});
  }
  roles_[account].reset(roleIndex(role));
  log_->info("{} revoked {} from {}", caller, toString(role), account);
  return expected::makeValue();
}

size_t AccessControl::holders(Role role) const {
  return std::count_if(roles_.begin(), roles_.end(), [role](const auto &entry) {
    return entry.second.test(roleIndex(role));
  });
}
