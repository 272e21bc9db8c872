/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/gateway.hpp"

#include <exception>
#include <limits>

#include <fmt/core.h>
#include "crypto/sha3_hash.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "wire/batch_codec.hpp"

using courier::gateway::BatchStage;
using courier::gateway::Gateway;
using courier::gateway::GatewayError;

namespace {
  courier::expected::Error<GatewayError> gatewayError(GatewayError::Code code,
                                                      std::string description) {
    return courier::expected::makeError(
        GatewayError{code, std::move(description)});
  }
}  // namespace

namespace courier {
  namespace gateway {

    const char *toString(GatewayError::Code code) {
      switch (code) {
        case GatewayError::Code::kInvalidMessage:
          return "InvalidMessage";
        case GatewayError::Code::kLocalDestination:
          return "LocalDestination";
        case GatewayError::Code::kOutgoingBlocked:
          return "OutgoingBlocked";
        case GatewayError::Code::kBatchGasLimitExceeded:
          return "BatchGasLimitExceeded";
        case GatewayError::Code::kInsufficientSubsidy:
          return "InsufficientSubsidy";
        case GatewayError::Code::kUnknownTenant:
          return "UnknownTenant";
        case GatewayError::Code::kOverflow:
          return "Overflow";
        case GatewayError::Code::kNothingPending:
          return "NothingPending";
        case GatewayError::Code::kAlreadyBatching:
          return "AlreadyBatching";
        case GatewayError::Code::kNotBatching:
          return "NotBatching";
        case GatewayError::Code::kUnauthorized:
          return "Unauthorized";
        case GatewayError::Code::kRouterFailure:
          return "RouterFailure";
        case GatewayError::Code::kHandlerFailure:
          return "HandlerFailure";
      }
      return "Unknown";
    }

    std::string GatewayError::toString() const {
      return fmt::format("{}: {}", gateway::toString(code), description);
    }

    const char *toString(BatchStage stage) {
      switch (stage) {
        case BatchStage::kAccumulating:
          return "Accumulating";
        case BatchStage::kQuoted:
          return "Quoted";
        case BatchStage::kFunded:
          return "Funded";
        case BatchStage::kSent:
          return "Sent";
      }
      return "Unknown";
    }

  }  // namespace gateway
}  // namespace courier

Gateway::Gateway(
    types::NetworkId local,
    std::shared_ptr<multi_adapter::MultiAdapter> router,
    std::shared_ptr<MessageHandler> handler,
    std::shared_ptr<messages::MessageProperties> message_properties,
    std::shared_ptr<auth::AccessControl> access_control,
    types::GasLimit max_batch_gas_limit,
    logger::LoggerManagerTreePtr log_manager)
    : local_(local),
      router_(std::move(router)),
      handler_(std::move(handler)),
      message_properties_(std::move(message_properties)),
      access_control_(std::move(access_control)),
      max_batch_gas_limit_(max_batch_gas_limit),
      subsidies_(access_control_,
                 log_manager->getChild("SubsidyLedger")->getLogger()),
      batching_(false),
      log_(log_manager->getChild("Gateway")->getLogger()) {}

courier::gateway::SubsidyLedger &Gateway::subsidies() {
  return subsidies_;
}

const courier::gateway::SubsidyLedger &Gateway::subsidies() const {
  return subsidies_;
}

courier::expected::Result<void, GatewayError> Gateway::send(
    types::NetworkId remote, const types::Bytes &message) {
  if (message.empty() or message.size() > wire::kMaxMessageLength) {
    return gatewayError(
        GatewayError::Code::kInvalidMessage,
        fmt::format("message of {} bytes, 1 to {} allowed",
                    message.size(),
                    wire::kMaxMessageLength));
  }
  if (remote == local_) {
    return gatewayError(GatewayError::Code::kLocalDestination,
                        fmt::format("network {} is local", remote));
  }
  const types::RouteKey key{remote, message_properties_->tenantOf(message)};
  if (blocked_.count(key) != 0) {
    return gatewayError(GatewayError::Code::kOutgoingBlocked,
                        fmt::format("outgoing {} is blocked", key));
  }

  const auto gas = message_properties_->gasLimitOf(message);
  auto it = pending_.find(key);
  const types::GasLimit batch_gas = it == pending_.end() ? 0 : it->second.gas;
  if (gas > max_batch_gas_limit_ or batch_gas > max_batch_gas_limit_ - gas) {
    return gatewayError(
        GatewayError::Code::kBatchGasLimitExceeded,
        fmt::format("batch for {} would need {} gas on top of {}, limit {}",
                    key,
                    gas,
                    batch_gas,
                    max_batch_gas_limit_));
  }

  if (batching_ and scope_marks_.count(key) == 0) {
    scope_marks_[key] = it == pending_.end() ? 0 : it->second.messages.size();
    scope_routes_.push_back(key);
  }
  auto &batch = pending_[key];
  batch.messages.push_back(message);
  batch.gas += gas;
  batch.stage = BatchStage::kAccumulating;
  log_->debug("queued message #{} for {}, batch gas {}",
              batch.messages.size(),
              key,
              batch.gas);

  if (not batching_) {
    COURIER_EXPECTED_ERROR_CHECK(flush(key.network, key.tenant));
  }
  return expected::makeValue();
}

courier::expected::Result<void, GatewayError> Gateway::startBatching() {
  if (batching_) {
    return gatewayError(GatewayError::Code::kAlreadyBatching,
                        "batching scope is already open");
  }
  batching_ = true;
  return expected::makeValue();
}

courier::expected::Result<Gateway::SendReceipts, GatewayError>
Gateway::endBatching() {
  if (not batching_) {
    return gatewayError(GatewayError::Code::kNotBatching,
                        "no batching scope is open");
  }
  batching_ = false;
  auto routes = std::move(scope_routes_);
  scope_routes_.clear();
  scope_marks_.clear();

  auto reset_stages = [this](const std::vector<Quote> &quotes) {
    for (const auto &quote : quotes) {
      setStage(quote.key, BatchStage::kAccumulating);
    }
  };

  std::vector<Quote> quotes;
  for (const auto &key : routes) {
    if (pending_.count(key) == 0) {
      continue;
    }
    auto quoted = quote(key);
    if (expected::hasError(quoted)) {
      reset_stages(quotes);
      setStage(key, BatchStage::kAccumulating);
      return expected::makeError(std::move(quoted).assumeError());
    }
    quotes.push_back(std::move(quoted).assumeValue());
  }

  if (auto funded = fund(quotes); expected::hasError(funded)) {
    log_->warn("batching scope not sent: {}", funded.assumeError());
    reset_stages(quotes);
    return expected::makeError(std::move(funded).assumeError());
  }

  SendReceipts receipts;
  for (size_t i = 0; i < quotes.size(); ++i) {
    auto sent = sendQuoted(quotes[i]);
    if (expected::hasError(sent)) {
      log_->error("batching scope stopped after {} of {} batches: {}",
                  i,
                  quotes.size(),
                  sent.assumeError());
      reset_stages(
          std::vector<Quote>(quotes.begin() + i + 1, quotes.end()));
      return expected::makeError(std::move(sent).assumeError());
    }
    receipts.push_back(std::move(sent).assumeValue());
  }
  return expected::makeValue(std::move(receipts));
}

courier::expected::Result<courier::multi_adapter::SendReceipt, GatewayError>
Gateway::flush(types::NetworkId remote, types::TenantId tenant) {
  const types::RouteKey key{remote, tenant};
  COURIER_EXPECTED_TRY_GET_VALUE(quoted, quote(key));
  if (auto funded = fund({quoted}); expected::hasError(funded)) {
    log_->warn("{} stays pending: {}", key, funded.assumeError());
    setStage(key, BatchStage::kAccumulating);
    return expected::makeError(std::move(funded).assumeError());
  }
  return sendQuoted(quoted);
}

courier::expected::Result<void, GatewayError> Gateway::discardPending(
    const types::AccountId &caller,
    types::NetworkId remote,
    types::TenantId tenant) {
  COURIER_EXPECTED_ERROR_CHECK(checkRole(caller, auth::Role::kOperator));
  const types::RouteKey key{remote, tenant};
  auto it = pending_.find(key);
  if (it == pending_.end()) {
    return gatewayError(GatewayError::Code::kNothingPending,
                        fmt::format("nothing pending for {}", key));
  }
  log_->warn("{} discarded {} messages pending for {}",
             caller,
             it->second.messages.size(),
             key);
  pending_.erase(it);
  return expected::makeValue();
}

courier::expected::Result<void, GatewayError> Gateway::setOutgoingBlocked(
    const types::AccountId &caller,
    types::NetworkId remote,
    types::TenantId tenant,
    bool blocked) {
  COURIER_EXPECTED_ERROR_CHECK(checkRole(caller, auth::Role::kConfigurator));
  const types::RouteKey key{remote, tenant};
  if (blocked) {
    blocked_.insert(key);
  } else {
    blocked_.erase(key);
  }
  log_->info("{} set outgoing {} blocked: {}",
             caller,
             key,
             logger::boolRepr(blocked));
  return expected::makeValue();
}

bool Gateway::isOutgoingBlocked(types::NetworkId remote,
                                types::TenantId tenant) const {
  return blocked_.count(types::RouteKey{remote, tenant}) != 0;
}

bool Gateway::isBatching() const {
  return batching_;
}

size_t Gateway::pendingCount(types::NetworkId remote,
                             types::TenantId tenant) const {
  auto it = pending_.find(types::RouteKey{remote, tenant});
  return it == pending_.end() ? 0 : it->second.messages.size();
}

boost::optional<BatchStage> Gateway::stage(types::NetworkId remote,
                                           types::TenantId tenant) const {
  auto it = pending_.find(types::RouteKey{remote, tenant});
  if (it == pending_.end()) {
    return boost::none;
  }
  return it->second.stage;
}

std::vector<courier::types::RouteKey> Gateway::pendingRoutes() const {
  std::vector<types::RouteKey> routes;
  for (const auto &entry : pending_) {
    routes.push_back(entry.first);
  }
  return routes;
}

courier::multi_adapter::DispatchReport Gateway::handleBatch(
    types::NetworkId source, const std::vector<types::Bytes> &messages) {
  multi_adapter::DispatchReport report{0, 0};
  for (const auto &message : messages) {
    if (dispatch(source, message)) {
      ++report.handled;
    } else {
      ++report.failed;
      ++failures_[FailureKey{source, sha3_256(message)}];
    }
  }
  return report;
}

courier::expected::Result<void, GatewayError> Gateway::retry(
    types::NetworkId source, const types::Bytes &message) {
  const FailureKey key{source, sha3_256(message)};
  auto it = failures_.find(key);
  if (it == failures_.end()) {
    return gatewayError(
        GatewayError::Code::kNothingPending,
        fmt::format("message {} from network {} has no failed dispatch",
                    key.second,
                    source));
  }
  if (not dispatch(source, message)) {
    return gatewayError(
        GatewayError::Code::kHandlerFailure,
        fmt::format("message {} from network {} failed again",
                    key.second,
                    source));
  }
  if (--it->second == 0) {
    failures_.erase(it);
  }
  return expected::makeValue();
}

size_t Gateway::failedCount(types::NetworkId source,
                            const hash256_t &hash) const {
  auto it = failures_.find(FailureKey{source, hash});
  return it == failures_.end() ? 0 : it->second;
}

courier::expected::Result<Gateway::Quote, GatewayError> Gateway::quote(
    const types::RouteKey &key) {
  auto it = pending_.find(key);
  if (it == pending_.end()) {
    return gatewayError(GatewayError::Code::kNothingPending,
                        fmt::format("nothing pending for {}", key));
  }
  auto packed = wire::pack(it->second.messages);
  if (expected::hasError(packed)) {
    return gatewayError(GatewayError::Code::kInvalidMessage,
                        packed.assumeError().toString());
  }
  Quote quote{key, std::move(packed).assumeValue(), it->second.gas, 0};
  auto cost =
      router_->estimate(key.network, key.tenant, quote.batch, quote.gas);
  if (expected::hasError(cost)) {
    return gatewayError(GatewayError::Code::kRouterFailure,
                        cost.assumeError().toString());
  }
  quote.cost = cost.assumeValue();
  setStage(key, BatchStage::kQuoted);
  return expected::makeValue(std::move(quote));
}

courier::expected::Result<void, GatewayError> Gateway::fund(
    const std::vector<Quote> &quotes) {
  std::map<types::TenantId, types::Amount> totals;
  for (const auto &quote : quotes) {
    auto &total = totals[quote.key.tenant];
    if (quote.cost > std::numeric_limits<types::Amount>::max() - total) {
      return gatewayError(
          GatewayError::Code::kOverflow,
          fmt::format("cost of tenant {} overflows", quote.key.tenant));
    }
    total += quote.cost;
  }
  for (const auto &total : totals) {
    const auto balance = subsidies_.balance(total.first);
    if (total.second > balance) {
      return gatewayError(
          GatewayError::Code::kInsufficientSubsidy,
          fmt::format("tenant {} has {}, batches cost {}",
                      total.first,
                      balance,
                      total.second));
    }
  }
  for (const auto &quote : quotes) {
    setStage(quote.key, BatchStage::kFunded);
  }
  return expected::makeValue();
}

courier::expected::Result<courier::multi_adapter::SendReceipt, GatewayError>
Gateway::sendQuoted(const Quote &quote) {
  const auto &key = quote.key;
  auto sent = router_->send(key.network,
                            key.tenant,
                            quote.batch,
                            quote.gas,
                            quote.cost,
                            subsidies_.refundAddress(key.tenant));
  if (expected::hasError(sent)) {
    setStage(key, BatchStage::kAccumulating);
    return gatewayError(GatewayError::Code::kRouterFailure,
                        sent.assumeError().toString());
  }
  // the batch is out, it must not be packed or sent again
  setStage(key, BatchStage::kSent);
  pending_.erase(key);
  auto receipt = std::move(sent).assumeValue();
  if (not receipt.failed.empty()) {
    log_->warn("batch {} for {} sent without the proofs of {} adapters",
               receipt.hash,
               key,
               receipt.failed.size());
  }
  if (auto debited = subsidies_.debit(key.tenant, quote.cost);
      expected::hasError(debited)) {
    log_->critical("batch {} for {} sent but not paid: {}",
                   receipt.hash,
                   key,
                   debited.assumeError());
    return expected::makeError(std::move(debited).assumeError());
  }
  return expected::makeValue(std::move(receipt));
}

void Gateway::setStage(const types::RouteKey &key, BatchStage stage) {
  auto it = pending_.find(key);
  if (it == pending_.end() or it->second.stage == stage) {
    return;
  }
  log_->debug("batch for {}: {} -> {}",
              key,
              toString(it->second.stage),
              toString(stage));
  it->second.stage = stage;
}

void Gateway::rollbackBatching() {
  for (const auto &key : scope_routes_) {
    auto it = pending_.find(key);
    if (it == pending_.end()) {
      continue;
    }
    const auto mark = scope_marks_[key];
    if (mark == 0) {
      pending_.erase(it);
      continue;
    }
    auto &batch = it->second;
    batch.messages.resize(mark);
    batch.gas = 0;
    for (const auto &message : batch.messages) {
      batch.gas += message_properties_->gasLimitOf(message);
    }
  }
  log_->info("batching scope rolled back, {} routes touched",
             scope_routes_.size());
  batching_ = false;
  scope_routes_.clear();
  scope_marks_.clear();
}

bool Gateway::dispatch(types::NetworkId source, const types::Bytes &message) {
  try {
    auto result = handler_->handle(source, message);
    if (expected::hasError(result)) {
      log_->warn("message {} from network {} failed: {}",
                 sha3_256(message),
                 source,
                 result.assumeError());
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    log_->error("message {} from network {} threw: {}",
                sha3_256(message),
                source,
                e.what());
    return false;
  }
}

courier::expected::Result<void, GatewayError> Gateway::checkRole(
    const types::AccountId &caller, auth::Role role) const {
  return access_control_->check(caller, role)
      .match(
          [](const auto &) -> expected::Result<void, GatewayError> {
            return expected::makeValue();
          },
          [](const auto &error) -> expected::Result<void, GatewayError> {
            return gatewayError(GatewayError::Code::kUnauthorized,
                                error.error.description);
          });
}
