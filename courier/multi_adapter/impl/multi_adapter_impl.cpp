/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "multi_adapter/impl/multi_adapter_impl.hpp"

#include <limits>

#include <fmt/core.h>
#include "common/result_try.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "wire/batch_codec.hpp"

using courier::multi_adapter::InboundOutcome;
using courier::multi_adapter::InboundStatus;
using courier::multi_adapter::MultiAdapterImpl;
using courier::multi_adapter::RouterError;

namespace {

  courier::expected::Error<RouterError> routerError(RouterError::Code code,
                                                    std::string description) {
    return courier::expected::makeError(
        RouterError{code, std::move(description)});
  }

  /**
   * Sum the estimates of the sending adapters, the primary one for the
   * batch and the others for the proof
   */
  courier::expected::Result<courier::types::Amount, RouterError> quote(
      const courier::multi_adapter::AdapterSetup &setup,
      courier::types::NetworkId remote,
      const courier::types::Bytes &batch,
      const courier::types::Bytes &proof,
      courier::types::GasLimit gas_limit) {
    courier::types::Amount total = 0;
    for (size_t i = 0; i < setup.recovery_index; ++i) {
      const auto &frame = i == setup.primary_index ? batch : proof;
      auto fee = setup.adapters[i]->estimate(remote, frame, gas_limit);
      if (fee > std::numeric_limits<courier::types::Amount>::max() - total) {
        return routerError(
            RouterError::Code::kOverflow,
            fmt::format("estimate overflows at adapter {}",
                        setup.adapters[i]->id()));
      }
      total += fee;
    }
    return courier::expected::makeValue(total);
  }

}  // namespace

MultiAdapterImpl::MultiAdapterImpl(
    types::NetworkId local,
    std::shared_ptr<auth::AccessControl> access_control,
    std::shared_ptr<messages::MessageProperties> message_properties,
    logger::LoggerManagerTreePtr log_manager)
    : local_(local),
      access_control_(std::move(access_control)),
      message_properties_(std::move(message_properties)),
      registry_(local, log_manager->getChild("Registry")->getLogger()),
      log_(log_manager->getChild("MultiAdapter")->getLogger()) {}

courier::types::NetworkId MultiAdapterImpl::local() const {
  return local_;
}

void MultiAdapterImpl::setBatchHandler(std::weak_ptr<BatchHandler> handler) {
  batch_handler_ = std::move(handler);
}

courier::expected::Result<void, RouterError> MultiAdapterImpl::file(
    const types::AccountId &caller,
    types::NetworkId remote,
    types::TenantId tenant,
    std::vector<std::shared_ptr<adapter::Adapter>> adapters,
    size_t threshold,
    size_t primary_index,
    size_t recovery_index) {
  COURIER_EXPECTED_ERROR_CHECK(checkRole(caller, auth::Role::kConfigurator));
  log_->info("{} files adapters for network {} tenant {}",
             caller,
             remote,
             tenant);
  return registry_.file(
      types::RouteKey{remote, tenant},
      AdapterSetup{
          std::move(adapters), threshold, primary_index, recovery_index});
}

courier::expected::Result<void, RouterError> MultiAdapterImpl::unfile(
    const types::AccountId &caller,
    types::NetworkId remote,
    types::TenantId tenant) {
  COURIER_EXPECTED_ERROR_CHECK(checkRole(caller, auth::Role::kConfigurator));
  if (not registry_.unfile(types::RouteKey{remote, tenant})) {
    return routerError(
        RouterError::Code::kUnknownDestination,
        fmt::format("nothing filed for network {} tenant {}", remote, tenant));
  }
  return expected::makeValue();
}

courier::multi_adapter::AdapterRegistry::SetupPtr MultiAdapterImpl::setup(
    types::NetworkId remote, types::TenantId tenant) const {
  return registry_.find(remote, tenant);
}

courier::expected::Result<courier::types::Amount, RouterError>
MultiAdapterImpl::estimate(types::NetworkId remote,
                           types::TenantId tenant,
                           const types::Bytes &batch,
                           types::GasLimit gas_limit) const {
  auto found = registry_.find(remote, tenant);
  if (not found) {
    return routerError(
        RouterError::Code::kUnknownDestination,
        fmt::format("no adapters for network {} tenant {}", remote, tenant));
  }
  return quote(*found,
               remote,
               batch,
               wire::packProof(wire::batchHash(batch)),
               gas_limit);
}

courier::expected::Result<courier::multi_adapter::SendReceipt, RouterError>
MultiAdapterImpl::send(types::NetworkId remote,
                       types::TenantId tenant,
                       const types::Bytes &batch,
                       types::GasLimit gas_limit,
                       types::Amount payment,
                       const types::AccountId &refund) {
  auto decoded = wire::unpack(batch);
  if (expected::hasError(decoded)) {
    return routerError(RouterError::Code::kMalformedFrame,
                       decoded.assumeError().toString());
  }
  COURIER_EXPECTED_ERROR_CHECK(checkSingleTenant(decoded.assumeValue()));
  auto found = registry_.find(remote, tenant);
  if (not found) {
    return routerError(
        RouterError::Code::kUnknownDestination,
        fmt::format("no adapters for network {} tenant {}", remote, tenant));
  }
  const auto &setup = *found;

  SendReceipt receipt;
  receipt.hash = wire::batchHash(batch);
  const auto proof = wire::packProof(receipt.hash);
  COURIER_EXPECTED_TRY_GET_VALUE(cost,
                                 quote(setup, remote, batch, proof, gas_limit));
  if (payment < cost) {
    return routerError(
        RouterError::Code::kInsufficientPayment,
        fmt::format("payment {} is below the estimate {}", payment, cost));
  }
  receipt.cost = cost;

  // the batch goes first: until it is out nothing is committed
  const auto &primary = setup.adapters[setup.primary_index];
  auto carried = primary->send(remote, batch, gas_limit, refund);
  if (expected::hasError(carried)) {
    log_->error("primary adapter {} failed to send batch {}: {}",
                primary->id(),
                receipt.hash,
                carried.assumeError());
    return routerError(
        RouterError::Code::kAdapterFailure,
        fmt::format("{}: {}", primary->id(), std::move(carried).assumeError()));
  }
  receipt.receipts.push_back(std::move(carried).assumeValue());

  for (size_t i = 0; i < setup.recovery_index; ++i) {
    if (i == setup.primary_index) {
      continue;
    }
    const auto &adapter = setup.adapters[i];
    auto sent = adapter->send(remote, proof, gas_limit, refund);
    if (expected::hasError(sent)) {
      log_->warn("adapter {} failed to send the proof of batch {}: {}",
                 adapter->id(),
                 receipt.hash,
                 sent.assumeError());
      receipt.failed.push_back(adapter->id());
      continue;
    }
    receipt.receipts.push_back(std::move(sent).assumeValue());
  }

  log_->info("sent batch {} to network {} via {} adapters, cost {}",
             receipt.hash,
             remote,
             receipt.receipts.size(),
             receipt.cost);
  return expected::makeValue(std::move(receipt));
}

courier::expected::Result<InboundOutcome, RouterError> MultiAdapterImpl::handle(
    types::NetworkId source,
    const types::Bytes &payload,
    const types::AdapterId &reporter) {
  COURIER_EXPECTED_TRY_GET_VALUE(handler, checkInbound(source));
  if (not registry_.isKnownAdapter(source, reporter)) {
    log_->warn("unknown adapter {} reported for network {}", reporter, source);
    return routerError(
        RouterError::Code::kUnknownAdapter,
        fmt::format("{} is not filed for network {}", reporter, source));
  }
  COURIER_EXPECTED_TRY_GET_VALUE(frame, classify(payload));

  auto &record = votes_.getOrCreate(source, frame.hash);
  if (record.isDelivered()) {
    log_->debug("batch {} from network {} already delivered, {} ignored",
                frame.hash,
                source,
                reporter);
    return expected::makeValue(
        InboundOutcome{frame.hash,
                       InboundStatus::kAlreadyDelivered,
                       record.voters().size(),
                       record.voters().count(reporter) > 0});
  }

  const bool duplicate_vote = not record.addVote(reporter);
  log_->debug("{} of batch {} from network {} reported by {}{}",
              frame.messages ? "payload" : "proof",
              frame.hash,
              source,
              reporter,
              duplicate_vote ? " again" : "");
  if (frame.messages) {
    record.attachPayload(std::move(*frame.messages));
  }
  return expected::makeValue(
      tryDeliver(source, frame.hash, record, *handler, duplicate_vote));
}

courier::expected::Result<InboundOutcome, RouterError>
MultiAdapterImpl::recover(const types::AccountId &caller,
                          types::NetworkId source,
                          const types::Bytes &payload) {
  COURIER_EXPECTED_ERROR_CHECK(checkRole(caller, auth::Role::kOperator));
  COURIER_EXPECTED_TRY_GET_VALUE(handler, checkInbound(source));
  if (wire::isProofFrame(payload)) {
    return routerError(RouterError::Code::kMalformedFrame,
                       "recovery needs the batch bytes, got a proof");
  }
  COURIER_EXPECTED_TRY_GET_VALUE(frame, classify(payload));

  auto &record = votes_.getOrCreate(source, frame.hash);
  if (record.isDelivered()) {
    return expected::makeValue(InboundOutcome{frame.hash,
                                              InboundStatus::kAlreadyDelivered,
                                              record.voters().size(),
                                              false});
  }
  log_->info("{} supplied the payload of batch {} from network {}",
             caller,
             frame.hash,
             source);
  record.attachPayload(std::move(*frame.messages));
  return expected::makeValue(
      tryDeliver(source, frame.hash, record, *handler, false));
}

boost::optional<courier::multi_adapter::VoteState> MultiAdapterImpl::voteState(
    types::NetworkId source, const hash256_t &hash) const {
  if (auto record = votes_.find(source, hash)) {
    return record->snapshot();
  }
  return boost::none;
}

std::vector<courier::hash256_t> MultiAdapterImpl::pendingHashes(
    types::NetworkId source) const {
  return votes_.pending(source);
}

courier::expected::Result<void, RouterError> MultiAdapterImpl::purge(
    const types::AccountId &caller,
    types::NetworkId source,
    const hash256_t &hash) {
  COURIER_EXPECTED_ERROR_CHECK(checkRole(caller, auth::Role::kOperator));
  auto record = votes_.find(source, hash);
  if (not record or record->isDelivered()) {
    return routerError(
        RouterError::Code::kUnknownBatch,
        fmt::format("no undelivered batch {} from network {}", hash, source));
  }
  log_->warn("{} purged batch {} from network {} with {} votes",
             caller,
             hash,
             source,
             record->voters().size());
  votes_.erase(source, hash);
  return expected::makeValue();
}

courier::expected::Result<MultiAdapterImpl::Frame, RouterError>
MultiAdapterImpl::classify(const types::Bytes &payload) const {
  if (wire::isProofFrame(payload)) {
    return wire::unpackProof(payload).match(
        [](auto &&hash) -> expected::Result<Frame, RouterError> {
          return expected::makeValue(Frame{hash.value, boost::none});
        },
        [](const auto &error) -> expected::Result<Frame, RouterError> {
          return routerError(RouterError::Code::kMalformedFrame,
                             error.error.toString());
        });
  }
  auto decoded = wire::unpack(payload);
  if (expected::hasError(decoded)) {
    return routerError(RouterError::Code::kMalformedFrame,
                       decoded.assumeError().toString());
  }
  // the quorum is chosen by tenant, so one batch may carry only one
  COURIER_EXPECTED_ERROR_CHECK(checkSingleTenant(decoded.assumeValue()));
  return expected::makeValue(Frame{
      wire::batchHash(payload),
      boost::make_optional(std::move(decoded).assumeValue())});
}

courier::expected::Result<void, RouterError>
MultiAdapterImpl::checkSingleTenant(
    const std::vector<types::Bytes> &messages) const {
  const auto tenant = message_properties_->tenantOf(messages.front());
  for (size_t i = 1; i < messages.size(); ++i) {
    const auto other = message_properties_->tenantOf(messages[i]);
    if (other != tenant) {
      return routerError(
          RouterError::Code::kMalformedFrame,
          fmt::format("message #{} belongs to tenant {}, batch to tenant {}",
                      i,
                      other,
                      tenant));
    }
  }
  return expected::makeValue();
}

courier::expected::Result<std::shared_ptr<courier::multi_adapter::BatchHandler>,
                          RouterError>
MultiAdapterImpl::checkInbound(types::NetworkId source) const {
  if (source == local_) {
    return routerError(RouterError::Code::kLocalSource,
                       fmt::format("network {} is the local network", source));
  }
  auto handler = batch_handler_.lock();
  if (not handler) {
    return routerError(RouterError::Code::kNoBatchHandler,
                       "no batch handler registered");
  }
  return expected::makeValue(std::move(handler));
}

courier::expected::Result<void, RouterError> MultiAdapterImpl::checkRole(
    const types::AccountId &caller, auth::Role role) const {
  return access_control_->check(caller, role).match(
      [](const auto &) -> expected::Result<void, RouterError> {
        return expected::makeValue();
      },
      [](const auto &error) -> expected::Result<void, RouterError> {
        return routerError(RouterError::Code::kUnauthorized,
                           error.error.description);
      });
}

InboundOutcome MultiAdapterImpl::tryDeliver(types::NetworkId source,
                                            const hash256_t &hash,
                                            VoteRecord &record,
                                            BatchHandler &handler,
                                            bool duplicate_vote) {
  auto messages = record.messages();
  if (not messages) {
    return InboundOutcome{hash,
                          InboundStatus::kAwaitingPayload,
                          record.voters().size(),
                          duplicate_vote};
  }

  const auto tenant = message_properties_->tenantOf(messages->front());
  auto found = registry_.find(source, tenant);
  if (not found) {
    log_->warn("no adapters for network {} tenant {}, batch {} stays pending",
               source,
               tenant,
               hash);
    return InboundOutcome{
        hash, InboundStatus::kPendingQuorum, 0, duplicate_vote};
  }

  const auto votes = record.countVotes(*found);
  if (votes < found->threshold) {
    return InboundOutcome{
        hash, InboundStatus::kPendingQuorum, votes, duplicate_vote};
  }

  // the record must be terminal before the handler runs
  auto batch = record.markDelivered();
  log_->info("batch {} from network {} reached {} of {} votes",
             hash,
             source,
             votes,
             found->threshold);
  auto report = handler.handleBatch(source, *batch);
  log_->info("batch {} dispatched: {} handled, {} failed",
             hash,
             report.handled,
             report.failed);
  return InboundOutcome{hash, InboundStatus::kDelivered, votes, duplicate_vote};
}
