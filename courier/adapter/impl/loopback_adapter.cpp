/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "adapter/impl/loopback_adapter.hpp"

#include <fmt/core.h>
#include "logger/logger.hpp"

using courier::adapter::LoopbackAdapter;

LoopbackAdapter::LoopbackAdapter(types::AdapterId id,
                                 types::NetworkId local,
                                 types::Amount base_fee,
                                 types::Amount gas_price,
                                 logger::LoggerPtr log)
    : id_(std::move(id)),
      local_(local),
      base_fee_(base_fee),
      gas_price_(gas_price),
      failing_(false),
      sequence_(0),
      log_(std::move(log)) {}

const courier::types::AdapterId &LoopbackAdapter::id() const {
  return id_;
}

courier::expected::Result<courier::adapter::AdapterReceipt, std::string>
LoopbackAdapter::send(types::NetworkId remote,
                      const types::Bytes &payload,
                      types::GasLimit gas_limit,
                      const types::AccountId &refund) {
  if (failing_) {
    return expected::makeError(
        fmt::format("{}: transport to network {} is down", id_, remote));
  }
  queues_[remote].push_back(payload);
  auto reference = fmt::format("{}-{}-{}", id_, remote, ++sequence_);
  log_->debug("queued {} bytes for network {} as {}, gas {}, refund to {}",
              payload.size(),
              remote,
              reference,
              gas_limit,
              refund);
  return expected::makeValue(AdapterReceipt{id_, std::move(reference)});
}

courier::types::Amount LoopbackAdapter::estimate(
    types::NetworkId, const types::Bytes &, types::GasLimit gas_limit) const {
  return base_fee_ + gas_limit * gas_price_;
}

void LoopbackAdapter::connect(types::NetworkId remote,
                              std::weak_ptr<InboundHandler> handler) {
  handlers_[remote] = std::move(handler);
}

void LoopbackAdapter::setFailing(bool failing) {
  failing_ = failing;
}

size_t LoopbackAdapter::queued(types::NetworkId remote) const {
  auto it = queues_.find(remote);
  return it == queues_.end() ? 0 : it->second.size();
}

boost::optional<LoopbackAdapter::DeliveryResult> LoopbackAdapter::deliverNext(
    types::NetworkId remote) {
  auto queue = queues_.find(remote);
  if (queue == queues_.end() or queue->second.empty()) {
    return boost::none;
  }
  auto handler_it = handlers_.find(remote);
  std::shared_ptr<InboundHandler> handler;
  if (handler_it != handlers_.end()) {
    handler = handler_it->second.lock();
  }
  if (not handler) {
    log_->warn("no inbound handler for network {}, frame stays queued",
               remote);
    return boost::none;
  }

  auto frame = std::move(queue->second.front());
  queue->second.pop_front();
  auto result = handler->handle(local_, frame, id_);
  result.match(
      [&](const auto &outcome) {
        log_->debug("delivered to network {}: {}", remote, outcome.value);
      },
      [&](const auto &error) {
        log_->warn("network {} rejected a frame: {}", remote, error.error);
      });
  return boost::make_optional(std::move(result));
}

size_t LoopbackAdapter::deliverAll() {
  size_t delivered = 0;
  for (auto &queue : queues_) {
    while (deliverNext(queue.first)) {
      ++delivered;
    }
  }
  return delivered;
}

bool LoopbackAdapter::dropNext(types::NetworkId remote) {
  auto queue = queues_.find(remote);
  if (queue == queues_.end() or queue->second.empty()) {
    return false;
  }
  log_->info("dropping a frame for network {}", remote);
  queue->second.pop_front();
  return true;
}

bool LoopbackAdapter::corruptNext(types::NetworkId remote) {
  auto queue = queues_.find(remote);
  if (queue == queues_.end() or queue->second.empty()) {
    return false;
  }
  auto &payload = queue->second.front();
  if (payload.empty()) {
    return false;
  }
  payload.back() ^= 0x01;
  return true;
}
