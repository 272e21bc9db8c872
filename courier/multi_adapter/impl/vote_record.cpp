/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "multi_adapter/vote_record.hpp"

#include <algorithm>

#include "common/string_builder.hpp"
#include "common/visitor.hpp"

using courier::multi_adapter::VoteRecord;

std::string courier::multi_adapter::VoteState::toString() const {
  return detail::PrettyStringBuilder()
      .init("VoteState")
      .appendNamed("state", state)
      .appendNamed("voters", voters)
      .appendNamed("payload_held", payload_held)
      .finalize();
}

VoteRecord::VoteRecord() : state_(AwaitingPayload{}) {}

bool VoteRecord::isDelivered() const {
  return boost::get<Delivered>(&state_) != nullptr;
}

bool VoteRecord::hasPayload() const {
  return boost::get<PendingQuorum>(&state_) != nullptr;
}

bool VoteRecord::addVote(const types::AdapterId &voter) {
  return visit_in_place(
      state_,
      [&voter](AwaitingPayload &state) {
        return state.voters.insert(voter).second;
      },
      [&voter](PendingQuorum &state) {
        return state.voters.insert(voter).second;
      },
      [](Delivered &) { return false; });
}

void VoteRecord::attachPayload(std::vector<types::Bytes> messages) {
  if (auto awaiting = boost::get<AwaitingPayload>(&state_)) {
    auto voters = std::move(awaiting->voters);
    state_ = PendingQuorum{std::move(voters), std::move(messages)};
  }
}

boost::optional<const std::vector<courier::types::Bytes> &>
VoteRecord::messages() const {
  if (auto pending = boost::get<PendingQuorum>(&state_)) {
    return pending->messages;
  }
  return boost::none;
}

const courier::multi_adapter::Voters &VoteRecord::voters() const {
  if (auto awaiting = boost::get<AwaitingPayload>(&state_)) {
    return awaiting->voters;
  }
  if (auto pending = boost::get<PendingQuorum>(&state_)) {
    return pending->voters;
  }
  return boost::get<Delivered>(state_).voters;
}

size_t VoteRecord::countVotes(const AdapterSetup &setup) const {
  const auto &current = voters();
  return std::count_if(
      current.begin(), current.end(), [&setup](const auto &voter) {
        return setup.contains(voter);
      });
}

boost::optional<std::vector<courier::types::Bytes>>
VoteRecord::markDelivered() {
  auto pending = boost::get<PendingQuorum>(&state_);
  if (pending == nullptr) {
    return boost::none;
  }
  auto messages = std::move(pending->messages);
  auto voters = std::move(pending->voters);
  state_ = Delivered{std::move(voters)};
  return boost::make_optional(std::move(messages));
}

courier::multi_adapter::VoteState VoteRecord::snapshot() const {
  const char *name = visit_in_place(
      state_,
      [](const AwaitingPayload &) { return "AwaitingPayload"; },
      [](const PendingQuorum &) { return "PendingQuorum"; },
      [](const Delivered &) { return "Delivered"; });
  const auto &current = voters();
  return VoteState{name,
                   std::vector<types::AdapterId>(current.begin(),
                                                 current.end()),
                   hasPayload()};
}
