/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "wire/batch_codec.hpp"

#include <fmt/core.h>
#include "crypto/sha3_hash.hpp"

using namespace courier;
using namespace courier::wire;

namespace {

  expected::Error<CodecError> codecError(CodecError::Code code,
                                         std::string description) {
    return expected::makeError(CodecError{code, std::move(description)});
  }

  const char *codeName(CodecError::Code code) {
    switch (code) {
      case CodecError::Code::kEmptyBatch:
        return "EmptyBatch";
      case CodecError::Code::kEmptyMessage:
        return "EmptyMessage";
      case CodecError::Code::kMessageTooLong:
        return "MessageTooLong";
      case CodecError::Code::kEmptyFrame:
        return "EmptyFrame";
      case CodecError::Code::kUnexpectedProof:
        return "UnexpectedProof";
      case CodecError::Code::kTruncatedLength:
        return "TruncatedLength";
      case CodecError::Code::kTruncatedPayload:
        return "TruncatedPayload";
      case CodecError::Code::kNotAProof:
        return "NotAProof";
      case CodecError::Code::kBadProofSize:
        return "BadProofSize";
    }
    return "Unknown";
  }

}  // namespace

std::string CodecError::toString() const {
  return fmt::format("{}: {}", codeName(code), description);
}

expected::Result<types::Bytes, CodecError> courier::wire::pack(
    const std::vector<types::Bytes> &messages) {
  if (messages.empty()) {
    return codecError(CodecError::Code::kEmptyBatch,
                      "a batch must contain at least one message");
  }

  size_t total = 0;
  for (size_t i = 0; i < messages.size(); ++i) {
    const auto length = messages[i].size();
    if (length == 0) {
      return codecError(CodecError::Code::kEmptyMessage,
                        fmt::format("message #{} is empty", i));
    }
    if (length > kMaxMessageLength) {
      return codecError(
          CodecError::Code::kMessageTooLong,
          fmt::format("message #{} has {} bytes, at most {} allowed",
                      i,
                      length,
                      kMaxMessageLength));
    }
    total += kLengthPrefixSize + length;
  }

  types::Bytes frame;
  frame.reserve(total);
  for (const auto &message : messages) {
    const auto length = message.size();
    frame.push_back(static_cast<uint8_t>(length >> 8));
    frame.push_back(static_cast<uint8_t>(length & 0xFF));
    frame.insert(frame.end(), message.begin(), message.end());
  }
  return expected::makeValue(std::move(frame));
}

expected::Result<std::vector<types::Bytes>, CodecError> courier::wire::unpack(
    const types::Bytes &frame) {
  if (frame.empty()) {
    return codecError(CodecError::Code::kEmptyFrame, "frame is empty");
  }
  if (isProofFrame(frame)) {
    return codecError(CodecError::Code::kUnexpectedProof,
                      "proof frame can not be unpacked as a batch");
  }

  std::vector<types::Bytes> messages;
  size_t offset = 0;
  while (offset < frame.size()) {
    if (frame.size() - offset < kLengthPrefixSize) {
      return codecError(
          CodecError::Code::kTruncatedLength,
          fmt::format("length prefix at offset {} is truncated", offset));
    }
    const size_t length =
        (static_cast<size_t>(frame[offset]) << 8) | frame[offset + 1];
    offset += kLengthPrefixSize;
    if (length == 0) {
      return codecError(
          CodecError::Code::kEmptyMessage,
          fmt::format("zero length prefix at offset {}",
                      offset - kLengthPrefixSize));
    }
    if (frame.size() - offset < length) {
      return codecError(CodecError::Code::kTruncatedPayload,
                        fmt::format("message at offset {} needs {} bytes, "
                                    "only {} left",
                                    offset,
                                    length,
                                    frame.size() - offset));
    }
    messages.emplace_back(frame.begin() + offset,
                          frame.begin() + offset + length);
    offset += length;
  }
  return expected::makeValue(std::move(messages));
}

types::Bytes courier::wire::packProof(const hash256_t &hash) {
  types::Bytes frame;
  frame.reserve(kProofFrameSize);
  frame.push_back(kProofMarker);
  frame.insert(frame.end(), hash.begin(), hash.end());
  return frame;
}

bool courier::wire::isProofFrame(const types::Bytes &frame) {
  return not frame.empty() and frame.front() == kProofMarker;
}

expected::Result<hash256_t, CodecError> courier::wire::unpackProof(
    const types::Bytes &frame) {
  if (not isProofFrame(frame)) {
    return codecError(CodecError::Code::kNotAProof,
                      "frame does not start with the proof marker");
  }
  if (frame.size() != kProofFrameSize) {
    return codecError(CodecError::Code::kBadProofSize,
                      fmt::format("proof frame has {} bytes, expected {}",
                                  frame.size(),
                                  kProofFrameSize));
  }
  return expected::makeValue(hash256_t::from_raw(frame.data() + 1));
}

hash256_t courier::wire::batchHash(const types::Bytes &frame) {
  return sha3_256(frame);
}
