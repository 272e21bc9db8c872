/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_WIRE_BATCH_CODEC_HPP
#define COURIER_WIRE_BATCH_CODEC_HPP

#include <string>
#include <vector>

#include "common/result.hpp"
#include "crypto/hash_types.hpp"
#include "model/types.hpp"
#include "wire/wire_format.hpp"

namespace courier {
  namespace wire {

    struct CodecError {
      enum class Code {
        kEmptyBatch,
        kEmptyMessage,
        kMessageTooLong,
        kEmptyFrame,
        kUnexpectedProof,
        kTruncatedLength,
        kTruncatedPayload,
        kNotAProof,
        kBadProofSize,
      };

      Code code;
      std::string description;

      std::string toString() const;
    };

    /**
     * Pack sub-messages into one batch frame.
     * @param messages - non-empty sequence of non-empty sub-messages, each at
     * most kMaxMessageLength bytes
     * @return concatenation of (uint16 big-endian length, payload) pairs
     */
    expected::Result<types::Bytes, CodecError> pack(
        const std::vector<types::Bytes> &messages);

    /**
     * Exact inverse of pack. Fails without returning anything if the frame
     * is not a well-formed batch.
     */
    expected::Result<std::vector<types::Bytes>, CodecError> unpack(
        const types::Bytes &frame);

    /// @return kProofMarker followed by the hash
    types::Bytes packProof(const hash256_t &hash);

    /// Inspects the first byte only.
    bool isProofFrame(const types::Bytes &frame);

    expected::Result<hash256_t, CodecError> unpackProof(
        const types::Bytes &frame);

    /// SHA3-256 of the packed batch bytes
    hash256_t batchHash(const types::Bytes &frame);

  }  // namespace wire
}  // namespace courier

#endif  // COURIER_WIRE_BATCH_CODEC_HPP
