/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_WIRE_WIRE_FORMAT_HPP
#define COURIER_WIRE_WIRE_FORMAT_HPP

#include <cstddef>
#include <cstdint>

namespace courier {
  namespace wire {

    /// Size of the big-endian length prefix of each sub-message
    constexpr size_t kLengthPrefixSize = 2;

    /**
     * Upper bound for a sub-message length. The high byte of the first
     * length prefix of any batch therefore never equals kProofMarker.
     */
    constexpr size_t kMaxMessageLength = 0xFEFF;

    /// First byte of a proof frame, also the wire version tag
    constexpr uint8_t kProofMarker = 0xFF;

    constexpr size_t kHashSize = 32;

    constexpr size_t kProofFrameSize = 1 + kHashSize;

    static_assert((kMaxMessageLength >> 8) < kProofMarker,
                  "a batch must never start with the proof marker");

  }  // namespace wire
}  // namespace courier

#endif  // COURIER_WIRE_WIRE_FORMAT_HPP
