/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_COMMON_BLOB_HPP
#define COURIER_COMMON_BLOB_HPP

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>

#include "common/hexutils.hpp"

namespace courier {
  using byte_t = uint8_t;

  /**
   * Base type which represents blob of fixed size.
   *
   * std::string is convenient to use but it is not safe.
   * We can not specify the fixed length for string.
   *
   * For std::array it is possible, so we prefer it over std::string.
   */
  template <size_t size_>
  class blob_t : public std::array<byte_t, size_> {
   public:
    /**
     * Initialize blob value
     */
    blob_t() {
      this->fill(0);
    }

    /**
     * In compile-time returns size of current blob.
     */
    constexpr static size_t size() {
      return size_;
    }

    /**
     * Converts current blob to hex string.
     */
    std::string to_hexstring() const {
      return bytesToHexstring(this->data(), this->data() + size_);
    }

    /// Short printable form used in logs
    std::string toString() const {
      return to_hexstring();
    }

    static blob_t<size_> from_raw(const byte_t *data) {
      blob_t<size_> b;
      std::copy(data, data + size_, b.begin());
      return b;
    }
  };
}  // namespace courier

#endif  // COURIER_COMMON_BLOB_HPP
