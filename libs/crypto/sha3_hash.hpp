/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_CRYPTO_SHA3_HASH_HPP
#define COURIER_CRYPTO_SHA3_HASH_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "crypto/hash_types.hpp"

namespace courier {

  /// Write the SHA3-256 digest of [data, data + size) to output.
  void sha3_256(uint8_t *output, const uint8_t *data, size_t size);

  hash256_t sha3_256(const uint8_t *data, size_t size);
  hash256_t sha3_256(const std::vector<uint8_t> &input);
  hash256_t sha3_256(std::string_view input);

}  // namespace courier

#endif  // COURIER_CRYPTO_SHA3_HASH_HPP
