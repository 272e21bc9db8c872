/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_CRYPTO_HASH_TYPES_HPP
#define COURIER_CRYPTO_HASH_TYPES_HPP

#include "common/blob.hpp"

namespace courier {

  template <size_t size>
  using hash_t = blob_t<size>;

  // fixed-size hashes
  using hash256_t = hash_t<256 / 8>;

}  // namespace courier

#endif  // COURIER_CRYPTO_HASH_TYPES_HPP
