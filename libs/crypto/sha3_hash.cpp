/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha3_hash.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace {

  using DigestContext =
      std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

  void digest(const EVP_MD *md,
              uint8_t *output,
              const uint8_t *data,
              size_t size) {
    DigestContext context{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (not context) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    unsigned int written = 0;
    if (EVP_DigestInit_ex(context.get(), md, nullptr) != 1
        or EVP_DigestUpdate(context.get(), data, size) != 1
        or EVP_DigestFinal_ex(context.get(), output, &written) != 1) {
      throw std::runtime_error("SHA3 digest computation failed");
    }
  }

}  // namespace

namespace courier {

  void sha3_256(uint8_t *output, const uint8_t *data, size_t size) {
    digest(EVP_sha3_256(), output, data, size);
  }

  hash256_t sha3_256(const uint8_t *data, size_t size) {
    hash256_t h;
    sha3_256(h.data(), data, size);
    return h;
  }

  hash256_t sha3_256(const std::vector<uint8_t> &input) {
    return sha3_256(input.data(), input.size());
  }

  hash256_t sha3_256(std::string_view input) {
    return sha3_256(reinterpret_cast<const uint8_t *>(input.data()),
                    input.size());
  }

}  // namespace courier
