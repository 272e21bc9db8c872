/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_HEXUTILS_HPP
#define COURIER_HEXUTILS_HPP

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

#include <boost/algorithm/hex.hpp>

namespace courier {

  /**
   * Convert a range of raw bytes to printable hex string
   * @param begin - first byte of the range
   * @param end - past-the-end byte of the range
   * @return - converted hex string
   */
  inline std::string bytesToHexstring(const uint8_t *begin,
                                      const uint8_t *end) {
    std::string result;
    result.reserve(static_cast<size_t>(end - begin) * 2);
    boost::algorithm::hex_lower(begin, end, std::back_inserter(result));
    return result;
  }

  /**
   * Convert string of raw bytes to printable hex string
   * @param str - raw bytes string to convert
   * @return - converted hex string
   */
  inline std::string bytestringToHexstring(std::string_view str) {
    const auto beg = reinterpret_cast<const uint8_t *>(str.data());
    return bytesToHexstring(beg, beg + str.size());
  }

}  // namespace courier

#endif  // COURIER_HEXUTILS_HPP
