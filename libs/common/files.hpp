/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_FILES_HPP
#define COURIER_FILES_HPP

#include <string>

#include <boost/filesystem/path.hpp>
#include "common/result_fwd.hpp"

namespace courier {

  /**
   * Read file in text mode, and either return its contents as a string
   * or return the error as a string
   * @param path - path to the file
   */
  expected::Result<std::string, std::string> readTextFile(
      const boost::filesystem::path &path);

}  // namespace courier
#endif  // COURIER_FILES_HPP
