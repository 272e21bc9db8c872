/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/files.hpp"

#include <ciso646>
#include <fstream>
#include <iterator>

#include <fmt/core.h>
#include <boost/filesystem.hpp>
#include "common/result.hpp"

courier::expected::Result<std::string, std::string> courier::readTextFile(
    const boost::filesystem::path &path) {
  boost::system::error_code error_code;
  if (not boost::filesystem::is_regular_file(path, error_code)) {
    return expected::makeError(
        fmt::format("File '{}' does not exist or is not a regular file.",
                    path.string()));
  }

  std::ifstream file(path.string(), std::ios_base::in);
  if (not file) {
    return expected::makeError(
        fmt::format("File '{}' could not be read.", path.string()));
  }

  std::string contents((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
  return expected::makeValue(std::move(contents));
}
