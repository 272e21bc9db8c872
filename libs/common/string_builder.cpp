/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/string_builder.hpp"

using courier::detail::PrettyStringBuilder;

namespace {
  const std::string kNameSeparator = ": ";
  const std::string kKeyValueSeparator = "=";
}  // namespace

PrettyStringBuilder &PrettyStringBuilder::init(const std::string &name) {
  result_ = name;
  result_.append(kNameSeparator);
  result_.append(to_string::detail::kBeginBlockMarker);
  fields_ = 0;
  return *this;
}

PrettyStringBuilder &PrettyStringBuilder::appendField(
    const std::string &name, const std::string &value) {
  if (fields_++ != 0) {
    result_.append(to_string::detail::kSingleFieldsSeparator);
  }
  result_.append(name);
  result_.append(kKeyValueSeparator);
  result_.append(value);
  return *this;
}

std::string PrettyStringBuilder::finalize() {
  result_.append(to_string::detail::kEndBlockMarker);
  return std::move(result_);
}
