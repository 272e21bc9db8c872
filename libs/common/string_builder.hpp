/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_STRING_BUILDER_HPP
#define COURIER_STRING_BUILDER_HPP

#include <string>

#include "common/to_string.hpp"

namespace courier {
  namespace detail {

    /**
     * Builds "Name: [field=value, field=value]" representations for
     * toString() of records.
     */
    class PrettyStringBuilder {
     public:
      /// Start the representation of a record called name
      PrettyStringBuilder &init(const std::string &name);

      template <typename Value>
      PrettyStringBuilder &appendNamed(const std::string &name,
                                       const Value &value) {
        return appendField(name, to_string::toString(value));
      }

      /// @return the representation, the builder is not usable afterwards
      std::string finalize();

     private:
      PrettyStringBuilder &appendField(const std::string &name,
                                       const std::string &value);

      std::string result_;
      size_t fields_ = 0;
    };

  }  // namespace detail
}  // namespace courier

#endif  // COURIER_STRING_BUILDER_HPP
