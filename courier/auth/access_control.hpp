/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_AUTH_ACCESS_CONTROL_HPP
#define COURIER_AUTH_ACCESS_CONTROL_HPP

#include <bitset>
#include <map>
#include <string>
#include <vector>

#include "common/result.hpp"
#include "logger/logger_fwd.hpp"
#include "model/types.hpp"

namespace courier {
  namespace auth {

    enum class Role {
      /// files registrations, withdraws subsidy, manages roles
      kConfigurator,
      /// recovers stuck batches, discards unfundable ones
      kOperator,

      COUNT
    };

    const char *toString(Role role);

    using RoleSet = std::bitset<static_cast<size_t>(Role::COUNT)>;

    struct AuthError {
      enum class Code {
        kUnauthorized,
        kLastConfigurator,
      };

      Code code;
      std::string description;

      std::string toString() const;
    };

    /// Role grants per account
    class AccessControl {
     public:
      /**
       * @param configurators - accounts granted kConfigurator initially
       * @param operators - accounts granted kOperator initially
       * @param log - logger
       */
      AccessControl(const std::vector<types::AccountId> &configurators,
                    const std::vector<types::AccountId> &operators,
                    logger::LoggerPtr log);

      bool hasRole(const types::AccountId &account, Role role) const;

      /// @return error unless caller has the role
      expected::Result<void, AuthError> check(const types::AccountId &caller,
                                              Role role) const;

      /// Grant role to account. Only a configurator may do it.
      expected::Result<void, AuthError> grant(const types::AccountId &caller,
                                              const types::AccountId &account,
                                              Role role);

      /**
       * Revoke role from account. Only a configurator may do it, and the
       * last configurator can not be revoked.
       */
      expected::Result<void, AuthError> revoke(const types::AccountId &caller,
                                               const types::AccountId &account,
                                               Role role);

     private:
      size_t holders(Role role) const;

      std::map<types::AccountId, RoleSet> roles_;
      logger::LoggerPtr log_;
    };

  }  // namespace auth
}  // namespace courier

#endif  // COURIER_AUTH_ACCESS_CONTROL_HPP
