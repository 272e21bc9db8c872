/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef COURIER_GATEWAY_SUBSIDY_LEDGER_HPP
#define COURIER_GATEWAY_SUBSIDY_LEDGER_HPP

#include <map>
#include <memory>

#include "auth/access_control.hpp"
#include "common/result.hpp"
#include "gateway/gateway_error.hpp"
#include "logger/logger_fwd.hpp"
#include "model/types.hpp"

namespace courier {
  namespace gateway {

    class Gateway;

    /// Funds paid out of the ledger
    struct Payout {
      types::AccountId to;
      types::Amount amount;
    };

    /**
     * Prepaid relay budget per tenant. Balances never go negative and only
     * the owning gateway debits them.
     */
    class SubsidyLedger {
     public:
      SubsidyLedger(std::shared_ptr<auth::AccessControl> access_control,
                    logger::LoggerPtr log);

      /// Fund the tenant. Anyone may deposit. @return new balance
      expected::Result<types::Amount, GatewayError> deposit(
          types::TenantId tenant, types::Amount amount);

      /**
       * Take funds out of the tenant balance. Configurator only.
       * @return payout to the tenant refund address, or to caller if the
       * tenant has none
       */
      expected::Result<Payout, GatewayError> withdraw(
          const types::AccountId &caller,
          types::TenantId tenant,
          types::Amount amount);

      /// Configurator only
      expected::Result<void, GatewayError> setRefundAddress(
          const types::AccountId &caller,
          types::TenantId tenant,
          types::AccountId address);

      types::Amount balance(types::TenantId tenant) const;

      /// @return refund address, empty if not set
      types::AccountId refundAddress(types::TenantId tenant) const;

     private:
      friend class Gateway;

      struct Account {
        types::Amount balance = 0;
        types::AccountId refund;
      };

      /// Decrease the balance by a cost already paid to the router
      expected::Result<void, GatewayError> debit(types::TenantId tenant,
                                                 types::Amount amount);

      expected::Result<void, GatewayError> checkConfigurator(
          const types::AccountId &caller) const;

      std::shared_ptr<auth::AccessControl> access_control_;
      std::map<types::TenantId, Account> accounts_;
      logger::LoggerPtr log_;
    };

  }  // namespace gateway
}  // namespace courier

#endif  // COURIER_GATEWAY_SUBSIDY_LEDGER_HPP
