// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_TOKEN_BALANCE_STORE_H_
#define GAUSS_BRIDGE_SRC_TOKEN_BALANCE_STORE_H_

#include "chain/error.hpp"

#include <evmc/evmc.hpp>
#include <map>
#include <utility>

namespace gauss::token {
    /// Balances, allowances and total supply of one token. Performs the
    /// standard checks and leaves access control, pausing and events to the
    /// contract composing it. Every mutator validates before it writes, so a
    /// rejected call leaves the store untouched.
    class balance_store {
      public:
        /// Returns the balance of an account.
        [[nodiscard]] auto balance_of(const evmc::address& account) const
            -> evmc::uint256be;

        /// Returns the allowance of a spender over an owner's tokens.
        [[nodiscard]] auto allowance(const evmc::address& owner,
                                     const evmc::address& spender) const
            -> evmc::uint256be;

        /// Returns the total supply.
        [[nodiscard]] auto total_supply() const -> evmc::uint256be;

        /// Moves tokens between accounts.
        /// \return transfer_from_zero_address, transfer_to_zero_address or
        ///         transfer_amount_exceeds_balance on rejection.
        auto transfer(const evmc::address& from,
                      const evmc::address& to,
                      const evmc::uint256be& amount) -> result_type;

        /// Creates tokens.
        /// \return mint_to_zero_address or arithmetic_overflow on rejection.
        auto mint(const evmc::address& to, const evmc::uint256be& amount)
            -> result_type;

        /// Destroys tokens.
        /// \return burn_from_zero_address or burn_amount_exceeds_balance on
        ///         rejection.
        auto burn(const evmc::address& from, const evmc::uint256be& amount)
            -> result_type;

        /// Sets an allowance.
        /// \return approve_zero_address on rejection.
        auto approve(const evmc::address& owner,
                     const evmc::address& spender,
                     const evmc::uint256be& amount) -> result_type;

        /// Checks that an allowance covers an amount without spending it.
        /// \return insufficient_allowance if it does not.
        [[nodiscard]] auto check_allowance(const evmc::address& owner,
                                           const evmc::address& spender,
                                           const evmc::uint256be& amount) const
            -> result_type;

        /// Deducts from an allowance. The maximum value is treated as
        /// unlimited and never decreases.
        /// \return insufficient_allowance on rejection.
        auto spend_allowance(const evmc::address& owner,
                             const evmc::address& spender,
                             const evmc::uint256be& amount) -> result_type;

      private:
        std::map<evmc::address, evmc::uint256be> m_balances;
        std::map<std::pair<evmc::address, evmc::address>, evmc::uint256be>
            m_allowances;
        evmc::uint256be m_total_supply{};
    };
}

#endif // GAUSS_BRIDGE_SRC_TOKEN_BALANCE_STORE_H_
