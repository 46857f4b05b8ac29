// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_TOKEN_INTERFACE_H_
#define GAUSS_BRIDGE_SRC_TOKEN_INTERFACE_H_

#include "chain/context.hpp"
#include "chain/error.hpp"

#include <evmc/evmc.hpp>
#include <string>

namespace gauss::token {
    /// Fungible token ledger capability. The bridge and the wrapper reach
    /// every token, including each other's, only through this interface,
    /// looked up by address on the chain.
    class interface {
      public:
        virtual ~interface() = default;

        interface() = default;
        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Returns the token name.
        [[nodiscard]] virtual auto name() const -> std::string = 0;

        /// Returns the token symbol.
        [[nodiscard]] virtual auto symbol() const -> std::string = 0;

        /// Returns the number of decimals of the token's unit.
        [[nodiscard]] virtual auto decimals() const -> uint8_t = 0;

        /// Returns the amount of tokens in existence.
        [[nodiscard]] virtual auto total_supply() const
            -> evmc::uint256be = 0;

        /// Returns the balance of an account.
        [[nodiscard]] virtual auto balance_of(const evmc::address& account)
            const -> evmc::uint256be = 0;

        /// Returns the remaining amount a spender may move on behalf of an
        /// owner.
        [[nodiscard]] virtual auto allowance(const evmc::address& owner,
                                             const evmc::address& spender)
            const -> evmc::uint256be = 0;

        /// Moves tokens from the caller to another account.
        /// \param ctx call context.
        /// \param to receiving account.
        /// \param amount amount to move.
        /// \return error on rejection.
        virtual auto transfer(const chain::call_context& ctx,
                              const evmc::address& to,
                              const evmc::uint256be& amount)
            -> result_type = 0;

        /// Moves tokens between accounts using the caller's allowance.
        /// \param ctx call context; the caller is the spender.
        /// \param from account debited.
        /// \param to account credited.
        /// \param amount amount to move.
        /// \return error on rejection.
        virtual auto transfer_from(const chain::call_context& ctx,
                                   const evmc::address& from,
                                   const evmc::address& to,
                                   const evmc::uint256be& amount)
            -> result_type = 0;

        /// Sets the allowance of a spender over the caller's tokens.
        /// \param ctx call context; the caller is the owner.
        /// \param spender account allowed to spend.
        /// \param amount new allowance.
        /// \return error on rejection.
        virtual auto approve(const chain::call_context& ctx,
                             const evmc::address& spender,
                             const evmc::uint256be& amount)
            -> result_type = 0;

        /// Creates tokens. Privileged; each implementation decides who may
        /// mint.
        /// \param ctx call context.
        /// \param to receiving account.
        /// \param amount amount to create.
        /// \return error on rejection.
        virtual auto mint(const chain::call_context& ctx,
                          const evmc::address& to,
                          const evmc::uint256be& amount) -> result_type = 0;

        /// Destroys tokens held by the caller.
        /// \param ctx call context.
        /// \param amount amount to destroy.
        /// \return error on rejection.
        virtual auto burn(const chain::call_context& ctx,
                          const evmc::uint256be& amount) -> result_type = 0;

        /// Destroys tokens held by another account using the caller's
        /// allowance.
        /// \param ctx call context.
        /// \param account account whose tokens are destroyed.
        /// \param amount amount to destroy.
        /// \return error on rejection.
        virtual auto burn_from(const chain::call_context& ctx,
                               const evmc::address& account,
                               const evmc::uint256be& amount)
            -> result_type = 0;
    };
}

#endif // GAUSS_BRIDGE_SRC_TOKEN_INTERFACE_H_
