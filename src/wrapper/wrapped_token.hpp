// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_WRAPPER_WRAPPED_TOKEN_H_
#define GAUSS_BRIDGE_SRC_WRAPPER_WRAPPED_TOKEN_H_

#include "access/initializable.hpp"
#include "access/ownable.hpp"
#include "access/pausable.hpp"
#include "chain/chain.hpp"
#include "chain/role.hpp"
#include "token/balance_store.hpp"
#include "token/interface.hpp"
#include "util/common/logging.hpp"

#include <memory>
#include <optional>
#include <string>

namespace gauss::wrapper {
    /// Metadata of the Gauss wrapped stable token.
    struct metadata {
        /// Token name.
        std::string m_name{"Gauss Stable"};
        /// Token symbol.
        std::string m_symbol{"GUD"};
        /// Number of decimals.
        uint8_t m_decimals{6};
    };

    /// Wrapped stable token backed 1:1 by an underlying token held in
    /// custody. On the away chain users wrap and unwrap freely. On the home
    /// chain supply is created and destroyed only by the bridge.
    ///
    /// Built by composition: a balance store, an owner, a pause flag and the
    /// init state machine, all held in one journaled state so a reverted
    /// call restores every part together. Every balance-changing path except
    /// owner recovery passes through \ref before_token_transfer.
    class wrapped_token : public chain::contract, public token::interface {
      public:
        /// Constructor.
        /// \param addr address the token is deployed at.
        /// \param c chain the token is deployed on.
        /// \param underlying token backing the wrapped supply.
        /// \param owner initial owner.
        /// \param resolver resolver consulted once by \ref init.
        /// \param meta token metadata.
        wrapped_token(const evmc::address& addr,
                      chain::chain& c,
                      const evmc::address& underlying,
                      const evmc::address& owner,
                      chain::role_resolver resolver,
                      metadata meta = {});

        /// Resolves the chain role from the executing chain and records the
        /// bridge. Owner only, once.
        /// \param ctx call context.
        /// \param bridge coordinator allowed to mint and burn.
        /// \return already_initialized, not_owner, zero_address or
        ///         unsupported_chain on rejection.
        auto init(const chain::call_context& ctx,
                  const evmc::address& bridge) -> result_type;

        /// Replaces the bridge. Owner only.
        auto update_bridge(const chain::call_context& ctx,
                           const evmc::address& bridge) -> result_type;

        /// Pulls underlying from the caller and mints the same amount of
        /// wrapped tokens to an account. On the home chain only the bridge
        /// may deposit.
        /// \param ctx call context.
        /// \param account account receiving the wrapped tokens.
        /// \param amount amount to wrap.
        /// \return error on rejection.
        auto deposit_for(const chain::call_context& ctx,
                         const evmc::address& account,
                         const evmc::uint256be& amount) -> result_type;

        /// Burns wrapped tokens from the caller, then sends the same amount
        /// of underlying to an account. On the home chain only the bridge
        /// may withdraw.
        /// \param ctx call context.
        /// \param account account receiving the underlying.
        /// \param amount amount to unwrap.
        /// \return burn_amount_exceeds_balance if the caller holds less than
        ///         amount, or another error on rejection.
        auto withdraw_to(const chain::call_context& ctx,
                         const evmc::address& account,
                         const evmc::uint256be& amount) -> result_type;

        /// Mints wrapped tokens for underlying sent to the contract outside
        /// \ref deposit_for. Owner only. Calling it twice mints nothing the
        /// second time.
        /// \param ctx call context.
        /// \param account account receiving the excess.
        /// \return the amount minted, possibly zero.
        auto reconcile_excess(const chain::call_context& ctx,
                              const evmc::address& account)
            -> value_result_type<evmc::uint256be>;

        /// Pauses the token and sends all underlying held in custody to an
        /// account. Owner only, away chain only.
        auto emergency_recover(const chain::call_context& ctx,
                               const evmc::address& to) -> result_type;

        /// Sends tokens held by this contract to an account. Owner only.
        auto withdraw_erc20(const chain::call_context& ctx,
                            const evmc::address& token,
                            const evmc::address& to,
                            std::optional<evmc::uint256be> amount
                            = std::nullopt) -> result_type;

        /// Sends all native currency held by this contract to an account.
        /// Owner only.
        auto native_recover(const chain::call_context& ctx,
                            const evmc::address& to) -> result_type;

        /// Sets the pause flag. Owner only.
        auto pause(const chain::call_context& ctx) -> result_type;

        /// Clears the pause flag. Owner only.
        auto unpause(const chain::call_context& ctx) -> result_type;

        /// Hands ownership to another account. Owner only.
        auto transfer_ownership(const chain::call_context& ctx,
                                const evmc::address& new_owner)
            -> result_type;

        [[nodiscard]] auto name() const -> std::string override;
        [[nodiscard]] auto symbol() const -> std::string override;
        [[nodiscard]] auto decimals() const -> uint8_t override;
        [[nodiscard]] auto total_supply() const -> evmc::uint256be override;
        [[nodiscard]] auto balance_of(const evmc::address& account) const
            -> evmc::uint256be override;
        [[nodiscard]] auto allowance(const evmc::address& owner,
                                     const evmc::address& spender) const
            -> evmc::uint256be override;

        auto transfer(const chain::call_context& ctx,
                      const evmc::address& to,
                      const evmc::uint256be& amount) -> result_type override;
        auto transfer_from(const chain::call_context& ctx,
                           const evmc::address& from,
                           const evmc::address& to,
                           const evmc::uint256be& amount)
            -> result_type override;
        auto approve(const chain::call_context& ctx,
                     const evmc::address& spender,
                     const evmc::uint256be& amount) -> result_type override;

        /// Creates wrapped tokens. Bridge only, home chain only.
        auto mint(const chain::call_context& ctx,
                  const evmc::address& to,
                  const evmc::uint256be& amount) -> result_type override;

        /// Destroys wrapped tokens held by the bridge. Bridge only, home
        /// chain only.
        auto burn(const chain::call_context& ctx,
                  const evmc::uint256be& amount) -> result_type override;

        /// Destroys wrapped tokens held by an account using the bridge's
        /// allowance. Bridge only, home chain only.
        auto burn_from(const chain::call_context& ctx,
                       const evmc::address& account,
                       const evmc::uint256be& amount)
            -> result_type override;

        /// Returns true if init resolved the home role.
        [[nodiscard]] auto is_home() const -> bool;

        /// Returns the resolved role.
        [[nodiscard]] auto role() const -> chain::chain_role;

        /// Returns the current bridge.
        [[nodiscard]] auto bridge() const -> evmc::address;

        /// Returns true once init has run.
        [[nodiscard]] auto initialized() const -> bool;

        /// Returns the current owner.
        [[nodiscard]] auto owner() const -> evmc::address;

        /// Returns true while paused.
        [[nodiscard]] auto paused() const -> bool;

        /// Returns the underlying token address.
        [[nodiscard]] auto underlying() const -> const evmc::address&;

        void checkpoint() override;
        void revert() override;
        void commit() override;

      private:
        struct state {
            token::balance_store m_store;
            access::ownable m_owner;
            access::pausable m_pause;
            access::initializable m_init;
            chain::chain_role m_role{chain::chain_role::unresolved};
            evmc::address m_bridge{};
        };

        chain::chain& m_chain;
        std::shared_ptr<logging::log> m_log;
        evmc::address m_underlying;
        chain::role_resolver m_resolver;
        metadata m_meta;
        chain::journal<state> m_state;

        [[nodiscard]] auto before_token_transfer() const -> result_type;
        [[nodiscard]] auto only_bridge(const chain::call_context& ctx) const
            -> result_type;
        [[nodiscard]] auto bridge_supply_check(
            const chain::call_context& ctx) const -> result_type;
        [[nodiscard]] auto underlying_token() const
            -> std::shared_ptr<token::interface>;
        auto mint_to(const evmc::address& to, const evmc::uint256be& amount)
            -> result_type;
        auto burn_from_account(const evmc::address& from,
                               const evmc::uint256be& amount) -> result_type;
        auto rejected(const char* op, error_code err) const -> result_type;
    };
}

#endif // GAUSS_BRIDGE_SRC_WRAPPER_WRAPPED_TOKEN_H_
