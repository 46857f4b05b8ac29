// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wrapped_token.hpp"

#include "access/events.hpp"
#include "chain/math.hpp"
#include "token/events.hpp"
#include "token/recovery.hpp"

namespace gauss::wrapper {
    wrapped_token::wrapped_token(const evmc::address& addr,
                                 chain::chain& c,
                                 const evmc::address& underlying,
                                 const evmc::address& owner,
                                 chain::role_resolver resolver,
                                 metadata meta)
        : chain::contract(addr),
          m_chain(c),
          m_log(c.logger()->tagged(meta.m_symbol)),
          m_underlying(underlying),
          m_resolver(std::move(resolver)),
          m_meta(std::move(meta)) {
        m_state.get().m_owner = access::ownable(owner);
    }

    auto wrapped_token::init(const chain::call_context& ctx,
                             const evmc::address& bridge) -> result_type {
        auto& s = m_state.get();
        if(auto err = s.m_owner.only_owner(ctx)) {
            return rejected("init", *err);
        }
        if(auto err = s.m_init.require_uninitialized()) {
            return rejected("init", *err);
        }
        if(evmc::is_zero(bridge)) {
            return rejected("init", error_code::zero_address);
        }
        if(ctx.m_chain_id != m_chain.id()) {
            return rejected("init", error_code::chain_mismatch);
        }
        const auto role = m_resolver.resolve(m_chain.id());
        if(failed(role)) {
            return rejected("init", std::get<error_code>(role));
        }
        s.m_role = std::get<chain::chain_role>(role);
        s.m_bridge = bridge;
        if(auto err = s.m_init.initialize()) {
            return rejected("init", *err);
        }
        m_log->info("Initialized as",
                    chain::to_string(s.m_role),
                    "with bridge",
                    chain::to_hex(bridge));
        return std::nullopt;
    }

    auto wrapped_token::update_bridge(const chain::call_context& ctx,
                                      const evmc::address& bridge)
        -> result_type {
        auto& s = m_state.get();
        if(auto err = s.m_owner.only_owner(ctx)) {
            return rejected("update_bridge", *err);
        }
        if(evmc::is_zero(bridge)) {
            return rejected("update_bridge", error_code::zero_address);
        }
        s.m_bridge = bridge;
        m_log->info("Bridge updated to", chain::to_hex(bridge));
        return std::nullopt;
    }

    auto wrapped_token::deposit_for(const chain::call_context& ctx,
                                    const evmc::address& account,
                                    const evmc::uint256be& amount)
        -> result_type {
        if(auto err = before_token_transfer()) {
            return rejected("deposit_for", *err);
        }
        if(auto err = m_state.get().m_init.require_initialized()) {
            return rejected("deposit_for", *err);
        }
        if(is_home()) {
            if(auto err = only_bridge(ctx)) {
                return rejected("deposit_for", *err);
            }
        }
        auto und = underlying_token();
        if(!und) {
            return rejected("deposit_for", error_code::unknown_contract);
        }
        if(auto err = und->transfer_from(ctx.from(address()),
                                         ctx.m_sender,
                                         address(),
                                         amount)) {
            return rejected("deposit_for", *err);
        }
        if(auto err = mint_to(account, amount)) {
            return rejected("deposit_for", *err);
        }
        m_log->debug("Deposit for", chain::to_hex(account));
        return std::nullopt;
    }

    auto wrapped_token::withdraw_to(const chain::call_context& ctx,
                                    const evmc::address& account,
                                    const evmc::uint256be& amount)
        -> result_type {
        if(auto err = before_token_transfer()) {
            return rejected("withdraw_to", *err);
        }
        if(auto err = m_state.get().m_init.require_initialized()) {
            return rejected("withdraw_to", *err);
        }
        if(is_home()) {
            if(auto err = only_bridge(ctx)) {
                return rejected("withdraw_to", *err);
            }
        }
        auto und = underlying_token();
        if(!und) {
            return rejected("withdraw_to", error_code::unknown_contract);
        }
        // Burn first: a short balance fails here, never clamped.
        if(auto err = burn_from_account(ctx.m_sender, amount)) {
            return rejected("withdraw_to", *err);
        }
        if(auto err = und->transfer(ctx.from(address()), account, amount)) {
            return rejected("withdraw_to", *err);
        }
        m_log->debug("Withdrawal to", chain::to_hex(account));
        return std::nullopt;
    }

    auto wrapped_token::reconcile_excess(const chain::call_context& ctx,
                                         const evmc::address& account)
        -> value_result_type<evmc::uint256be> {
        if(auto err = m_state.get().m_owner.only_owner(ctx)) {
            return *rejected("reconcile_excess", *err);
        }
        auto und = underlying_token();
        if(!und) {
            return *rejected("reconcile_excess",
                             error_code::unknown_contract);
        }
        const auto held = und->balance_of(address());
        const auto supply = total_supply();
        if(!(supply < held)) {
            return evmc::uint256be{};
        }
        const auto excess = held - supply;
        if(auto err = mint_to(account, excess)) {
            return *rejected("reconcile_excess", *err);
        }
        m_log->info("Reconciled excess underlying to",
                    chain::to_hex(account));
        return excess;
    }

    auto wrapped_token::emergency_recover(const chain::call_context& ctx,
                                          const evmc::address& to)
        -> result_type {
        auto& s = m_state.get();
        if(auto err = s.m_owner.only_owner(ctx)) {
            return rejected("emergency_recover", *err);
        }
        if(auto err = s.m_init.require_initialized()) {
            return rejected("emergency_recover", *err);
        }
        if(is_home()) {
            return rejected("emergency_recover",
                            error_code::recovering_away_only);
        }
        auto und = underlying_token();
        if(!und) {
            return rejected("emergency_recover",
                            error_code::unknown_contract);
        }
        if(!s.m_pause.paused()) {
            if(auto err = s.m_pause.pause()) {
                return rejected("emergency_recover", *err);
            }
            m_chain.events().emit(
                access::paused_event(address(), ctx.m_sender));
        }
        const auto self = ctx.from(address());
        if(auto err = und->transfer(self, to, und->balance_of(address()))) {
            return rejected("emergency_recover", *err);
        }
        m_log->warn("Emergency recovery of underlying to", chain::to_hex(to));
        return std::nullopt;
    }

    auto wrapped_token::withdraw_erc20(const chain::call_context& ctx,
                                       const evmc::address& token,
                                       const evmc::address& to,
                                       std::optional<evmc::uint256be> amount)
        -> result_type {
        if(auto err = m_state.get().m_owner.only_owner(ctx)) {
            return rejected("withdraw_erc20", *err);
        }
        if(auto err = token::withdraw_erc20(m_chain,
                                            ctx.from(address()),
                                            token,
                                            to,
                                            amount)) {
            return rejected("withdraw_erc20", *err);
        }
        return std::nullopt;
    }

    auto wrapped_token::native_recover(const chain::call_context& ctx,
                                       const evmc::address& to)
        -> result_type {
        if(auto err = m_state.get().m_owner.only_owner(ctx)) {
            return rejected("native_recover", *err);
        }
        if(auto err
           = token::native_recover(m_chain, ctx.from(address()), to)) {
            return rejected("native_recover", *err);
        }
        return std::nullopt;
    }

    auto wrapped_token::pause(const chain::call_context& ctx)
        -> result_type {
        auto& s = m_state.get();
        if(auto err = s.m_owner.only_owner(ctx)) {
            return rejected("pause", *err);
        }
        if(auto err = s.m_pause.pause()) {
            return rejected("pause", *err);
        }
        m_chain.events().emit(access::paused_event(address(), ctx.m_sender));
        m_log->info("Paused");
        return std::nullopt;
    }

    auto wrapped_token::unpause(const chain::call_context& ctx)
        -> result_type {
        auto& s = m_state.get();
        if(auto err = s.m_owner.only_owner(ctx)) {
            return rejected("unpause", *err);
        }
        if(auto err = s.m_pause.unpause()) {
            return rejected("unpause", *err);
        }
        m_chain.events().emit(
            access::unpaused_event(address(), ctx.m_sender));
        m_log->info("Unpaused");
        return std::nullopt;
    }

    auto wrapped_token::transfer_ownership(const chain::call_context& ctx,
                                           const evmc::address& new_owner)
        -> result_type {
        auto& s = m_state.get();
        const auto previous = s.m_owner.owner();
        if(auto err = s.m_owner.transfer_ownership(ctx, new_owner)) {
            return rejected("transfer_ownership", *err);
        }
        m_chain.events().emit(
            access::ownership_transferred_event(address(),
                                                previous,
                                                new_owner));
        return std::nullopt;
    }

    auto wrapped_token::name() const -> std::string {
        return m_meta.m_name;
    }

    auto wrapped_token::symbol() const -> std::string {
        return m_meta.m_symbol;
    }

    auto wrapped_token::decimals() const -> uint8_t {
        return m_meta.m_decimals;
    }

    auto wrapped_token::total_supply() const -> evmc::uint256be {
        return m_state.get().m_store.total_supply();
    }

    auto wrapped_token::balance_of(const evmc::address& account) const
        -> evmc::uint256be {
        return m_state.get().m_store.balance_of(account);
    }

    auto wrapped_token::allowance(const evmc::address& owner,
                                  const evmc::address& spender) const
        -> evmc::uint256be {
        return m_state.get().m_store.allowance(owner, spender);
    }

    auto wrapped_token::transfer(const chain::call_context& ctx,
                                 const evmc::address& to,
                                 const evmc::uint256be& amount)
        -> result_type {
        if(auto err = before_token_transfer()) {
            return rejected("transfer", *err);
        }
        if(auto err
           = m_state.get().m_store.transfer(ctx.m_sender, to, amount)) {
            return rejected("transfer", *err);
        }
        m_chain.events().emit(
            token::transfer_event(address(), ctx.m_sender, to, amount));
        return std::nullopt;
    }

    auto wrapped_token::transfer_from(const chain::call_context& ctx,
                                      const evmc::address& from,
                                      const evmc::address& to,
                                      const evmc::uint256be& amount)
        -> result_type {
        if(auto err = before_token_transfer()) {
            return rejected("transfer_from", *err);
        }
        auto& store = m_state.get().m_store;
        if(auto err = store.check_allowance(from, ctx.m_sender, amount)) {
            return rejected("transfer_from", *err);
        }
        if(store.balance_of(from) < amount) {
            return rejected("transfer_from",
                            error_code::transfer_amount_exceeds_balance);
        }
        if(auto err = store.spend_allowance(from, ctx.m_sender, amount)) {
            return rejected("transfer_from", *err);
        }
        if(auto err = store.transfer(from, to, amount)) {
            return rejected("transfer_from", *err);
        }
        m_chain.events().emit(
            token::transfer_event(address(), from, to, amount));
        return std::nullopt;
    }

    auto wrapped_token::approve(const chain::call_context& ctx,
                                const evmc::address& spender,
                                const evmc::uint256be& amount)
        -> result_type {
        if(auto err = m_state.get().m_store.approve(ctx.m_sender,
                                                    spender,
                                                    amount)) {
            return rejected("approve", *err);
        }
        m_chain.events().emit(
            token::approval_event(address(), ctx.m_sender, spender, amount));
        return std::nullopt;
    }

    auto wrapped_token::mint(const chain::call_context& ctx,
                             const evmc::address& to,
                             const evmc::uint256be& amount) -> result_type {
        if(auto err = bridge_supply_check(ctx)) {
            return rejected("mint", *err);
        }
        if(auto err = mint_to(to, amount)) {
            return rejected("mint", *err);
        }
        return std::nullopt;
    }

    auto wrapped_token::burn(const chain::call_context& ctx,
                             const evmc::uint256be& amount) -> result_type {
        if(auto err = bridge_supply_check(ctx)) {
            return rejected("burn", *err);
        }
        if(auto err = burn_from_account(ctx.m_sender, amount)) {
            return rejected("burn", *err);
        }
        return std::nullopt;
    }

    auto wrapped_token::burn_from(const chain::call_context& ctx,
                                  const evmc::address& account,
                                  const evmc::uint256be& amount)
        -> result_type {
        if(auto err = bridge_supply_check(ctx)) {
            return rejected("burn_from", *err);
        }
        auto& store = m_state.get().m_store;
        if(auto err = store.check_allowance(account, ctx.m_sender, amount)) {
            return rejected("burn_from", *err);
        }
        if(store.balance_of(account) < amount) {
            return rejected("burn_from",
                            error_code::burn_amount_exceeds_balance);
        }
        if(auto err = store.spend_allowance(account, ctx.m_sender, amount)) {
            return rejected("burn_from", *err);
        }
        if(auto err = burn_from_account(account, amount)) {
            return rejected("burn_from", *err);
        }
        return std::nullopt;
    }

    auto wrapped_token::is_home() const -> bool {
        return m_state.get().m_role == chain::chain_role::home;
    }

    auto wrapped_token::role() const -> chain::chain_role {
        return m_state.get().m_role;
    }

    auto wrapped_token::bridge() const -> evmc::address {
        return m_state.get().m_bridge;
    }

    auto wrapped_token::initialized() const -> bool {
        return m_state.get().m_init.initialized();
    }

    auto wrapped_token::owner() const -> evmc::address {
        return m_state.get().m_owner.owner();
    }

    auto wrapped_token::paused() const -> bool {
        return m_state.get().m_pause.paused();
    }

    auto wrapped_token::underlying() const -> const evmc::address& {
        return m_underlying;
    }

    void wrapped_token::checkpoint() {
        m_state.checkpoint();
    }

    void wrapped_token::revert() {
        m_state.revert();
    }

    void wrapped_token::commit() {
        m_state.commit();
    }

    auto wrapped_token::before_token_transfer() const -> result_type {
        return m_state.get().m_pause.when_not_paused();
    }

    auto wrapped_token::only_bridge(const chain::call_context& ctx) const
        -> result_type {
        const auto& s = m_state.get();
        if(evmc::is_zero(s.m_bridge) || ctx.m_sender != s.m_bridge) {
            return error_code::not_authorized;
        }
        return std::nullopt;
    }

    auto wrapped_token::bridge_supply_check(
        const chain::call_context& ctx) const -> result_type {
        if(auto err = m_state.get().m_init.require_initialized()) {
            return err;
        }
        if(auto err = only_bridge(ctx)) {
            return err;
        }
        if(!is_home()) {
            return error_code::minting_home_only;
        }
        return before_token_transfer();
    }

    auto wrapped_token::underlying_token() const
        -> std::shared_ptr<token::interface> {
        return m_chain.get<token::interface>(m_underlying);
    }

    auto wrapped_token::mint_to(const evmc::address& to,
                                const evmc::uint256be& amount)
        -> result_type {
        if(auto err = m_state.get().m_store.mint(to, amount)) {
            return err;
        }
        m_chain.events().emit(
            token::transfer_event(address(), evmc::address(), to, amount));
        return std::nullopt;
    }

    auto wrapped_token::burn_from_account(const evmc::address& from,
                                          const evmc::uint256be& amount)
        -> result_type {
        if(auto err = m_state.get().m_store.burn(from, amount)) {
            return err;
        }
        m_chain.events().emit(
            token::transfer_event(address(), from, evmc::address(), amount));
        return std::nullopt;
    }

    auto wrapped_token::rejected(const char* op, error_code err) const
        -> result_type {
        m_log->warn(op, "rejected:", to_string(err));
        return err;
    }
}
