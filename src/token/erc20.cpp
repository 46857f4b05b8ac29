// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "erc20.hpp"

#include "events.hpp"

namespace gauss::token {
    erc20::erc20(const evmc::address& addr,
                 chain::chain& c,
                 std::string name,
                 std::string symbol,
                 uint8_t decimals,
                 const evmc::address& minter)
        : chain::contract(addr),
          m_chain(c),
          m_log(c.logger()->tagged(symbol)),
          m_name(std::move(name)),
          m_symbol(std::move(symbol)),
          m_decimals(decimals),
          m_minter(minter) {}

    auto erc20::name() const -> std::string {
        return m_name;
    }

    auto erc20::symbol() const -> std::string {
        return m_symbol;
    }

    auto erc20::decimals() const -> uint8_t {
        return m_decimals;
    }

    auto erc20::total_supply() const -> evmc::uint256be {
        return m_store.get().total_supply();
    }

    auto erc20::balance_of(const evmc::address& account) const
        -> evmc::uint256be {
        return m_store.get().balance_of(account);
    }

    auto erc20::allowance(const evmc::address& owner,
                          const evmc::address& spender) const
        -> evmc::uint256be {
        return m_store.get().allowance(owner, spender);
    }

    auto erc20::transfer(const chain::call_context& ctx,
                         const evmc::address& to,
                         const evmc::uint256be& amount) -> result_type {
        if(auto err = m_store.get().transfer(ctx.m_sender, to, amount)) {
            return rejected("transfer", *err);
        }
        m_chain.events().emit(
            transfer_event(address(), ctx.m_sender, to, amount));
        return std::nullopt;
    }

    auto erc20::transfer_from(const chain::call_context& ctx,
                              const evmc::address& from,
                              const evmc::address& to,
                              const evmc::uint256be& amount) -> result_type {
        auto& store = m_store.get();
        // Both checks run before anything is written, so a failed transfer
        // leaves the allowance intact.
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
        m_chain.events().emit(transfer_event(address(), from, to, amount));
        return std::nullopt;
    }

    auto erc20::approve(const chain::call_context& ctx,
                        const evmc::address& spender,
                        const evmc::uint256be& amount) -> result_type {
        if(auto err = m_store.get().approve(ctx.m_sender, spender, amount)) {
            return rejected("approve", *err);
        }
        m_chain.events().emit(
            approval_event(address(), ctx.m_sender, spender, amount));
        return std::nullopt;
    }

    auto erc20::mint(const chain::call_context& ctx,
                     const evmc::address& to,
                     const evmc::uint256be& amount) -> result_type {
        if(ctx.m_sender != m_minter) {
            return rejected("mint", error_code::not_authorized);
        }
        if(auto err = m_store.get().mint(to, amount)) {
            return rejected("mint", *err);
        }
        m_chain.events().emit(
            transfer_event(address(), evmc::address(), to, amount));
        return std::nullopt;
    }

    auto erc20::burn(const chain::call_context& ctx,
                     const evmc::uint256be& amount) -> result_type {
        if(auto err = m_store.get().burn(ctx.m_sender, amount)) {
            return rejected("burn", *err);
        }
        m_chain.events().emit(
            transfer_event(address(), ctx.m_sender, evmc::address(), amount));
        return std::nullopt;
    }

    auto erc20::burn_from(const chain::call_context& ctx,
                          const evmc::address& account,
                          const evmc::uint256be& amount) -> result_type {
        auto& store = m_store.get();
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
        if(auto err = store.burn(account, amount)) {
            return rejected("burn_from", *err);
        }
        m_chain.events().emit(
            transfer_event(address(), account, evmc::address(), amount));
        return std::nullopt;
    }

    void erc20::checkpoint() {
        m_store.checkpoint();
    }

    void erc20::revert() {
        m_store.revert();
    }

    void erc20::commit() {
        m_store.commit();
    }

    auto erc20::rejected(const char* op, error_code err) const
        -> result_type {
        m_log->warn(op, "rejected:", to_string(err));
        return err;
    }
}
