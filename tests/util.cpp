// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "chain/math.hpp"

namespace gauss::test {
    auto make_address(uint8_t tag) -> evmc::address {
        auto ret = evmc::address();
        ret.bytes[sizeof(ret.bytes) - 1] = tag;
        return ret;
    }

    auto amount(uint64_t v) -> evmc::uint256be {
        return evmc::uint256be(v);
    }

    auto quiet_logger() -> std::shared_ptr<logging::log> {
        return std::make_shared<logging::log>(logging::log_level::trace,
                                              false);
    }

    auto count_events(const chain::chain& c,
                      const evmc::address& emitter,
                      const std::string& signature) -> size_t {
        return c.events().query(emitter, chain::event_topic(signature)).size();
    }

    void expect_error(const result_type& res, error_code expected) {
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ(res.value(), expected) << to_string(res.value());
    }

    callback_token::callback_token(const evmc::address& addr,
                                   chain::chain& /* unused */)
        : chain::contract(addr) {}

    void callback_token::set_hook(hook_t hook) {
        m_hook = std::move(hook);
    }

    void callback_token::credit(const evmc::address& account,
                                const evmc::uint256be& amount) {
        m_balances.get()[account] = balance_of(account) + amount;
    }

    auto callback_token::name() const -> std::string {
        return "Callback";
    }

    auto callback_token::symbol() const -> std::string {
        return "CB";
    }

    auto callback_token::decimals() const -> uint8_t {
        return 0;
    }

    auto callback_token::total_supply() const -> evmc::uint256be {
        return {};
    }

    auto callback_token::balance_of(const evmc::address& account) const
        -> evmc::uint256be {
        auto it = m_balances.get().find(account);
        if(it == m_balances.get().end()) {
            return {};
        }
        return it->second;
    }

    auto callback_token::allowance(const evmc::address& /* unused */,
                                   const evmc::address& /* unused */) const
        -> evmc::uint256be {
        return max_uint256();
    }

    auto callback_token::transfer(const chain::call_context& ctx,
                                  const evmc::address& to,
                                  const evmc::uint256be& amount)
        -> result_type {
        auto& bals = m_balances.get();
        auto from_bal = checked_sub(balance_of(ctx.m_sender), amount);
        if(!from_bal.has_value()) {
            return error_code::transfer_amount_exceeds_balance;
        }
        bals[ctx.m_sender] = from_bal.value();
        bals[to] = balance_of(to) + amount;
        return std::nullopt;
    }

    auto callback_token::transfer_from(const chain::call_context& ctx,
                                       const evmc::address& from,
                                       const evmc::address& to,
                                       const evmc::uint256be& amount)
        -> result_type {
        if(m_hook) {
            if(auto err = m_hook(ctx)) {
                return err;
            }
        }
        return transfer(chain::call_context{from, ctx.m_chain_id},
                        to,
                        amount);
    }

    auto callback_token::approve(const chain::call_context& /* unused */,
                                 const evmc::address& /* unused */,
                                 const evmc::uint256be& /* unused */)
        -> result_type {
        return std::nullopt;
    }

    auto callback_token::mint(const chain::call_context& /* unused */,
                              const evmc::address& to,
                              const evmc::uint256be& amount) -> result_type {
        credit(to, amount);
        return std::nullopt;
    }

    auto callback_token::burn(const chain::call_context& ctx,
                              const evmc::uint256be& amount) -> result_type {
        auto from_bal = checked_sub(balance_of(ctx.m_sender), amount);
        if(!from_bal.has_value()) {
            return error_code::burn_amount_exceeds_balance;
        }
        m_balances.get()[ctx.m_sender] = from_bal.value();
        return std::nullopt;
    }

    auto callback_token::burn_from(const chain::call_context& ctx,
                                   const evmc::address& account,
                                   const evmc::uint256be& amount)
        -> result_type {
        return burn(chain::call_context{account, ctx.m_chain_id}, amount);
    }

    void callback_token::checkpoint() {
        m_balances.checkpoint();
    }

    void callback_token::revert() {
        m_balances.revert();
    }

    void callback_token::commit() {
        m_balances.commit();
    }
}
