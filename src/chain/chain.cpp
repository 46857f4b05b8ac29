// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain.hpp"

#include "math.hpp"

namespace gauss::chain {
    chain::chain(uint64_t chain_id, std::shared_ptr<logging::log> logger)
        : m_id(chain_id),
          m_log(logger->tagged("chain:" + std::to_string(chain_id))) {}

    auto chain::id() const -> uint64_t {
        return m_id;
    }

    auto chain::context(const evmc::address& sender) const -> call_context {
        return call_context{sender, m_id};
    }

    auto chain::logger() const -> const std::shared_ptr<logging::log>& {
        return m_log;
    }

    auto chain::next_address(const evmc::address& deployer) const
        -> evmc::address {
        const std::lock_guard<std::recursive_mutex> l(m_exec_mut);
        auto it = m_nonces.find(deployer);
        const auto nonce = it == m_nonces.end() ? 0 : it->second;
        return contract_address(deployer, nonce);
    }

    auto chain::native_balance(const evmc::address& addr) const
        -> evmc::uint256be {
        const std::lock_guard<std::recursive_mutex> l(m_exec_mut);
        const auto& balances = m_native.get();
        auto it = balances.find(addr);
        if(it == balances.end()) {
            return {};
        }
        return it->second;
    }

    auto chain::credit_native(const evmc::address& addr,
                              const evmc::uint256be& value) -> result_type {
        const std::lock_guard<std::recursive_mutex> l(m_exec_mut);
        auto& bal = m_native.get()[addr];
        auto sum = checked_add(bal, value);
        if(!sum.has_value()) {
            return error_code::arithmetic_overflow;
        }
        bal = sum.value();
        return std::nullopt;
    }

    auto chain::send_native(const call_context& ctx,
                            const evmc::address& to,
                            const evmc::uint256be& value) -> result_type {
        const std::lock_guard<std::recursive_mutex> l(m_exec_mut);
        auto& balances = m_native.get();
        const auto from_bal = balances[ctx.m_sender];
        auto remaining = checked_sub(from_bal, value);
        if(!remaining.has_value()) {
            return error_code::insufficient_native_balance;
        }
        // Debit before credit so a self-send leaves the balance unchanged.
        balances[ctx.m_sender] = remaining.value();
        auto credited = checked_add(balances[to], value);
        if(!credited.has_value()) {
            balances[ctx.m_sender] = from_bal;
            return error_code::arithmetic_overflow;
        }
        balances[to] = credited.value();
        m_log->trace("Native transfer",
                     to_hex(ctx.m_sender),
                     "->",
                     to_hex(to),
                     to_uint64(value));
        return std::nullopt;
    }

    auto chain::events() -> event_log& {
        return m_events;
    }

    auto chain::events() const -> const event_log& {
        return m_events;
    }

    chain::top_level_call::top_level_call(chain& c) : m_chain(c) {
        m_chain.m_depth++;
        m_chain.checkpoint_all();
    }

    chain::top_level_call::~top_level_call() {
        m_chain.m_depth--;
        if(!m_finished) {
            m_chain.revert_all();
            m_chain.m_log->warn("Call aborted, changes reverted");
        }
    }

    void chain::top_level_call::finish(bool commit) {
        m_finished = true;
        if(commit) {
            m_chain.commit_all();
        } else {
            m_chain.revert_all();
            m_chain.m_log->debug("Call reverted");
        }
    }

    void chain::checkpoint_all() {
        for(auto& entry : m_contracts) {
            entry.second->checkpoint();
        }
        m_native.checkpoint();
        m_events.checkpoint();
    }

    void chain::revert_all() {
        for(auto& entry : m_contracts) {
            entry.second->revert();
        }
        m_native.revert();
        m_events.revert();
    }

    void chain::commit_all() {
        for(auto& entry : m_contracts) {
            entry.second->commit();
        }
        m_native.commit();
        m_events.commit();
    }
}
