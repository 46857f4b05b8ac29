// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "balance_store.hpp"

#include "chain/math.hpp"

namespace gauss::token {
    auto balance_store::balance_of(const evmc::address& account) const
        -> evmc::uint256be {
        auto it = m_balances.find(account);
        if(it == m_balances.end()) {
            return {};
        }
        return it->second;
    }

    auto balance_store::allowance(const evmc::address& owner,
                                  const evmc::address& spender) const
        -> evmc::uint256be {
        auto it = m_allowances.find({owner, spender});
        if(it == m_allowances.end()) {
            return {};
        }
        return it->second;
    }

    auto balance_store::total_supply() const -> evmc::uint256be {
        return m_total_supply;
    }

    auto balance_store::transfer(const evmc::address& from,
                                 const evmc::address& to,
                                 const evmc::uint256be& amount)
        -> result_type {
        if(evmc::is_zero(from)) {
            return error_code::transfer_from_zero_address;
        }
        if(evmc::is_zero(to)) {
            return error_code::transfer_to_zero_address;
        }
        auto from_bal = checked_sub(balance_of(from), amount);
        if(!from_bal.has_value()) {
            return error_code::transfer_amount_exceeds_balance;
        }
        if(from == to) {
            return std::nullopt;
        }
        // Cannot overflow: the sum of all balances is the total supply.
        m_balances[from] = from_bal.value();
        m_balances[to] = balance_of(to) + amount;
        return std::nullopt;
    }

    auto balance_store::mint(const evmc::address& to,
                             const evmc::uint256be& amount) -> result_type {
        if(evmc::is_zero(to)) {
            return error_code::mint_to_zero_address;
        }
        auto supply = checked_add(m_total_supply, amount);
        if(!supply.has_value()) {
            return error_code::arithmetic_overflow;
        }
        m_total_supply = supply.value();
        m_balances[to] = balance_of(to) + amount;
        return std::nullopt;
    }

    auto balance_store::burn(const evmc::address& from,
                             const evmc::uint256be& amount) -> result_type {
        if(evmc::is_zero(from)) {
            return error_code::burn_from_zero_address;
        }
        auto from_bal = checked_sub(balance_of(from), amount);
        if(!from_bal.has_value()) {
            return error_code::burn_amount_exceeds_balance;
        }
        m_balances[from] = from_bal.value();
        m_total_supply = m_total_supply - amount;
        return std::nullopt;
    }

    auto balance_store::approve(const evmc::address& owner,
                                const evmc::address& spender,
                                const evmc::uint256be& amount)
        -> result_type {
        if(evmc::is_zero(owner) || evmc::is_zero(spender)) {
            return error_code::approve_zero_address;
        }
        m_allowances[{owner, spender}] = amount;
        return std::nullopt;
    }

    auto balance_store::check_allowance(const evmc::address& owner,
                                        const evmc::address& spender,
                                        const evmc::uint256be& amount) const
        -> result_type {
        if(allowance(owner, spender) < amount) {
            return error_code::insufficient_allowance;
        }
        return std::nullopt;
    }

    auto balance_store::spend_allowance(const evmc::address& owner,
                                        const evmc::address& spender,
                                        const evmc::uint256be& amount)
        -> result_type {
        const auto current = allowance(owner, spender);
        if(current == max_uint256()) {
            return std::nullopt;
        }
        auto remaining = checked_sub(current, amount);
        if(!remaining.has_value()) {
            return error_code::insufficient_allowance;
        }
        m_allowances[{owner, spender}] = remaining.value();
        return std::nullopt;
    }
}
