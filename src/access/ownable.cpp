// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ownable.hpp"

namespace gauss::access {
    ownable::ownable(const evmc::address& owner) : m_owner(owner) {}

    auto ownable::owner() const -> const evmc::address& {
        return m_owner;
    }

    auto ownable::only_owner(const chain::call_context& ctx) const
        -> result_type {
        if(ctx.m_sender != m_owner) {
            return error_code::not_owner;
        }
        return std::nullopt;
    }

    auto ownable::transfer_ownership(const chain::call_context& ctx,
                                     const evmc::address& new_owner)
        -> result_type {
        if(auto err = only_owner(ctx)) {
            return err;
        }
        if(evmc::is_zero(new_owner)) {
            return error_code::zero_address;
        }
        m_owner = new_owner;
        return std::nullopt;
    }
}
