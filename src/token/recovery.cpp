// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "recovery.hpp"

#include "interface.hpp"

namespace gauss::token {
    auto withdraw_erc20(chain::chain& c,
                        const chain::call_context& self,
                        const evmc::address& token,
                        const evmc::address& to,
                        const std::optional<evmc::uint256be>& amount)
        -> result_type {
        auto tok = c.get<interface>(token);
        if(!tok) {
            return error_code::unknown_contract;
        }
        const auto value = amount.value_or(tok->balance_of(self.m_sender));
        return tok->transfer(self, to, value);
    }

    auto native_recover(chain::chain& c,
                        const chain::call_context& self,
                        const evmc::address& to) -> result_type {
        if(evmc::is_zero(to)) {
            return error_code::zero_address;
        }
        return c.send_native(self, to, c.native_balance(self.m_sender));
    }
}
