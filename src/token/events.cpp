// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "events.hpp"

#include "util/serialization/abi.hpp"

namespace gauss::token {
    namespace {
        auto value_event(const evmc::address& token,
                         const std::string& signature,
                         const evmc::address& a,
                         const evmc::address& b,
                         const evmc::uint256be& value) -> chain::event {
            auto ev = chain::event();
            ev.m_addr = token;
            ev.m_topics = {chain::event_topic(signature),
                           chain::address_topic(a),
                           chain::address_topic(b)};
            abi::encode_uint256(ev.m_data, value);
            return ev;
        }
    }

    auto transfer_event(const evmc::address& token,
                        const evmc::address& from,
                        const evmc::address& to,
                        const evmc::uint256be& value) -> chain::event {
        return value_event(token, transfer_signature, from, to, value);
    }

    auto approval_event(const evmc::address& token,
                        const evmc::address& owner,
                        const evmc::address& spender,
                        const evmc::uint256be& value) -> chain::event {
        return value_event(token, approval_signature, owner, spender, value);
    }
}
