// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "events.hpp"

#include "util/serialization/abi.hpp"

namespace gauss::access {
    namespace {
        auto account_event(const evmc::address& contract,
                           const std::string& signature,
                           const evmc::address& account) -> chain::event {
            auto ev = chain::event();
            ev.m_addr = contract;
            ev.m_topics = {chain::event_topic(signature)};
            abi::encode_address(ev.m_data, account);
            return ev;
        }
    }

    auto paused_event(const evmc::address& contract,
                      const evmc::address& account) -> chain::event {
        return account_event(contract, paused_signature, account);
    }

    auto unpaused_event(const evmc::address& contract,
                        const evmc::address& account) -> chain::event {
        return account_event(contract, unpaused_signature, account);
    }

    auto ownership_transferred_event(const evmc::address& contract,
                                     const evmc::address& previous_owner,
                                     const evmc::address& new_owner)
        -> chain::event {
        auto ev = chain::event();
        ev.m_addr = contract;
        ev.m_topics = {chain::event_topic(ownership_transferred_signature),
                       chain::address_topic(previous_owner),
                       chain::address_topic(new_owner)};
        return ev;
    }
}
