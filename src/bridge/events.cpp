// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "events.hpp"

#include "util/serialization/abi.hpp"

namespace gauss::bridge {
    auto transfer_initiated_event(const evmc::address& coordinator,
                                  const evmc::bytes32& tx_id,
                                  const evmc::address& caller,
                                  const evmc::address& recipient,
                                  const evmc::uint256be& amount,
                                  const evmc::uint256be& net)
        -> chain::event {
        auto ev = chain::event();
        ev.m_addr = coordinator;
        ev.m_topics = {chain::event_topic(transfer_initiated_signature),
                       tx_id,
                       chain::address_topic(caller)};
        abi::encode_address(ev.m_data, recipient);
        abi::encode_uint256(ev.m_data, amount);
        abi::encode_uint256(ev.m_data, net);
        return ev;
    }

    auto transfer_completed_event(const evmc::address& coordinator,
                                  const evmc::bytes32& tx_id,
                                  uint64_t source_chain_id,
                                  const evmc::address& recipient,
                                  const evmc::uint256be& amount)
        -> chain::event {
        auto ev = chain::event();
        ev.m_addr = coordinator;
        ev.m_topics
            = {chain::event_topic(transfer_completed_signature), tx_id};
        abi::encode_uint256(ev.m_data, evmc::uint256be(source_chain_id));
        abi::encode_address(ev.m_data, recipient);
        abi::encode_uint256(ev.m_data, amount);
        return ev;
    }
}
