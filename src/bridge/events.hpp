// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_BRIDGE_EVENTS_H_
#define GAUSS_BRIDGE_SRC_BRIDGE_EVENTS_H_

#include "chain/event_log.hpp"

#include <evmc/evmc.hpp>

namespace gauss::bridge {
    /// Canonical signature of the outbound transfer event.
    static constexpr auto transfer_initiated_signature
        = "TransferInitiated(bytes32,address,address,uint256,uint256)";
    /// Canonical signature of the inbound transfer event.
    static constexpr auto transfer_completed_signature
        = "TransferCompleted(bytes32,uint256,address,uint256)";

    /// Builds the event emitted when an outbound transfer has been handed to
    /// the relay. The tx id and caller are indexed.
    /// \param coordinator emitting coordinator.
    /// \param tx_id relay transaction id.
    /// \param caller account that initiated the transfer.
    /// \param recipient recipient on the destination chain.
    /// \param amount gross amount taken from the caller.
    /// \param net amount delivered on the destination chain.
    /// \return the event.
    auto transfer_initiated_event(const evmc::address& coordinator,
                                  const evmc::bytes32& tx_id,
                                  const evmc::address& caller,
                                  const evmc::address& recipient,
                                  const evmc::uint256be& amount,
                                  const evmc::uint256be& net)
        -> chain::event;

    /// Builds the event emitted when an inbound transfer has been credited.
    /// The tx id is indexed.
    /// \param coordinator emitting coordinator.
    /// \param tx_id relay transaction id.
    /// \param source_chain_id chain the transfer came from.
    /// \param recipient credited account.
    /// \param amount credited amount.
    /// \return the event.
    auto transfer_completed_event(const evmc::address& coordinator,
                                  const evmc::bytes32& tx_id,
                                  uint64_t source_chain_id,
                                  const evmc::address& recipient,
                                  const evmc::uint256be& amount)
        -> chain::event;
}

#endif // GAUSS_BRIDGE_SRC_BRIDGE_EVENTS_H_
