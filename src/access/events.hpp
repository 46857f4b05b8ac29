// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_ACCESS_EVENTS_H_
#define GAUSS_BRIDGE_SRC_ACCESS_EVENTS_H_

#include "chain/event_log.hpp"

#include <evmc/evmc.hpp>

namespace gauss::access {
    /// Canonical signature of the paused event.
    static constexpr auto paused_signature = "Paused(address)";
    /// Canonical signature of the unpaused event.
    static constexpr auto unpaused_signature = "Unpaused(address)";
    /// Canonical signature of the ownership transfer event.
    static constexpr auto ownership_transferred_signature
        = "OwnershipTransferred(address,address)";

    /// Builds the event emitted when a contract is paused.
    /// \param contract paused contract.
    /// \param account account that paused it.
    /// \return the event.
    auto paused_event(const evmc::address& contract,
                      const evmc::address& account) -> chain::event;

    /// Builds the event emitted when a contract is unpaused.
    /// \param contract unpaused contract.
    /// \param account account that unpaused it.
    /// \return the event.
    auto unpaused_event(const evmc::address& contract,
                        const evmc::address& account) -> chain::event;

    /// Builds the event emitted when ownership changes hands.
    /// \param contract owned contract.
    /// \param previous_owner owner before the change.
    /// \param new_owner owner after the change.
    /// \return the event.
    auto ownership_transferred_event(const evmc::address& contract,
                                     const evmc::address& previous_owner,
                                     const evmc::address& new_owner)
        -> chain::event;
}

#endif // GAUSS_BRIDGE_SRC_ACCESS_EVENTS_H_
