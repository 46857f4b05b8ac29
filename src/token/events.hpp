// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_TOKEN_EVENTS_H_
#define GAUSS_BRIDGE_SRC_TOKEN_EVENTS_H_

#include "chain/event_log.hpp"

#include <evmc/evmc.hpp>

namespace gauss::token {
    /// Canonical signature of the transfer event.
    static constexpr auto transfer_signature
        = "Transfer(address,address,uint256)";
    /// Canonical signature of the approval event.
    static constexpr auto approval_signature
        = "Approval(address,address,uint256)";

    /// Builds a transfer event. Mints use the zero address as sender and
    /// burns use it as receiver.
    /// \param token emitting token contract.
    /// \param from debited account.
    /// \param to credited account.
    /// \param value amount moved.
    /// \return the event.
    auto transfer_event(const evmc::address& token,
                        const evmc::address& from,
                        const evmc::address& to,
                        const evmc::uint256be& value) -> chain::event;

    /// Builds an approval event.
    /// \param token emitting token contract.
    /// \param owner account granting the allowance.
    /// \param spender account receiving the allowance.
    /// \param value new allowance.
    /// \return the event.
    auto approval_event(const evmc::address& token,
                        const evmc::address& owner,
                        const evmc::address& spender,
                        const evmc::uint256be& value) -> chain::event;
}

#endif // GAUSS_BRIDGE_SRC_TOKEN_EVENTS_H_
