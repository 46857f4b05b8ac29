// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_TOKEN_RECOVERY_H_
#define GAUSS_BRIDGE_SRC_TOKEN_RECOVERY_H_

#include "chain/chain.hpp"

#include <optional>

namespace gauss::token {
    /// Moves tokens held by a contract to another account. Shared by the
    /// owner-only recovery calls of the wrapper and the coordinator.
    /// \param c chain the contract is deployed on.
    /// \param self context whose sender is the holding contract.
    /// \param token token to move.
    /// \param to receiving account.
    /// \param amount amount to move, or std::nullopt for the whole balance.
    /// \return unknown_contract if there is no token at the address, or the
    ///         token's error.
    auto withdraw_erc20(chain::chain& c,
                        const chain::call_context& self,
                        const evmc::address& token,
                        const evmc::address& to,
                        const std::optional<evmc::uint256be>& amount)
        -> result_type;

    /// Sends the whole native currency balance of a contract to another
    /// account.
    /// \param c chain the contract is deployed on.
    /// \param self context whose sender is the holding contract.
    /// \param to receiving account.
    /// \return zero_address if to is zero.
    auto native_recover(chain::chain& c,
                        const chain::call_context& self,
                        const evmc::address& to) -> result_type;
}

#endif // GAUSS_BRIDGE_SRC_TOKEN_RECOVERY_H_
