// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_CHAIN_CONTEXT_H_
#define GAUSS_BRIDGE_SRC_CHAIN_CONTEXT_H_

#include <cstdint>
#include <evmc/evmc.hpp>

namespace gauss::chain {
    /// Identity of the caller and the chain a call executes on. Passed
    /// explicitly to every contract operation.
    struct call_context {
        /// Immediate caller of the operation.
        evmc::address m_sender{};
        /// Identifier of the chain executing the call.
        uint64_t m_chain_id{};

        /// Returns a context for a nested call made by a contract, on the
        /// same chain.
        /// \param contract address of the calling contract.
        /// \return context with the contract as sender.
        [[nodiscard]] auto from(const evmc::address& contract) const
            -> call_context {
            return call_context{contract, m_chain_id};
        }
    };
}

#endif // GAUSS_BRIDGE_SRC_CHAIN_CONTEXT_H_
