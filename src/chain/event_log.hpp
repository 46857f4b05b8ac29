// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_CHAIN_EVENT_LOG_H_
#define GAUSS_BRIDGE_SRC_CHAIN_EVENT_LOG_H_

#include "util/common/buffer.hpp"

#include <evmc/evmc.hpp>
#include <string>
#include <vector>

namespace gauss::chain {
    /// Event emitted by a contract.
    struct event {
        /// Address of the emitting contract.
        evmc::address m_addr{};
        /// Topics. The first topic is keccak256 of the event signature,
        /// followed by the indexed parameters.
        std::vector<evmc::bytes32> m_topics{};
        /// ABI-encoded non-indexed parameters.
        buffer m_data{};
    };

    /// Returns the topic identifying an event signature.
    /// \param signature canonical signature, e.g.
    ///                  "Transfer(address,address,uint256)".
    /// \return keccak256 of the signature.
    auto event_topic(const std::string& signature) -> evmc::bytes32;

    /// Returns an indexed address parameter as a topic.
    auto address_topic(const evmc::address& addr) -> evmc::bytes32;

    /// Ordered record of the events emitted on one chain. Events emitted by a
    /// call that is later reverted are discarded with the rest of its
    /// effects.
    class event_log {
      public:
        /// Appends an event.
        /// \param ev event to record.
        void emit(event ev);

        /// Returns all recorded events in emission order.
        [[nodiscard]] auto events() const -> const std::vector<event>&;

        /// Returns the events emitted by a contract with the given first
        /// topic, in emission order.
        /// \param addr emitting contract.
        /// \param topic0 event signature topic.
        /// \return matching events.
        [[nodiscard]] auto query(const evmc::address& addr,
                                 const evmc::bytes32& topic0) const
            -> std::vector<event>;

        /// Marks the start of a top-level call.
        void checkpoint();

        /// Discards events emitted since the last checkpoint.
        void revert();

        /// Keeps events emitted since the last checkpoint.
        void commit();

      private:
        std::vector<event> m_events;
        size_t m_checkpoint{};
    };
}

#endif // GAUSS_BRIDGE_SRC_CHAIN_EVENT_LOG_H_
