// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_RELAY_INTERFACE_H_
#define GAUSS_BRIDGE_SRC_RELAY_INTERFACE_H_

#include "chain/context.hpp"
#include "chain/error.hpp"
#include "util/common/buffer.hpp"

#include <evmc/evmc.hpp>

namespace gauss::relay {
    /// Outbound side of the relay gateway as seen by a sending contract.
    class interface {
      public:
        virtual ~interface() = default;

        interface() = default;
        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Queues a message for delivery once the requested number of
        /// confirmations has been reached.
        /// \param ctx call context; the sender is the sending contract.
        /// \param recipient contract to deliver to on the destination chain.
        /// \param dest_chain_id destination chain.
        /// \param fee_amount fee charged to the sender in the fee token.
        /// \param source caller-supplied source address.
        /// \param data opaque payload.
        /// \param confirmations confirmations required before delivery.
        /// \return relay transaction id, or an error.
        virtual auto send_request(const chain::call_context& ctx,
                                  const evmc::address& recipient,
                                  uint64_t dest_chain_id,
                                  const evmc::uint256be& fee_amount,
                                  const evmc::address& source,
                                  const buffer& data,
                                  uint64_t confirmations)
            -> value_result_type<evmc::bytes32> = 0;

        /// Queues a message for immediate delivery. Same parameters as
        /// \ref send_request.
        virtual auto send_request_express(const chain::call_context& ctx,
                                          const evmc::address& recipient,
                                          uint64_t dest_chain_id,
                                          const evmc::uint256be& fee_amount,
                                          const evmc::address& source,
                                          const buffer& data,
                                          uint64_t confirmations)
            -> value_result_type<evmc::bytes32> = 0;
    };

    /// Inbound callback implemented by contracts that accept relayed
    /// messages.
    class receiver {
      public:
        virtual ~receiver() = default;

        receiver() = default;
        receiver(const receiver&) = delete;
        auto operator=(const receiver&) -> receiver& = delete;
        receiver(receiver&&) = delete;
        auto operator=(receiver&&) -> receiver& = delete;

        /// Processes a relayed message.
        /// \param ctx call context; the sender is the relay.
        /// \param tx_id relay transaction id.
        /// \param source_chain_id chain the message was sent from.
        /// \param sender contract that sent the message.
        /// \param recipient_placeholder unused by the receiver.
        /// \param amount_placeholder unused by the receiver.
        /// \param data opaque payload.
        /// \return error on rejection; the delivery is then reverted.
        virtual auto message_process(const chain::call_context& ctx,
                                     const evmc::bytes32& tx_id,
                                     uint64_t source_chain_id,
                                     const evmc::address& sender,
                                     const evmc::address& recipient_placeholder,
                                     const evmc::uint256be& amount_placeholder,
                                     const buffer& data) -> result_type = 0;
    };
}

#endif // GAUSS_BRIDGE_SRC_RELAY_INTERFACE_H_
