// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_RELAY_LOOPBACK_H_
#define GAUSS_BRIDGE_SRC_RELAY_LOOPBACK_H_

#include "chain/chain.hpp"
#include "interface.hpp"
#include "util/common/logging.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace gauss::relay {
    /// Message queued by a \ref loopback endpoint.
    struct message {
        /// Relay transaction id.
        evmc::bytes32 m_tx_id{};
        /// Chain the message was sent from.
        uint64_t m_source_chain_id{};
        /// Chain the message is addressed to.
        uint64_t m_dest_chain_id{};
        /// Contract that sent the message.
        evmc::address m_sender{};
        /// Contract to deliver to on the destination chain.
        evmc::address m_recipient{};
        /// Caller-supplied source address.
        evmc::address m_source{};
        /// Opaque payload.
        buffer m_data{};
        /// Source chain height when the message was sent.
        uint64_t m_sent_height{};
        /// Confirmations required before delivery.
        uint64_t m_confirmations{};
        /// Deliverable without waiting for confirmations.
        bool m_express{false};
    };

    class loopback;

    /// Links the loopback endpoints of several in-process chains. Tracks a
    /// confirmed block height per chain and delivers queued messages to
    /// their destination chain on request. Delivery order is up to the
    /// caller, so messages may arrive out of order.
    class network {
      public:
        /// Constructor.
        /// \param logger log instance.
        explicit network(std::shared_ptr<logging::log> logger);

        /// Registers the endpoint of a chain. Replaces any endpoint
        /// previously registered for the same chain.
        /// \param endpoint endpoint deployed on that chain.
        void attach(const std::shared_ptr<loopback>& endpoint);

        /// Returns true if an endpoint is registered for the chain.
        [[nodiscard]] auto has_endpoint(uint64_t chain_id) const -> bool;

        /// Returns the confirmed block height of a chain.
        [[nodiscard]] auto height(uint64_t chain_id) const -> uint64_t;

        /// Confirms blocks on a chain, making normal messages sent from it
        /// deliverable once enough confirmations have accumulated.
        /// \param chain_id chain to advance.
        /// \param n number of blocks to confirm.
        void confirm_blocks(uint64_t chain_id, uint64_t n);

        /// Delivers one queued message by calling message_process on its
        /// recipient inside the destination chain's execute. A delivery
        /// that reverts stays queued for a later retry. A successful one is
        /// removed from the queue. A message is delivered at most once,
        /// including when several threads deliver it concurrently.
        /// \param tx_id message to deliver.
        /// \return unknown_message, message_not_confirmed,
        ///         delivery_in_progress, unknown_destination,
        ///         unknown_contract, or the error returned by the recipient.
        auto deliver(const evmc::bytes32& tx_id) -> result_type;

        /// Attempts delivery of every deliverable message, in queue order.
        /// \return number of messages delivered.
        auto deliver_all() -> size_t;

        /// Returns every queued message across all endpoints.
        [[nodiscard]] auto pending() const -> std::vector<message>;

      private:
        std::shared_ptr<logging::log> m_log;
        mutable std::mutex m_mut;
        std::map<uint64_t, std::weak_ptr<loopback>> m_endpoints;
        std::map<uint64_t, uint64_t> m_heights;
        std::set<evmc::bytes32> m_in_flight;

        [[nodiscard]] auto endpoint(uint64_t chain_id) const
            -> std::shared_ptr<loopback>;
        [[nodiscard]] auto find(const evmc::bytes32& tx_id) const
            -> std::optional<message>;
        [[nodiscard]] auto confirmed(const message& msg) const -> bool;
        [[nodiscard]] auto claim(const evmc::bytes32& tx_id) -> bool;
        void release(const evmc::bytes32& tx_id);
        auto deliver_claimed(const evmc::bytes32& tx_id) -> result_type;
    };

    /// In-process relay endpoint deployed as a contract on one chain.
    /// Charges the sending contract a fee in the fee token through its
    /// allowance, and keeps its outbox in journaled state so a send that is
    /// part of a reverted call is discarded with it.
    class loopback : public chain::contract, public interface {
      public:
        /// Constructor.
        /// \param addr address the endpoint is deployed at.
        /// \param c chain the endpoint is deployed on.
        /// \param net network linking the endpoints.
        /// \param fee_token token fees are charged in.
        loopback(const evmc::address& addr,
                 chain::chain& c,
                 std::shared_ptr<network> net,
                 const evmc::address& fee_token);

        auto send_request(const chain::call_context& ctx,
                          const evmc::address& recipient,
                          uint64_t dest_chain_id,
                          const evmc::uint256be& fee_amount,
                          const evmc::address& source,
                          const buffer& data,
                          uint64_t confirmations)
            -> value_result_type<evmc::bytes32> override;

        auto send_request_express(const chain::call_context& ctx,
                                  const evmc::address& recipient,
                                  uint64_t dest_chain_id,
                                  const evmc::uint256be& fee_amount,
                                  const evmc::address& source,
                                  const buffer& data,
                                  uint64_t confirmations)
            -> value_result_type<evmc::bytes32> override;

        /// Returns the messages sent from this chain and not yet
        /// delivered, in send order.
        [[nodiscard]] auto outbox() const -> const std::vector<message>&;

        /// Drops a delivered message from the outbox.
        /// \param tx_id delivered message.
        /// \return unknown_message if the message is not queued.
        auto remove(const evmc::bytes32& tx_id) -> result_type;

        /// Returns the chain this endpoint is deployed on.
        [[nodiscard]] auto host() const -> chain::chain&;

        /// Returns the fee token.
        [[nodiscard]] auto fee_token() const -> const evmc::address&;

        void checkpoint() override;
        void revert() override;
        void commit() override;

      private:
        struct state {
            std::vector<message> m_outbox;
            uint64_t m_nonce{};
        };

        chain::chain& m_chain;
        std::shared_ptr<logging::log> m_log;
        std::shared_ptr<network> m_network;
        evmc::address m_fee_token;
        chain::journal<state> m_state;

        auto enqueue(const chain::call_context& ctx,
                     const evmc::address& recipient,
                     uint64_t dest_chain_id,
                     const evmc::uint256be& fee_amount,
                     const evmc::address& source,
                     const buffer& data,
                     uint64_t confirmations,
                     bool express) -> value_result_type<evmc::bytes32>;
    };
}

#endif // GAUSS_BRIDGE_SRC_RELAY_LOOPBACK_H_
