// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "loopback.hpp"

#include "token/interface.hpp"
#include "util/common/hash.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace gauss::relay {
    namespace {
        void append_be64(buffer& buf, uint64_t v) {
            constexpr auto byte_bits = 8;
            auto bytes = std::array<uint8_t, sizeof(v)>();
            for(size_t i = 0; i < bytes.size(); i++) {
                bytes[bytes.size() - 1 - i]
                    = static_cast<uint8_t>(v >> (i * byte_bits));
            }
            buf.append(bytes.data(), bytes.size());
        }
    }

    network::network(std::shared_ptr<logging::log> logger)
        : m_log(logger->tagged("relay")) {}

    void network::attach(const std::shared_ptr<loopback>& endpoint) {
        const auto chain_id = endpoint->host().id();
        const std::lock_guard<std::mutex> l(m_mut);
        m_endpoints[chain_id] = endpoint;
        m_heights.emplace(chain_id, 0);
    }

    auto network::has_endpoint(uint64_t chain_id) const -> bool {
        return endpoint(chain_id) != nullptr;
    }

    auto network::height(uint64_t chain_id) const -> uint64_t {
        const std::lock_guard<std::mutex> l(m_mut);
        auto it = m_heights.find(chain_id);
        if(it == m_heights.end()) {
            return 0;
        }
        return it->second;
    }

    void network::confirm_blocks(uint64_t chain_id, uint64_t n) {
        const std::lock_guard<std::mutex> l(m_mut);
        m_heights[chain_id] += n;
    }

    auto network::deliver(const evmc::bytes32& tx_id) -> result_type {
        // The claim is taken before the lookup. A delivered message leaves
        // the outbox before its claim is released, so a claim holder that
        // still finds the message knows nobody has delivered it.
        if(!claim(tx_id)) {
            m_log->debug("Message", chain::to_hex(tx_id), "already in flight");
            return error_code::delivery_in_progress;
        }
        const auto res = deliver_claimed(tx_id);
        release(tx_id);
        return res;
    }

    auto network::deliver_claimed(const evmc::bytes32& tx_id) -> result_type {
        const auto msg = find(tx_id);
        if(!msg.has_value()) {
            return error_code::unknown_message;
        }
        if(!confirmed(msg.value())) {
            m_log->debug("Message", chain::to_hex(tx_id), "not confirmed");
            return error_code::message_not_confirmed;
        }
        auto dest = endpoint(msg->m_dest_chain_id);
        auto src = endpoint(msg->m_source_chain_id);
        if(!dest || !src) {
            return error_code::unknown_destination;
        }

        auto& dest_chain = dest->host();
        const auto res = dest_chain.execute([&]() -> result_type {
            auto rcv = dest_chain.get<receiver>(msg->m_recipient);
            if(!rcv) {
                return error_code::unknown_contract;
            }
            return rcv->message_process(dest_chain.context(dest->address()),
                                        msg->m_tx_id,
                                        msg->m_source_chain_id,
                                        msg->m_sender,
                                        evmc::address(),
                                        evmc::uint256be(),
                                        msg->m_data);
        });
        if(res.has_value()) {
            m_log->info("Delivery of",
                        chain::to_hex(tx_id),
                        "reverted, kept for retry:",
                        to_string(res.value()));
            return res;
        }

        auto& src_chain = src->host();
        if(auto err = src_chain.execute([&]() -> result_type {
               return src->remove(tx_id);
           })) {
            m_log->error("Delivered message",
                         chain::to_hex(tx_id),
                         "missing from outbox:",
                         to_string(*err));
            return err;
        }
        m_log->debug("Delivered", chain::to_hex(tx_id));
        return std::nullopt;
    }

    auto network::deliver_all() -> size_t {
        size_t delivered{0};
        for(const auto& msg : pending()) {
            if(!confirmed(msg)) {
                continue;
            }
            if(!deliver(msg.m_tx_id).has_value()) {
                delivered++;
            }
        }
        return delivered;
    }

    auto network::pending() const -> std::vector<message> {
        auto endpoints = std::vector<std::shared_ptr<loopback>>();
        {
            const std::lock_guard<std::mutex> l(m_mut);
            for(const auto& entry : m_endpoints) {
                if(auto ep = entry.second.lock()) {
                    endpoints.emplace_back(std::move(ep));
                }
            }
        }
        // Chain locks are taken without holding m_mut: a send holds its
        // chain's lock while it queries the network.
        auto ret = std::vector<message>();
        for(const auto& ep : endpoints) {
            auto outbox = ep->host().view([&]() {
                return ep->outbox();
            });
            ret.insert(ret.end(), outbox.begin(), outbox.end());
        }
        return ret;
    }

    auto network::endpoint(uint64_t chain_id) const
        -> std::shared_ptr<loopback> {
        const std::lock_guard<std::mutex> l(m_mut);
        auto it = m_endpoints.find(chain_id);
        if(it == m_endpoints.end()) {
            return nullptr;
        }
        return it->second.lock();
    }

    auto network::find(const evmc::bytes32& tx_id) const
        -> std::optional<message> {
        for(auto& msg : pending()) {
            if(msg.m_tx_id == tx_id) {
                return msg;
            }
        }
        return std::nullopt;
    }

    auto network::claim(const evmc::bytes32& tx_id) -> bool {
        const std::lock_guard<std::mutex> l(m_mut);
        return m_in_flight.insert(tx_id).second;
    }

    void network::release(const evmc::bytes32& tx_id) {
        const std::lock_guard<std::mutex> l(m_mut);
        m_in_flight.erase(tx_id);
    }

    auto network::confirmed(const message& msg) const -> bool {
        if(msg.m_express) {
            return true;
        }
        return height(msg.m_source_chain_id) - msg.m_sent_height
            >= msg.m_confirmations;
    }

    loopback::loopback(const evmc::address& addr,
                       chain::chain& c,
                       std::shared_ptr<network> net,
                       const evmc::address& fee_token)
        : chain::contract(addr),
          m_chain(c),
          m_log(c.logger()->tagged("relay")),
          m_network(std::move(net)),
          m_fee_token(fee_token) {}

    auto loopback::send_request(const chain::call_context& ctx,
                                const evmc::address& recipient,
                                uint64_t dest_chain_id,
                                const evmc::uint256be& fee_amount,
                                const evmc::address& source,
                                const buffer& data,
                                uint64_t confirmations)
        -> value_result_type<evmc::bytes32> {
        return enqueue(ctx,
                       recipient,
                       dest_chain_id,
                       fee_amount,
                       source,
                       data,
                       confirmations,
                       false);
    }

    auto loopback::send_request_express(const chain::call_context& ctx,
                                        const evmc::address& recipient,
                                        uint64_t dest_chain_id,
                                        const evmc::uint256be& fee_amount,
                                        const evmc::address& source,
                                        const buffer& data,
                                        uint64_t confirmations)
        -> value_result_type<evmc::bytes32> {
        return enqueue(ctx,
                       recipient,
                       dest_chain_id,
                       fee_amount,
                       source,
                       data,
                       confirmations,
                       true);
    }

    auto loopback::outbox() const -> const std::vector<message>& {
        return m_state.get().m_outbox;
    }

    auto loopback::remove(const evmc::bytes32& tx_id) -> result_type {
        auto& outbox = m_state.get().m_outbox;
        auto it = std::find_if(outbox.begin(),
                               outbox.end(),
                               [&](const message& msg) {
                                   return msg.m_tx_id == tx_id;
                               });
        if(it == outbox.end()) {
            return error_code::unknown_message;
        }
        outbox.erase(it);
        return std::nullopt;
    }

    auto loopback::host() const -> chain::chain& {
        return m_chain;
    }

    auto loopback::fee_token() const -> const evmc::address& {
        return m_fee_token;
    }

    void loopback::checkpoint() {
        m_state.checkpoint();
    }

    void loopback::revert() {
        m_state.revert();
    }

    void loopback::commit() {
        m_state.commit();
    }

    auto loopback::enqueue(const chain::call_context& ctx,
                           const evmc::address& recipient,
                           uint64_t dest_chain_id,
                           const evmc::uint256be& fee_amount,
                           const evmc::address& source,
                           const buffer& data,
                           uint64_t confirmations,
                           bool express) -> value_result_type<evmc::bytes32> {
        if(!m_network->has_endpoint(dest_chain_id)) {
            m_log->warn("No endpoint for chain", dest_chain_id);
            return error_code::unknown_destination;
        }
        if(!evmc::is_zero(fee_amount)) {
            auto fee = m_chain.get<token::interface>(m_fee_token);
            if(!fee) {
                return error_code::unknown_contract;
            }
            if(auto err = fee->transfer_from(ctx.from(address()),
                                             ctx.m_sender,
                                             address(),
                                             fee_amount)) {
                m_log->warn("Fee payment failed:", to_string(*err));
                return *err;
            }
        }

        auto& s = m_state.get();
        auto preimage = buffer();
        append_be64(preimage, m_chain.id());
        append_be64(preimage, s.m_nonce);
        preimage.append(ctx.m_sender.bytes, sizeof(ctx.m_sender.bytes));
        preimage.append(data.data(), data.size());
        const auto h = keccak_data(preimage.data(), preimage.size());
        auto tx_id = evmc::bytes32();
        std::memcpy(tx_id.bytes, h.data(), sizeof(tx_id.bytes));

        auto msg = message();
        msg.m_tx_id = tx_id;
        msg.m_source_chain_id = m_chain.id();
        msg.m_dest_chain_id = dest_chain_id;
        msg.m_sender = ctx.m_sender;
        msg.m_recipient = recipient;
        msg.m_source = source;
        msg.m_data = data;
        msg.m_sent_height = m_network->height(m_chain.id());
        msg.m_confirmations = confirmations;
        msg.m_express = express;
        s.m_outbox.emplace_back(std::move(msg));
        s.m_nonce++;

        m_log->debug("Queued",
                     chain::to_hex(tx_id),
                     "for chain",
                     dest_chain_id,
                     express ? "express" : "normal");
        return tx_id;
    }
}
