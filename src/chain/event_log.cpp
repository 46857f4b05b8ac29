// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "event_log.hpp"

#include "util/common/hash.hpp"

#include <cstring>

namespace gauss::chain {
    auto event_topic(const std::string& signature) -> evmc::bytes32 {
        const auto h = keccak_string(signature);
        auto ret = evmc::bytes32();
        std::memcpy(ret.bytes, h.data(), sizeof(ret.bytes));
        return ret;
    }

    auto address_topic(const evmc::address& addr) -> evmc::bytes32 {
        auto ret = evmc::bytes32();
        std::memcpy(&ret.bytes[sizeof(ret.bytes) - sizeof(addr.bytes)],
                    addr.bytes,
                    sizeof(addr.bytes));
        return ret;
    }

    void event_log::emit(event ev) {
        m_events.emplace_back(std::move(ev));
    }

    auto event_log::events() const -> const std::vector<event>& {
        return m_events;
    }

    auto event_log::query(const evmc::address& addr,
                          const evmc::bytes32& topic0) const
        -> std::vector<event> {
        auto ret = std::vector<event>();
        for(const auto& ev : m_events) {
            if(ev.m_addr == addr && !ev.m_topics.empty()
               && ev.m_topics.front() == topic0) {
                ret.push_back(ev);
            }
        }
        return ret;
    }

    void event_log::checkpoint() {
        m_checkpoint = m_events.size();
    }

    void event_log::revert() {
        m_events.resize(m_checkpoint);
    }

    void event_log::commit() {
        m_checkpoint = m_events.size();
    }
}
