// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "abi.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace gauss::abi {
    void encode_address(buffer& out, const evmc::address& addr) {
        auto word = std::array<uint8_t, word_size>();
        std::memcpy(&word[address_word_offset],
                    addr.bytes,
                    sizeof(addr.bytes));
        out.append(word.data(), word.size());
    }

    void encode_uint256(buffer& out, const evmc::uint256be& val) {
        out.append(val.bytes, sizeof(val.bytes));
    }

    decoder::decoder(const buffer& in) : m_in(in) {}

    auto decoder::decode_address() -> std::optional<evmc::address> {
        const auto* word = next_word();
        if(word == nullptr) {
            return std::nullopt;
        }
        const auto* padding_end = word + address_word_offset;
        if(std::any_of(word, padding_end, [](uint8_t b) {
               return b != 0;
           })) {
            return std::nullopt;
        }
        auto addr = evmc::address();
        std::memcpy(addr.bytes, padding_end, sizeof(addr.bytes));
        return addr;
    }

    auto decoder::decode_uint256() -> std::optional<evmc::uint256be> {
        const auto* word = next_word();
        if(word == nullptr) {
            return std::nullopt;
        }
        auto val = evmc::uint256be();
        std::memcpy(val.bytes, word, sizeof(val.bytes));
        return val;
    }

    auto decoder::done() const -> bool {
        return m_offset == m_in.size();
    }

    auto decoder::next_word() -> const uint8_t* {
        if(m_in.size() < m_offset + word_size) {
            return nullptr;
        }
        const auto* word = static_cast<const uint8_t*>(m_in.data_at(m_offset));
        m_offset += word_size;
        return word;
    }
}
