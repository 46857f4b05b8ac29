// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "address.hpp"

#include "util/common/hash.hpp"

#include <vector>

namespace gauss::chain {
    namespace {
        constexpr uint8_t rlp_string_offset = 0x80;
        constexpr uint8_t rlp_list_offset = 0xc0;
        constexpr uint8_t rlp_single_byte_max = 0x7f;

        // RLP encoding of an unsigned integer: big-endian without leading
        // zero bytes, zero being the empty string.
        void append_rlp_uint(std::vector<uint8_t>& out, uint64_t v) {
            if(v != 0 && v <= rlp_single_byte_max) {
                out.push_back(static_cast<uint8_t>(v));
                return;
            }
            auto be = std::vector<uint8_t>();
            constexpr auto byte_bits = 8U;
            constexpr uint64_t byte_mask = 0xff;
            while(v != 0) {
                be.insert(be.begin(), static_cast<uint8_t>(v & byte_mask));
                v >>= byte_bits;
            }
            out.push_back(static_cast<uint8_t>(rlp_string_offset + be.size()));
            out.insert(out.end(), be.begin(), be.end());
        }
    }

    auto contract_address(const evmc::address& sender, uint64_t nonce)
        -> evmc::address {
        auto payload = std::vector<uint8_t>();
        payload.push_back(
            static_cast<uint8_t>(rlp_string_offset + sizeof(sender.bytes)));
        payload.insert(payload.end(),
                       std::begin(sender.bytes),
                       std::end(sender.bytes));
        append_rlp_uint(payload, nonce);

        // Payload is at most 30 bytes so the short list form always applies.
        auto encoded = std::vector<uint8_t>();
        encoded.push_back(
            static_cast<uint8_t>(rlp_list_offset + payload.size()));
        encoded.insert(encoded.end(), payload.begin(), payload.end());

        auto addr_hash = keccak_data(encoded.data(), encoded.size());
        auto new_addr = evmc::address();
        constexpr auto addr_offset = addr_hash.size() - sizeof(new_addr.bytes);
        std::memcpy(new_addr.bytes,
                    addr_hash.data() + addr_offset,
                    sizeof(new_addr.bytes));
        return new_addr;
    }
}
