// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "math.hpp"

#include <array>
#include <cstring>

namespace gauss {
    namespace {
        constexpr auto word_len = sizeof(evmc::uint256be::bytes);
        constexpr auto byte_bits = 8U;
        constexpr auto byte_mask = 0xffU;

        // Big-endian byte-wise addition. Returns the carry out of the most
        // significant byte.
        auto add_bytes(const evmc::uint256be& lhs,
                       const evmc::uint256be& rhs,
                       evmc::uint256be& out) -> bool {
            unsigned int carry = 0;
            for(size_t i = word_len; i > 0; i--) {
                const auto idx = i - 1;
                const auto sum = static_cast<unsigned int>(lhs.bytes[idx])
                               + static_cast<unsigned int>(rhs.bytes[idx])
                               + carry;
                out.bytes[idx] = static_cast<uint8_t>(sum & byte_mask);
                carry = sum >> byte_bits;
            }
            return carry != 0;
        }

        // Returns the borrow out of the most significant byte.
        auto sub_bytes(const evmc::uint256be& lhs,
                       const evmc::uint256be& rhs,
                       evmc::uint256be& out) -> bool {
            int borrow = 0;
            for(size_t i = word_len; i > 0; i--) {
                const auto idx = i - 1;
                auto diff = static_cast<int>(lhs.bytes[idx])
                          - static_cast<int>(rhs.bytes[idx]) - borrow;
                borrow = 0;
                if(diff < 0) {
                    constexpr auto byte_range = 256;
                    diff += byte_range;
                    borrow = 1;
                }
                out.bytes[idx] = static_cast<uint8_t>(diff);
            }
            return borrow != 0;
        }
    }

    auto operator+(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        auto ret = evmc::uint256be();
        add_bytes(lhs, rhs, ret);
        return ret;
    }

    auto operator-(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        auto ret = evmc::uint256be();
        sub_bytes(lhs, rhs, ret);
        return ret;
    }

    auto operator*(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        // Schoolbook multiplication on little-endian byte order, truncated
        // to 32 bytes.
        auto acc = std::array<unsigned int, word_len>();
        for(size_t i = 0; i < word_len; i++) {
            const auto a = lhs.bytes[word_len - 1 - i];
            if(a == 0) {
                continue;
            }
            unsigned int carry = 0;
            for(size_t j = 0; i + j < word_len; j++) {
                const auto b = rhs.bytes[word_len - 1 - j];
                const auto cur = acc[i + j] + static_cast<unsigned int>(a) * b
                               + carry;
                acc[i + j] = cur & byte_mask;
                carry = cur >> byte_bits;
            }
        }
        auto ret = evmc::uint256be();
        for(size_t i = 0; i < word_len; i++) {
            ret.bytes[word_len - 1 - i] = static_cast<uint8_t>(acc[i]);
        }
        return ret;
    }

    auto checked_add(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be> {
        auto ret = evmc::uint256be();
        if(add_bytes(lhs, rhs, ret)) {
            return std::nullopt;
        }
        return ret;
    }

    auto checked_sub(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be> {
        auto ret = evmc::uint256be();
        if(sub_bytes(lhs, rhs, ret)) {
            return std::nullopt;
        }
        return ret;
    }

    auto max_uint256() -> evmc::uint256be {
        auto ret = evmc::uint256be();
        std::memset(ret.bytes, static_cast<int>(byte_mask), sizeof(ret.bytes));
        return ret;
    }

    auto to_uint64(const evmc::uint256be& v) -> uint64_t {
        return evmc::load64be(&v.bytes[sizeof(v.bytes) - sizeof(uint64_t)]);
    }
}
