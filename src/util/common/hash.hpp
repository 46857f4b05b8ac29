// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_COMMON_HASH_H_
#define GAUSS_BRIDGE_SRC_COMMON_HASH_H_

#include <array>
#include <cstddef>
#include <string>

namespace gauss {
    /// Size of the hashes used throughout the system, in bytes.
    static constexpr size_t hash_size = 32;

    /// A 32-byte hash value.
    using hash_t = std::array<unsigned char, hash_size>;

    /// Converts a hash to a hexadecimal string.
    /// \param val hash to convert.
    /// \return the lower-case hex representation of the hash.
    auto to_string(const hash_t& val) -> std::string;

    /// Calculates the Keccak256 hash of the specified data.
    /// \param data byte array containing data to hash.
    /// \param len the number of bytes of the data to hash.
    /// \return the hash of the data.
    auto keccak_data(const void* data, size_t len) -> hash_t;

    /// Calculates the Keccak256 hash of a string, for example an event or
    /// function signature such as "Transfer(address,address,uint256)".
    /// \param str string to hash.
    /// \return the hash of the string's bytes.
    auto keccak_string(const std::string& str) -> hash_t;
}

#endif // GAUSS_BRIDGE_SRC_COMMON_HASH_H_
