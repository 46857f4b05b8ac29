// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_CHAIN_ADDRESS_H_
#define GAUSS_BRIDGE_SRC_CHAIN_ADDRESS_H_

#include "util/common/buffer.hpp"

#include <cstring>
#include <evmc/evmc.hpp>
#include <optional>
#include <string>
#include <type_traits>

namespace gauss::chain {
    /// Calculates a contract address for the CREATE rule
    /// keccak256(rlp([sender,nonce]))[12:]. A deployer that deploys the same
    /// contracts in the same order on two chains obtains identical addresses
    /// on both, which is what lets bridge twins recognise each other.
    /// \param sender the account creating the contract.
    /// \param nonce the deployment nonce of the sender.
    /// \return the contract address.
    auto contract_address(const evmc::address& sender, uint64_t nonce)
        -> evmc::address;

    /// Converts a bytes-like object to a 0x-prefixed hex string.
    /// \tparam T evmc::address or evmc::bytes32.
    /// \param v value to convert.
    /// \return hex string representation of v.
    template<typename T>
    auto to_hex(const T& v) -> std::string {
        return buffer(v.bytes, sizeof(v.bytes)).to_hex_prefixed();
    }

    /// Parses hexadecimal representation in string format to T
    /// \tparam T type to convert from hex to.
    /// \param hex hex string to parse. May be prefixed with 0x
    /// \return object containing the parsed T or std::nullopt if
    /// parse failed
    template<typename T>
    auto from_hex(const std::string& hex) ->
        typename std::enable_if_t<std::is_same<T, evmc::bytes32>::value
                                      || std::is_same<T, evmc::address>::value,
                                  std::optional<T>> {
        auto maybe_bytes = buffer::from_hex_prefixed(hex);
        if(!maybe_bytes.has_value()) {
            return std::nullopt;
        }
        if(maybe_bytes.value().size() != sizeof(T)) {
            return std::nullopt;
        }

        auto val = T();
        std::memcpy(val.bytes,
                    maybe_bytes.value().data(),
                    maybe_bytes.value().size());
        return val;
    }
}

#endif // GAUSS_BRIDGE_SRC_CHAIN_ADDRESS_H_
