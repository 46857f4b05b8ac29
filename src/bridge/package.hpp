// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_BRIDGE_PACKAGE_H_
#define GAUSS_BRIDGE_SRC_BRIDGE_PACKAGE_H_

#include "util/common/buffer.hpp"

#include <evmc/evmc.hpp>
#include <optional>

namespace gauss::bridge {
    /// Payload carried by the relay between twin coordinators.
    struct transfer_package {
        /// Final recipient on the destination chain.
        evmc::address m_recipient{};
        /// Net amount after the sender-side fee. Applied verbatim.
        evmc::uint256be m_amount{};
        /// Caller-supplied source address, carried for attribution.
        evmc::address m_source{};

        auto operator==(const transfer_package& rhs) const -> bool;
    };

    /// Size of an encoded package in bytes.
    static constexpr size_t package_size = 96;

    /// Encodes a package as the ABI tuple (address, uint256, address).
    /// \param pkg package to encode.
    /// \return 96-byte encoding.
    auto encode(const transfer_package& pkg) -> buffer;

    /// Decodes a package. There is no version tag, so decoding is strict:
    /// the payload must be exactly \ref package_size bytes and both address
    /// words must carry zero padding.
    /// \param data encoded package.
    /// \return the package, or std::nullopt if the payload is malformed.
    auto decode(const buffer& data) -> std::optional<transfer_package>;
}

#endif // GAUSS_BRIDGE_SRC_BRIDGE_PACKAGE_H_
