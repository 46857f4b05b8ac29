// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_CHAIN_MATH_H_
#define GAUSS_BRIDGE_SRC_CHAIN_MATH_H_

#include <evmc/evmc.hpp>
#include <optional>

namespace gauss {
    /// Adds two uint256be values, wrapping on overflow.
    /// \param lhs first value.
    /// \param rhs second value.
    /// \return sum of both values modulo 2^256.
    auto operator+(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Subtracts two uint256be values, wrapping on underflow.
    /// \param lhs value to subtract from.
    /// \param rhs value to subtract.
    /// \return lhs - rhs modulo 2^256.
    auto operator-(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Multiplies two uint256be values, wrapping on overflow.
    /// \param lhs first value.
    /// \param rhs second value.
    /// \return lhs * rhs modulo 2^256.
    auto operator*(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Adds two uint256be values.
    /// \return the sum, or std::nullopt if it does not fit in 256 bits.
    auto checked_add(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be>;

    /// Subtracts two uint256be values.
    /// \return lhs - rhs, or std::nullopt if rhs > lhs.
    auto checked_sub(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be>;

    /// Largest representable uint256be value, used for unlimited approvals.
    auto max_uint256() -> evmc::uint256be;

    /// Converts an uint256be to a uint64_t, ignoring higher order bits.
    /// \param v bignum to convert.
    /// \return converted bignum.
    auto to_uint64(const evmc::uint256be& v) -> uint64_t;
}

#endif // GAUSS_BRIDGE_SRC_CHAIN_MATH_H_
