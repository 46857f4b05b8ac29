// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_SERIALIZATION_ABI_H_
#define GAUSS_BRIDGE_SRC_SERIALIZATION_ABI_H_

#include "util/common/buffer.hpp"

#include <cstdint>
#include <evmc/evmc.hpp>
#include <optional>

/// Canonical fixed-width ABI encoding of static types. Every value occupies
/// one 32-byte big-endian word; addresses are left-padded with zeroes.
namespace gauss::abi {
    /// Size of one ABI word in bytes.
    static constexpr size_t word_size = 32;
    /// Offset of the address bytes inside an address word.
    static constexpr size_t address_word_offset
        = word_size - sizeof(evmc::address::bytes);

    /// Appends an address as one left-padded word.
    /// \param out buffer to append to.
    /// \param addr address to encode.
    void encode_address(buffer& out, const evmc::address& addr);

    /// Appends a 256-bit unsigned integer as one word.
    /// \param out buffer to append to.
    /// \param val value to encode.
    void encode_uint256(buffer& out, const evmc::uint256be& val);

    /// Reads consecutive words from the start of a buffer.
    class decoder {
      public:
        /// Constructor.
        /// \param in encoded words. Must outlive the decoder.
        explicit decoder(const buffer& in);

        /// Reads one address word. Fails if the 12 padding bytes are not
        /// zero, which is how a word holding something other than an
        /// address shows up.
        /// \return the address, or std::nullopt if the word is short or
        ///         padded with non-zero bytes.
        auto decode_address() -> std::optional<evmc::address>;

        /// Reads one 256-bit unsigned integer word.
        /// \return the value, or std::nullopt if fewer than 32 bytes remain.
        auto decode_uint256() -> std::optional<evmc::uint256be>;

        /// Returns true once every byte of the input has been read.
        [[nodiscard]] auto done() const -> bool;

      private:
        const buffer& m_in;
        size_t m_offset{};

        auto next_word() -> const uint8_t*;
    };
}

#endif // GAUSS_BRIDGE_SRC_SERIALIZATION_ABI_H_
