// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "package.hpp"

#include "util/serialization/abi.hpp"

namespace gauss::bridge {
    auto transfer_package::operator==(const transfer_package& rhs) const
        -> bool {
        return m_recipient == rhs.m_recipient && m_amount == rhs.m_amount
            && m_source == rhs.m_source;
    }

    auto encode(const transfer_package& pkg) -> buffer {
        auto ret = buffer();
        abi::encode_address(ret, pkg.m_recipient);
        abi::encode_uint256(ret, pkg.m_amount);
        abi::encode_address(ret, pkg.m_source);
        return ret;
    }

    auto decode(const buffer& data) -> std::optional<transfer_package> {
        auto dec = abi::decoder(data);
        auto recipient = dec.decode_address();
        auto amount = dec.decode_uint256();
        auto source = dec.decode_address();
        if(!recipient.has_value() || !amount.has_value()
           || !source.has_value() || !dec.done()) {
            return std::nullopt;
        }
        return transfer_package{recipient.value(),
                                amount.value(),
                                source.value()};
    }
}
