// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <cstring>
#include <ethash/keccak.hpp>
#include <iomanip>
#include <sstream>
#include <vector>

namespace gauss {
    auto to_string(const hash_t& val) -> std::string {
        std::stringstream ret;
        ret << std::hex << std::setfill('0');

        for(const auto& byte : val) {
            ret << std::setw(2) << static_cast<int>(byte);
        }

        return ret.str();
    }

    auto keccak_data(const void* data, size_t len) -> hash_t {
        hash_t ret{};
        auto data_vec = std::vector<uint8_t>(len);
        if(len > 0) {
            std::memcpy(data_vec.data(), data, len);
        }
        auto resp = ethash::keccak256(data_vec.data(), data_vec.size());
        std::memcpy(ret.data(), resp.bytes, sizeof(resp.bytes));
        return ret;
    }

    auto keccak_string(const std::string& str) -> hash_t {
        return keccak_data(str.data(), str.size());
    }
}
