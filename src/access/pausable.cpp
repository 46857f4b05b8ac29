// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pausable.hpp"

namespace gauss::access {
    auto pausable::paused() const -> bool {
        return m_paused;
    }

    auto pausable::when_not_paused() const -> result_type {
        if(m_paused) {
            return error_code::paused;
        }
        return std::nullopt;
    }

    auto pausable::pause() -> result_type {
        if(auto err = when_not_paused()) {
            return err;
        }
        m_paused = true;
        return std::nullopt;
    }

    auto pausable::unpause() -> result_type {
        if(!m_paused) {
            return error_code::not_paused;
        }
        m_paused = false;
        return std::nullopt;
    }
}
