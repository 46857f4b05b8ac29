// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "reentrancy_guard.hpp"

namespace gauss::access {
    reentrancy_guard::scope::scope(bool& entered) : m_entered(&entered) {
        *m_entered = true;
    }

    reentrancy_guard::scope::scope(scope&& other) noexcept
        : m_entered(other.m_entered) {
        other.m_entered = nullptr;
    }

    reentrancy_guard::scope::~scope() {
        if(m_entered != nullptr) {
            *m_entered = false;
        }
    }

    auto reentrancy_guard::enter() -> std::optional<scope> {
        if(m_entered) {
            return std::nullopt;
        }
        return scope(m_entered);
    }

    auto reentrancy_guard::entered() const -> bool {
        return m_entered;
    }
}
