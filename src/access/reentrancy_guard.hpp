// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_ACCESS_REENTRANCY_GUARD_H_
#define GAUSS_BRIDGE_SRC_ACCESS_REENTRANCY_GUARD_H_

#include <optional>

namespace gauss::access {
    /// Non-reentrant flag shared by the guarded entry points of one contract
    /// instance. Protects against recursive entry only; independent calls are
    /// serialized by the chain.
    class reentrancy_guard {
      public:
        /// Holds the guard while alive.
        class scope {
          public:
            ~scope();
            scope(const scope&) = delete;
            auto operator=(const scope&) -> scope& = delete;
            scope(scope&& other) noexcept;
            auto operator=(scope&&) -> scope& = delete;

          private:
            friend class reentrancy_guard;
            explicit scope(bool& entered);

            bool* m_entered;
        };

        /// Enters the guard.
        /// \return a scope releasing the guard on destruction, or
        ///         std::nullopt if the guard is already held.
        [[nodiscard]] auto enter() -> std::optional<scope>;

        /// Returns true while a guarded call is executing.
        [[nodiscard]] auto entered() const -> bool;

      private:
        bool m_entered{false};
    };
}

#endif // GAUSS_BRIDGE_SRC_ACCESS_REENTRANCY_GUARD_H_
