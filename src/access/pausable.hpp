// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_ACCESS_PAUSABLE_H_
#define GAUSS_BRIDGE_SRC_ACCESS_PAUSABLE_H_

#include "chain/error.hpp"

namespace gauss::access {
    /// Pause flag gating transfer-affecting entry points.
    class pausable {
      public:
        /// Returns true if paused.
        [[nodiscard]] auto paused() const -> bool;

        /// Checks that the flag is clear.
        /// \return paused if the flag is set.
        [[nodiscard]] auto when_not_paused() const -> result_type;

        /// Sets the flag.
        /// \return paused if already paused.
        auto pause() -> result_type;

        /// Clears the flag.
        /// \return not_paused if not paused.
        auto unpause() -> result_type;

      private:
        bool m_paused{false};
    };
}

#endif // GAUSS_BRIDGE_SRC_ACCESS_PAUSABLE_H_
