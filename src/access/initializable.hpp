// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_ACCESS_INITIALIZABLE_H_
#define GAUSS_BRIDGE_SRC_ACCESS_INITIALIZABLE_H_

#include "chain/error.hpp"

#include <cstdint>

namespace gauss::access {
    /// One-time setup states. The only legal transition is
    /// uninitialized -> initialized.
    enum class lifecycle_state : uint8_t {
        /// Deployed, configuration zero-valued.
        uninitialized,
        /// init has run; role and configuration are set.
        initialized
    };

    /// Explicit one-time initialization state machine.
    class initializable {
      public:
        /// Returns the current state.
        [[nodiscard]] auto state() const -> lifecycle_state {
            return m_state;
        }

        /// Returns true once initialized.
        [[nodiscard]] auto initialized() const -> bool {
            return m_state == lifecycle_state::initialized;
        }

        /// Checks that init has run.
        /// \return not_initialized before init.
        [[nodiscard]] auto require_initialized() const -> result_type {
            if(!initialized()) {
                return error_code::not_initialized;
            }
            return std::nullopt;
        }

        /// Checks that init may run.
        /// \return already_initialized after init.
        [[nodiscard]] auto require_uninitialized() const -> result_type {
            if(initialized()) {
                return error_code::already_initialized;
            }
            return std::nullopt;
        }

        /// Performs the transition.
        /// \return already_initialized if the transition already happened.
        auto initialize() -> result_type {
            if(auto err = require_uninitialized()) {
                return err;
            }
            m_state = lifecycle_state::initialized;
            return std::nullopt;
        }

      private:
        lifecycle_state m_state{lifecycle_state::uninitialized};
    };
}

#endif // GAUSS_BRIDGE_SRC_ACCESS_INITIALIZABLE_H_
