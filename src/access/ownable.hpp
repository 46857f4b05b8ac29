// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_ACCESS_OWNABLE_H_
#define GAUSS_BRIDGE_SRC_ACCESS_OWNABLE_H_

#include "chain/context.hpp"
#include "chain/error.hpp"

#include <evmc/evmc.hpp>

namespace gauss::access {
    /// Single-owner gate. Owned by the contract that composes it; the
    /// contract emits the ownership events.
    class ownable {
      public:
        ownable() = default;

        /// Constructor.
        /// \param owner initial owner, normally the deployer.
        explicit ownable(const evmc::address& owner);

        /// Returns the current owner.
        [[nodiscard]] auto owner() const -> const evmc::address&;

        /// Checks that the caller is the owner.
        /// \param ctx call context.
        /// \return not_owner if the caller is not the owner.
        [[nodiscard]] auto only_owner(const chain::call_context& ctx) const
            -> result_type;

        /// Hands ownership to another account.
        /// \param ctx call context; the caller must be the owner.
        /// \param new_owner account receiving ownership; must not be zero.
        /// \return not_owner or zero_address on rejection.
        auto transfer_ownership(const chain::call_context& ctx,
                                const evmc::address& new_owner)
            -> result_type;

      private:
        evmc::address m_owner{};
    };
}

#endif // GAUSS_BRIDGE_SRC_ACCESS_OWNABLE_H_
