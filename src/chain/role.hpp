// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_CHAIN_ROLE_H_
#define GAUSS_BRIDGE_SRC_CHAIN_ROLE_H_

#include "error.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace gauss::chain {
    /// Gauss mainnet chain id.
    static constexpr uint64_t gauss_mainnet_chain_id = 1777;
    /// Gauss testnet chain id.
    static constexpr uint64_t gauss_testnet_chain_id = 1452;
    /// Polygon mainnet chain id.
    static constexpr uint64_t polygon_mainnet_chain_id = 137;
    /// Polygon Mumbai testnet chain id.
    static constexpr uint64_t polygon_testnet_chain_id = 80001;

    /// Role of a deployment.
    enum class chain_role : uint8_t {
        /// Not resolved yet. Contracts start here until init.
        unresolved,
        /// Home chain: mints and burns the wrapped asset.
        home,
        /// Away chain: holds the underlying asset and locks value.
        away
    };

    /// Treatment of chain ids that are neither a known home nor a known
    /// away chain.
    enum class unknown_chain_policy : uint8_t {
        /// Any chain that is not a home chain is an away chain.
        default_away,
        /// Unknown chains fail resolution with unsupported_chain.
        reject_unknown
    };

    /// Returns a printable name for a role.
    auto to_string(chain_role role) -> std::string;

    /// Determines the role of a deployment from the chain id observed at
    /// initialization. Contracts call \ref resolve exactly once, inside init,
    /// and cache the result.
    class role_resolver {
      public:
        /// Constructs a resolver for the Gauss mainnet and testnet as home
        /// chains and Polygon mainnet and Mumbai as away chains.
        role_resolver();

        /// Constructor.
        /// \param home_chain_ids chain ids that resolve to home.
        /// \param away_chain_ids chain ids known to be away chains.
        /// \param policy treatment of chain ids in neither set.
        role_resolver(std::set<uint64_t> home_chain_ids,
                      std::set<uint64_t> away_chain_ids,
                      unknown_chain_policy policy);

        /// Resolves the role for an observed chain id.
        /// \param observed_chain_id chain id of the executing chain.
        /// \return home or away, or unsupported_chain when the id is unknown
        ///         and the policy is reject_unknown.
        [[nodiscard]] auto resolve(uint64_t observed_chain_id) const
            -> value_result_type<chain_role>;

        /// Returns true if the chain id is a configured home chain.
        [[nodiscard]] auto is_home(uint64_t chain_id) const -> bool;

        /// Returns the unknown-chain policy.
        [[nodiscard]] auto policy() const -> unknown_chain_policy;

      private:
        std::set<uint64_t> m_home_chain_ids;
        std::set<uint64_t> m_away_chain_ids;
        unknown_chain_policy m_policy{unknown_chain_policy::default_away};
    };
}

#endif // GAUSS_BRIDGE_SRC_CHAIN_ROLE_H_
