// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_SIM_DEPLOYMENT_H_
#define GAUSS_BRIDGE_SRC_SIM_DEPLOYMENT_H_

#include "bridge/coordinator.hpp"
#include "chain/chain.hpp"
#include "relay/loopback.hpp"
#include "token/erc20.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"
#include "wrapper/wrapped_token.hpp"

#include <memory>

namespace gauss::sim {
    /// Contracts deployed on one chain of a bridge deployment.
    struct side {
        /// The chain.
        std::shared_ptr<chain::chain> m_chain;
        /// Underlying stable token backing the wrapped token.
        std::shared_ptr<token::erc20> m_underlying;
        /// Wrapped token. Local, paired and fee asset of the coordinator.
        std::shared_ptr<wrapper::wrapped_token> m_wrapped;
        /// Relay endpoint.
        std::shared_ptr<relay::loopback> m_relay;
        /// Bridge coordinator.
        std::shared_ptr<bridge::coordinator> m_coordinator;
    };

    /// Home chain and away chain linked by a loopback relay network, each
    /// with the same contracts deployed by the same account in the same
    /// order, so every contract has the same address on both chains.
    class deployment {
      public:
        /// Name of the underlying token on both chains.
        static constexpr auto underlying_name = "Mock Stable Coin";
        /// Symbol of the underlying token on both chains.
        static constexpr auto underlying_symbol = "MSC";

        /// Constructor. Creates both chains and deploys every contract.
        /// \param opts validated options.
        /// \param deployer account deploying and owning the contracts.
        /// \param logger log instance.
        deployment(const config::options& opts,
                   const evmc::address& deployer,
                   std::shared_ptr<logging::log> logger);

        /// Initializes the wrapped tokens and the coordinators on both
        /// chains.
        /// \return invalid_configuration if the twins did not land on the
        ///         same address, or the first init error.
        auto init() -> result_type;

        /// Returns the home chain side.
        [[nodiscard]] auto home() const -> const side&;

        /// Returns the away chain side.
        [[nodiscard]] auto away() const -> const side&;

        /// Returns the relay network.
        [[nodiscard]] auto network() const
            -> const std::shared_ptr<relay::network>&;

        /// Returns the deploying account.
        [[nodiscard]] auto deployer() const -> const evmc::address&;

      private:
        config::options m_opts;
        evmc::address m_deployer;
        std::shared_ptr<logging::log> m_log;
        std::shared_ptr<relay::network> m_network;
        side m_home;
        side m_away;

        auto deploy_side(uint64_t chain_id) -> side;
        auto init_side(const side& s, uint64_t destination_chain_id)
            -> result_type;
    };
}

#endif // GAUSS_BRIDGE_SRC_SIM_DEPLOYMENT_H_
