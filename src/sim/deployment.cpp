// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "deployment.hpp"

namespace gauss::sim {
    deployment::deployment(const config::options& opts,
                           const evmc::address& deployer,
                           std::shared_ptr<logging::log> logger)
        : m_opts(opts),
          m_deployer(deployer),
          m_log(std::move(logger)),
          m_network(std::make_shared<relay::network>(m_log)) {
        m_home = deploy_side(m_opts.m_home_chain_id);
        m_away = deploy_side(m_opts.m_away_chain_id);
    }

    auto deployment::init() -> result_type {
        if(m_home.m_coordinator->address()
               != m_away.m_coordinator->address()
           || m_home.m_wrapped->address() != m_away.m_wrapped->address()) {
            m_log->error("Twin contracts deployed at different addresses");
            return error_code::invalid_configuration;
        }
        if(auto err = init_side(m_home, m_opts.m_away_chain_id)) {
            return err;
        }
        return init_side(m_away, m_opts.m_home_chain_id);
    }

    auto deployment::home() const -> const side& {
        return m_home;
    }

    auto deployment::away() const -> const side& {
        return m_away;
    }

    auto deployment::network() const
        -> const std::shared_ptr<relay::network>& {
        return m_network;
    }

    auto deployment::deployer() const -> const evmc::address& {
        return m_deployer;
    }

    auto deployment::deploy_side(uint64_t chain_id) -> side {
        auto ret = side();
        ret.m_chain = std::make_shared<chain::chain>(chain_id, m_log);
        auto& c = *ret.m_chain;
        const auto decimals = static_cast<uint8_t>(m_opts.m_token_decimals);
        const auto resolver
            = chain::role_resolver(m_opts.m_home_chain_ids,
                                   m_opts.m_away_chain_ids,
                                   m_opts.m_unknown_chain_policy);

        ret.m_underlying = c.deploy<token::erc20>(m_deployer,
                                                  underlying_name,
                                                  underlying_symbol,
                                                  decimals,
                                                  m_deployer);
        ret.m_wrapped = c.deploy<wrapper::wrapped_token>(
            m_deployer,
            ret.m_underlying->address(),
            m_deployer,
            resolver,
            wrapper::metadata{m_opts.m_token_name,
                              m_opts.m_token_symbol,
                              decimals});
        ret.m_relay = c.deploy<relay::loopback>(m_deployer,
                                                m_network,
                                                ret.m_wrapped->address());
        ret.m_coordinator
            = c.deploy<bridge::coordinator>(m_deployer, m_deployer, resolver);
        m_network->attach(ret.m_relay);
        return ret;
    }

    auto deployment::init_side(const side& s, uint64_t destination_chain_id)
        -> result_type {
        auto& c = *s.m_chain;
        const auto ctx = c.context(m_deployer);
        auto res = c.execute([&]() -> result_type {
            if(auto err = s.m_wrapped->init(ctx,
                                            s.m_coordinator->address())) {
                return err;
            }
            auto cfg = bridge::settings();
            cfg.m_relay = s.m_relay->address();
            cfg.m_local_asset = s.m_wrapped->address();
            cfg.m_paired_asset = s.m_wrapped->address();
            cfg.m_fee_token = s.m_wrapped->address();
            cfg.m_fee_amount = m_opts.m_fee_amount;
            cfg.m_confirmations = m_opts.m_confirmations;
            cfg.m_destination_chain_id = destination_chain_id;
            return s.m_coordinator->init(ctx, cfg);
        });
        if(res.has_value()) {
            m_log->error("Initialization on chain",
                         c.id(),
                         "failed:",
                         to_string(res.value()));
            return res;
        }
        m_log->info("Initialized chain",
                    c.id(),
                    "as",
                    chain::to_string(s.m_coordinator->role()));
        return std::nullopt;
    }
}
