// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../../util.hpp"
#include "access/events.hpp"
#include "bridge/coordinator.hpp"
#include "bridge/events.hpp"
#include "bridge/package.hpp"
#include "chain/math.hpp"
#include "relay/loopback.hpp"
#include "token/erc20.hpp"
#include "wrapper/wrapped_token.hpp"

#include <gtest/gtest.h>

using gauss::test::amount;
using gauss::test::expect_error;
using gauss::test::make_address;

class coordinator_test : public ::testing::Test {
  protected:
    static constexpr uint64_t fee = 10;

    void deploy(uint64_t chain_id) {
        const auto peer_id = chain_id == gauss::chain::gauss_mainnet_chain_id
                               ? gauss::chain::polygon_mainnet_chain_id
                               : gauss::chain::gauss_mainnet_chain_id;
        auto log = gauss::test::quiet_logger();
        m_network = std::make_shared<gauss::relay::network>(log);
        m_chain = std::make_unique<gauss::chain::chain>(chain_id, log);
        m_peer = std::make_unique<gauss::chain::chain>(peer_id, log);

        m_underlying = m_chain->deploy<gauss::token::erc20>(m_owner,
                                                            "Mock Stable Coin",
                                                            "MSC",
                                                            6,
                                                            m_owner);
        m_wrapped = m_chain->deploy<gauss::wrapper::wrapped_token>(
            m_owner,
            m_underlying->address(),
            m_owner,
            gauss::chain::role_resolver());
        m_relay = m_chain->deploy<gauss::relay::loopback>(
            m_owner,
            m_network,
            m_wrapped->address());
        m_coordinator = m_chain->deploy<gauss::bridge::coordinator>(
            m_owner,
            m_owner,
            gauss::chain::role_resolver());
        m_peer_relay = m_peer->deploy<gauss::relay::loopback>(
            m_owner,
            m_network,
            m_wrapped->address());
        m_network->attach(m_relay);
        m_network->attach(m_peer_relay);

        ASSERT_FALSE(
            m_wrapped->init(ctx(m_owner), m_coordinator->address()));
    }

    void deploy_and_init(uint64_t chain_id) {
        deploy(chain_id);
        ASSERT_FALSE(m_coordinator->init(ctx(m_owner), settings()));
        ASSERT_FALSE(m_wrapped->approve(ctx(m_user),
                                        m_coordinator->address(),
                                        gauss::max_uint256()));
    }

    [[nodiscard]] auto settings() const -> gauss::bridge::settings {
        auto cfg = gauss::bridge::settings();
        cfg.m_relay = m_relay->address();
        cfg.m_local_asset = m_wrapped->address();
        cfg.m_paired_asset = m_wrapped->address();
        cfg.m_fee_token = m_wrapped->address();
        cfg.m_fee_amount = amount(fee);
        cfg.m_confirmations = 3;
        cfg.m_destination_chain_id = m_peer->id();
        return cfg;
    }

    [[nodiscard]] auto ctx(const evmc::address& sender) const
        -> gauss::chain::call_context {
        return m_chain->context(sender);
    }

    [[nodiscard]] auto relay_ctx() const -> gauss::chain::call_context {
        return ctx(m_relay->address());
    }

    /// Runs message_process as the relay would, with a well-formed package
    /// from the twin coordinator.
    auto deliver(const evmc::address& recipient, uint64_t net)
        -> gauss::result_type {
        return deliver_raw(
            m_coordinator->address(),
            gauss::bridge::encode({recipient, amount(net), recipient}));
    }

    auto deliver_raw(const evmc::address& sender, const gauss::buffer& data)
        -> gauss::result_type {
        return m_chain->execute([&]() -> gauss::result_type {
            return m_coordinator->message_process(relay_ctx(),
                                                  evmc::bytes32(7),
                                                  m_peer->id(),
                                                  sender,
                                                  evmc::address(),
                                                  evmc::uint256be(),
                                                  data);
        });
    }

    /// Gives the user wrapped tokens: a deposit on the away chain, a
    /// relayed mint on the home chain.
    void fund_user(uint64_t n) {
        if(m_wrapped->is_home()) {
            ASSERT_FALSE(deliver(m_user, n));
            return;
        }
        ASSERT_FALSE(m_underlying->mint(ctx(m_owner), m_user, amount(n)));
        ASSERT_FALSE(m_underlying->approve(ctx(m_user),
                                           m_wrapped->address(),
                                           amount(n)));
        ASSERT_FALSE(m_wrapped->deposit_for(ctx(m_user), m_user, amount(n)));
    }

    auto initiate(uint64_t n, bool express = false)
        -> gauss::value_result_type<evmc::bytes32> {
        return m_chain->execute([&]() {
            return m_coordinator->initiate_transfer(ctx(m_user),
                                                    m_recipient,
                                                    amount(n),
                                                    m_user,
                                                    express);
        });
    }

    [[nodiscard]] auto events(const std::string& signature) const -> size_t {
        return gauss::test::count_events(*m_chain,
                                         m_coordinator->address(),
                                         signature);
    }

    std::shared_ptr<gauss::relay::network> m_network;
    std::unique_ptr<gauss::chain::chain> m_chain;
    std::unique_ptr<gauss::chain::chain> m_peer;
    evmc::address m_owner{make_address(0xee)};
    evmc::address m_user{make_address(1)};
    evmc::address m_recipient{make_address(2)};
    std::shared_ptr<gauss::token::erc20> m_underlying;
    std::shared_ptr<gauss::wrapper::wrapped_token> m_wrapped;
    std::shared_ptr<gauss::relay::loopback> m_relay;
    std::shared_ptr<gauss::relay::loopback> m_peer_relay;
    std::shared_ptr<gauss::bridge::coordinator> m_coordinator;
};

TEST_F(coordinator_test, init_approves_relay) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    EXPECT_TRUE(m_coordinator->initialized());
    EXPECT_EQ(m_coordinator->role(), gauss::chain::chain_role::away);
    EXPECT_EQ(m_wrapped->allowance(m_coordinator->address(),
                                   m_relay->address()),
              gauss::max_uint256());
    EXPECT_EQ(m_coordinator->config().m_destination_chain_id,
              gauss::chain::gauss_mainnet_chain_id);
}

TEST_F(coordinator_test, init_checks) {
    deploy(gauss::chain::gauss_mainnet_chain_id);
    expect_error(m_coordinator->init(ctx(m_user), settings()),
                 gauss::error_code::not_owner);
    auto cfg = settings();
    cfg.m_relay = evmc::address();
    expect_error(m_coordinator->init(ctx(m_owner), cfg),
                 gauss::error_code::zero_address);
    cfg = settings();
    cfg.m_fee_token = make_address(0x55);
    auto res = m_chain->execute([&]() {
        return m_coordinator->init(ctx(m_owner), cfg);
    });
    expect_error(res, gauss::error_code::unknown_contract);
    EXPECT_FALSE(m_coordinator->initialized());

    ASSERT_FALSE(m_coordinator->init(ctx(m_owner), settings()));
    EXPECT_TRUE(m_coordinator->is_home());
    expect_error(m_coordinator->init(ctx(m_owner), settings()),
                 gauss::error_code::already_initialized);
}

TEST_F(coordinator_test, init_rejects_foreign_chain_context) {
    deploy(gauss::chain::polygon_mainnet_chain_id);
    const auto forged = gauss::chain::call_context{
        m_owner,
        gauss::chain::gauss_mainnet_chain_id};
    expect_error(m_coordinator->init(forged, settings()),
                 gauss::error_code::chain_mismatch);
    EXPECT_FALSE(m_coordinator->initialized());
    ASSERT_FALSE(m_coordinator->init(ctx(m_owner), settings()));
    EXPECT_FALSE(m_coordinator->is_home());
}

TEST_F(coordinator_test, transfer_requires_init) {
    deploy(gauss::chain::polygon_mainnet_chain_id);
    expect_error(initiate(100), gauss::error_code::not_initialized);
    expect_error(deliver(m_user, 1), gauss::error_code::not_initialized);
}

TEST_F(coordinator_test, amount_must_exceed_fee) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    fund_user(100);
    expect_error(initiate(fee - 1), gauss::error_code::amount_too_low);
    expect_error(initiate(fee), gauss::error_code::amount_too_low);
    EXPECT_EQ(m_wrapped->balance_of(m_user), amount(100));

    auto res = initiate(fee + 1);
    ASSERT_FALSE(gauss::failed(res));
    ASSERT_EQ(m_relay->outbox().size(), 1U);
    auto pkg = gauss::bridge::decode(m_relay->outbox().front().m_data);
    ASSERT_TRUE(pkg.has_value());
    EXPECT_EQ(pkg->m_amount, amount(1));
}

TEST_F(coordinator_test, zero_recipient_rejected) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    fund_user(100);
    auto res = m_chain->execute([&]() {
        return m_coordinator->initiate_transfer(ctx(m_user),
                                                evmc::address(),
                                                amount(50),
                                                m_user,
                                                false);
    });
    expect_error(res, gauss::error_code::invalid_recipient);
}

TEST_F(coordinator_test, away_transfer_locks_amount) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    fund_user(1000);
    auto res = initiate(1000);
    ASSERT_FALSE(gauss::failed(res));
    const auto tx_id = std::get<evmc::bytes32>(res);

    EXPECT_EQ(m_wrapped->balance_of(m_user), evmc::uint256be());
    EXPECT_EQ(m_wrapped->balance_of(m_coordinator->address()), amount(990));
    EXPECT_EQ(m_wrapped->balance_of(m_relay->address()), amount(fee));
    // Nothing is burned on the away chain.
    EXPECT_EQ(m_wrapped->total_supply(), amount(1000));

    ASSERT_EQ(m_relay->outbox().size(), 1U);
    const auto& msg = m_relay->outbox().front();
    EXPECT_EQ(msg.m_tx_id, tx_id);
    EXPECT_EQ(msg.m_dest_chain_id, m_peer->id());
    EXPECT_EQ(msg.m_sender, m_coordinator->address());
    EXPECT_EQ(msg.m_recipient, m_coordinator->address());
    EXPECT_EQ(msg.m_confirmations, 3U);
    EXPECT_FALSE(msg.m_express);
    auto pkg = gauss::bridge::decode(msg.m_data);
    ASSERT_TRUE(pkg.has_value());
    EXPECT_EQ(pkg->m_recipient, m_recipient);
    EXPECT_EQ(pkg->m_amount, amount(990));
    EXPECT_EQ(pkg->m_source, m_user);

    EXPECT_EQ(events(gauss::bridge::transfer_initiated_signature), 1U);
}

TEST_F(coordinator_test, home_transfer_burns_net) {
    deploy_and_init(gauss::chain::gauss_mainnet_chain_id);
    fund_user(500);
    ASSERT_FALSE(gauss::failed(initiate(500)));
    EXPECT_EQ(m_wrapped->balance_of(m_user), evmc::uint256be());
    EXPECT_EQ(m_wrapped->total_supply(), amount(fee));
    EXPECT_EQ(m_wrapped->balance_of(m_relay->address()), amount(fee));
    EXPECT_EQ(m_wrapped->balance_of(m_coordinator->address()),
              evmc::uint256be());
}

TEST_F(coordinator_test, express_flag_reaches_relay) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    fund_user(100);
    ASSERT_FALSE(gauss::failed(initiate(100, true)));
    ASSERT_EQ(m_relay->outbox().size(), 1U);
    EXPECT_TRUE(m_relay->outbox().front().m_express);
}

TEST_F(coordinator_test, pause_blocks_initiate) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    fund_user(100);
    expect_error(m_coordinator->pause(ctx(m_user)),
                 gauss::error_code::not_owner);
    ASSERT_FALSE(m_coordinator->pause(ctx(m_owner)));
    EXPECT_TRUE(m_coordinator->paused());
    expect_error(initiate(100), gauss::error_code::paused);
    ASSERT_FALSE(m_coordinator->unpause(ctx(m_owner)));
    EXPECT_FALSE(gauss::failed(initiate(100)));
    EXPECT_EQ(events(gauss::access::paused_signature), 1U);
    EXPECT_EQ(events(gauss::access::unpaused_signature), 1U);
}

TEST_F(coordinator_test, message_from_non_relay_rejected) {
    deploy_and_init(gauss::chain::gauss_mainnet_chain_id);
    auto data = gauss::bridge::encode({m_user, amount(10), m_user});
    auto res = m_chain->execute([&]() {
        return m_coordinator->message_process(ctx(m_user),
                                              evmc::bytes32(1),
                                              m_peer->id(),
                                              m_coordinator->address(),
                                              evmc::address(),
                                              evmc::uint256be(),
                                              data);
    });
    expect_error(res, gauss::error_code::not_relay);
    EXPECT_EQ(m_wrapped->total_supply(), evmc::uint256be());
}

TEST_F(coordinator_test, message_from_foreign_sender_rejected) {
    deploy_and_init(gauss::chain::gauss_mainnet_chain_id);
    expect_error(deliver_raw(m_user,
                             gauss::bridge::encode({m_user, amount(10), m_user})),
                 gauss::error_code::invalid_sender);
    EXPECT_EQ(m_wrapped->total_supply(), evmc::uint256be());
}

TEST_F(coordinator_test, malformed_package_rejected) {
    deploy_and_init(gauss::chain::gauss_mainnet_chain_id);
    auto data = gauss::bridge::encode({m_user, amount(10), m_user});
    data.extend(1);
    expect_error(deliver_raw(m_coordinator->address(), data),
                 gauss::error_code::invalid_package);
    expect_error(deliver_raw(m_coordinator->address(), gauss::buffer()),
                 gauss::error_code::invalid_package);
}

TEST_F(coordinator_test, home_delivery_mints_exact_net) {
    deploy_and_init(gauss::chain::gauss_mainnet_chain_id);
    ASSERT_FALSE(deliver(m_recipient, 990));
    EXPECT_EQ(m_wrapped->balance_of(m_recipient), amount(990));
    EXPECT_EQ(m_wrapped->total_supply(), amount(990));
    EXPECT_EQ(events(gauss::bridge::transfer_completed_signature), 1U);
}

TEST_F(coordinator_test, away_delivery_unlocks_custody) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    fund_user(1000);
    ASSERT_FALSE(gauss::failed(initiate(1000)));
    ASSERT_FALSE(deliver(m_recipient, 400));
    EXPECT_EQ(m_wrapped->balance_of(m_recipient), amount(400));
    EXPECT_EQ(m_wrapped->balance_of(m_coordinator->address()), amount(590));

    // More than custody holds.
    expect_error(deliver(m_recipient, 591),
                 gauss::error_code::transfer_amount_exceeds_balance);
    EXPECT_EQ(m_wrapped->balance_of(m_recipient), amount(400));
}

TEST_F(coordinator_test, relay_failure_rolls_back_lock) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    fund_user(100);
    auto stranded = m_chain->deploy<gauss::bridge::coordinator>(
        m_owner,
        m_owner,
        gauss::chain::role_resolver());
    auto cfg = settings();
    cfg.m_destination_chain_id = 4242;
    ASSERT_FALSE(stranded->init(ctx(m_owner), cfg));
    ASSERT_FALSE(m_wrapped->approve(ctx(m_user),
                                    stranded->address(),
                                    gauss::max_uint256()));

    auto res = m_chain->execute([&]() {
        return stranded->initiate_transfer(ctx(m_user),
                                           m_recipient,
                                           amount(100),
                                           m_user,
                                           false);
    });
    expect_error(res, gauss::error_code::unknown_destination);
    EXPECT_EQ(m_wrapped->balance_of(m_user), amount(100));
    EXPECT_EQ(m_wrapped->balance_of(stranded->address()), evmc::uint256be());
    EXPECT_TRUE(m_relay->outbox().empty());
}

TEST_F(coordinator_test, reentrant_initiate_rejected) {
    deploy(gauss::chain::polygon_mainnet_chain_id);
    auto cb = m_chain->deploy<gauss::test::callback_token>(m_owner);
    cb->credit(m_user, amount(100));
    auto cfg = settings();
    cfg.m_local_asset = cb->address();
    cfg.m_paired_asset = cb->address();
    cfg.m_fee_token = cb->address();
    cfg.m_fee_amount = evmc::uint256be();
    ASSERT_FALSE(m_coordinator->init(ctx(m_owner), cfg));

    auto inner = gauss::result_type();
    cb->set_hook([&](const gauss::chain::call_context& /* unused */) {
        auto res = m_coordinator->initiate_transfer(ctx(m_user),
                                                    m_recipient,
                                                    amount(10),
                                                    m_user,
                                                    false);
        if(gauss::failed(res)) {
            inner = std::get<gauss::error_code>(res);
            return inner;
        }
        return gauss::result_type();
    });

    expect_error(initiate(50), gauss::error_code::reentrant_call);
    expect_error(inner, gauss::error_code::reentrant_call);
    EXPECT_EQ(cb->balance_of(m_user), amount(100));
    EXPECT_TRUE(m_relay->outbox().empty());

    // The guard is released after the failed call.
    cb->set_hook(nullptr);
    EXPECT_FALSE(gauss::failed(initiate(50)));
}

TEST_F(coordinator_test, message_process_during_initiate_rejected) {
    deploy(gauss::chain::polygon_mainnet_chain_id);
    auto cb = m_chain->deploy<gauss::test::callback_token>(m_owner);
    cb->credit(m_user, amount(100));
    cb->credit(m_coordinator->address(), amount(40));
    auto cfg = settings();
    cfg.m_local_asset = cb->address();
    cfg.m_paired_asset = cb->address();
    cfg.m_fee_token = cb->address();
    cfg.m_fee_amount = evmc::uint256be();
    ASSERT_FALSE(m_coordinator->init(ctx(m_owner), cfg));

    // The lock pull hands control to the token, which calls back in with
    // a well-formed message from the relay.
    auto inner = gauss::result_type();
    cb->set_hook([&](const gauss::chain::call_context& /* unused */) {
        inner = m_coordinator->message_process(
            relay_ctx(),
            evmc::bytes32(9),
            m_peer->id(),
            m_coordinator->address(),
            evmc::address(),
            evmc::uint256be(),
            gauss::bridge::encode({m_user, amount(40), m_user}));
        return inner;
    });

    expect_error(initiate(50), gauss::error_code::reentrant_call);
    expect_error(inner, gauss::error_code::reentrant_call);
    EXPECT_EQ(cb->balance_of(m_user), amount(100));
    EXPECT_TRUE(m_relay->outbox().empty());

    cb->set_hook(nullptr);
    EXPECT_FALSE(deliver(m_user, 40));
    EXPECT_EQ(cb->balance_of(m_user), amount(140));
}

TEST_F(coordinator_test, update_bridge_moves_approval) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    auto next = m_chain->deploy<gauss::relay::loopback>(m_owner,
                                                        m_network,
                                                        m_wrapped->address());
    expect_error(m_coordinator->update_bridge(ctx(m_user), next->address()),
                 gauss::error_code::not_owner);
    expect_error(m_coordinator->update_bridge(ctx(m_owner), evmc::address()),
                 gauss::error_code::zero_address);
    ASSERT_FALSE(m_coordinator->update_bridge(ctx(m_owner), next->address()));
    EXPECT_EQ(m_coordinator->config().m_relay, next->address());
    EXPECT_EQ(m_wrapped->allowance(m_coordinator->address(),
                                   m_relay->address()),
              evmc::uint256be());
    EXPECT_EQ(m_wrapped->allowance(m_coordinator->address(),
                                   next->address()),
              gauss::max_uint256());

    // The previous relay can no longer deliver.
    expect_error(deliver(m_recipient, 1), gauss::error_code::not_relay);
}

TEST_F(coordinator_test, update_fee_token_moves_approval) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    auto fee_token = m_chain->deploy<gauss::token::erc20>(m_owner,
                                                          "Fee",
                                                          "FEE",
                                                          18,
                                                          m_owner);
    expect_error(
        m_coordinator->update_fee_token(ctx(m_user), fee_token->address()),
        gauss::error_code::not_owner);
    ASSERT_FALSE(
        m_coordinator->update_fee_token(ctx(m_owner), fee_token->address()));
    EXPECT_EQ(m_coordinator->config().m_fee_token, fee_token->address());
    EXPECT_EQ(m_wrapped->allowance(m_coordinator->address(),
                                   m_relay->address()),
              evmc::uint256be());
    EXPECT_EQ(fee_token->allowance(m_coordinator->address(),
                                   m_relay->address()),
              gauss::max_uint256());
}

TEST_F(coordinator_test, update_fee_and_confirmations) {
    deploy(gauss::chain::polygon_mainnet_chain_id);
    expect_error(m_coordinator->update_fee_amount(ctx(m_owner), amount(1)),
                 gauss::error_code::not_initialized);
    ASSERT_FALSE(m_coordinator->init(ctx(m_owner), settings()));
    ASSERT_FALSE(m_wrapped->approve(ctx(m_user),
                                    m_coordinator->address(),
                                    gauss::max_uint256()));
    expect_error(m_coordinator->update_confirmations(ctx(m_user), 9),
                 gauss::error_code::not_owner);
    ASSERT_FALSE(m_coordinator->update_fee_amount(ctx(m_owner), amount(25)));
    ASSERT_FALSE(m_coordinator->update_confirmations(ctx(m_owner), 9));
    EXPECT_EQ(m_coordinator->config().m_fee_amount, amount(25));
    EXPECT_EQ(m_coordinator->config().m_confirmations, 9U);

    fund_user(100);
    expect_error(initiate(25), gauss::error_code::amount_too_low);
    ASSERT_FALSE(gauss::failed(initiate(100)));
    const auto& msg = m_relay->outbox().front();
    EXPECT_EQ(msg.m_confirmations, 9U);
    EXPECT_EQ(gauss::bridge::decode(msg.m_data)->m_amount, amount(75));
    EXPECT_EQ(m_wrapped->balance_of(m_relay->address()), amount(25));
}

TEST_F(coordinator_test, owner_recovery_calls) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    fund_user(100);
    ASSERT_FALSE(m_wrapped->transfer(ctx(m_user),
                                     m_coordinator->address(),
                                     amount(30)));
    expect_error(m_coordinator->withdraw_erc20(ctx(m_user),
                                               m_wrapped->address(),
                                               m_user),
                 gauss::error_code::not_owner);
    ASSERT_FALSE(m_coordinator->withdraw_erc20(ctx(m_owner),
                                               m_wrapped->address(),
                                               m_owner));
    EXPECT_EQ(m_wrapped->balance_of(m_owner), amount(30));

    ASSERT_FALSE(m_chain->credit_native(m_coordinator->address(), amount(5)));
    expect_error(m_coordinator->native_recover(ctx(m_user), m_user),
                 gauss::error_code::not_owner);
    ASSERT_FALSE(m_coordinator->native_recover(ctx(m_owner), m_owner));
    EXPECT_EQ(m_chain->native_balance(m_owner), amount(5));
}

TEST_F(coordinator_test, transfer_ownership) {
    deploy_and_init(gauss::chain::polygon_mainnet_chain_id);
    ASSERT_FALSE(m_coordinator->transfer_ownership(ctx(m_owner), m_user));
    EXPECT_EQ(m_coordinator->owner(), m_user);
    expect_error(m_coordinator->pause(ctx(m_owner)),
                 gauss::error_code::not_owner);
    EXPECT_EQ(events(gauss::access::ownership_transferred_signature), 1U);
}
