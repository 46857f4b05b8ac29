// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../../util.hpp"
#include "chain/math.hpp"
#include "token/erc20.hpp"
#include "token/events.hpp"

#include <gtest/gtest.h>

using gauss::test::amount;
using gauss::test::expect_error;
using gauss::test::make_address;

class erc20_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_token = m_chain.deploy<gauss::token::erc20>(m_minter,
                                                      "Mock Stable Coin",
                                                      "MSC",
                                                      6,
                                                      m_minter);
        ASSERT_FALSE(
            m_token->mint(m_chain.context(m_minter), m_alice, amount(1000)));
    }

    gauss::chain::chain m_chain{137, gauss::test::quiet_logger()};
    evmc::address m_minter{make_address(0xee)};
    evmc::address m_alice{make_address(1)};
    evmc::address m_bob{make_address(2)};
    std::shared_ptr<gauss::token::erc20> m_token;
};

TEST_F(erc20_test, metadata) {
    EXPECT_EQ(m_token->name(), "Mock Stable Coin");
    EXPECT_EQ(m_token->symbol(), "MSC");
    EXPECT_EQ(m_token->decimals(), 6);
    EXPECT_EQ(m_token->total_supply(), amount(1000));
}

TEST_F(erc20_test, only_minter_mints) {
    expect_error(m_token->mint(m_chain.context(m_alice), m_alice, amount(1)),
                 gauss::error_code::not_authorized);
    EXPECT_EQ(m_token->total_supply(), amount(1000));
}

TEST_F(erc20_test, mint_to_zero_rejected) {
    expect_error(
        m_token->mint(m_chain.context(m_minter), evmc::address(), amount(1)),
        gauss::error_code::mint_to_zero_address);
}

TEST_F(erc20_test, mint_overflow_rejected) {
    expect_error(m_token->mint(m_chain.context(m_minter),
                               m_bob,
                               gauss::max_uint256()),
                 gauss::error_code::arithmetic_overflow);
    EXPECT_EQ(m_token->balance_of(m_bob), evmc::uint256be());
}

TEST_F(erc20_test, transfer) {
    ASSERT_FALSE(m_token->transfer(m_chain.context(m_alice), m_bob, amount(400)));
    EXPECT_EQ(m_token->balance_of(m_alice), amount(600));
    EXPECT_EQ(m_token->balance_of(m_bob), amount(400));
    // Mint plus transfer.
    EXPECT_EQ(gauss::test::count_events(m_chain,
                                        m_token->address(),
                                        gauss::token::transfer_signature),
              2U);
}

TEST_F(erc20_test, transfer_errors) {
    expect_error(
        m_token->transfer(m_chain.context(m_alice), m_bob, amount(1001)),
        gauss::error_code::transfer_amount_exceeds_balance);
    expect_error(m_token->transfer(m_chain.context(m_alice),
                                   evmc::address(),
                                   amount(1)),
                 gauss::error_code::transfer_to_zero_address);
    expect_error(m_token->transfer(m_chain.context(evmc::address()),
                                   m_bob,
                                   amount(0)),
                 gauss::error_code::transfer_from_zero_address);
}

TEST_F(erc20_test, self_transfer_keeps_balance) {
    ASSERT_FALSE(
        m_token->transfer(m_chain.context(m_alice), m_alice, amount(1000)));
    EXPECT_EQ(m_token->balance_of(m_alice), amount(1000));
}

TEST_F(erc20_test, transfer_from_spends_allowance) {
    ASSERT_FALSE(m_token->approve(m_chain.context(m_alice), m_bob, amount(300)));
    EXPECT_EQ(gauss::test::count_events(m_chain,
                                        m_token->address(),
                                        gauss::token::approval_signature),
              1U);
    ASSERT_FALSE(m_token->transfer_from(m_chain.context(m_bob),
                                        m_alice,
                                        m_bob,
                                        amount(100)));
    EXPECT_EQ(m_token->allowance(m_alice, m_bob), amount(200));
    EXPECT_EQ(m_token->balance_of(m_bob), amount(100));

    expect_error(m_token->transfer_from(m_chain.context(m_bob),
                                        m_alice,
                                        m_bob,
                                        amount(201)),
                 gauss::error_code::insufficient_allowance);
    EXPECT_EQ(m_token->allowance(m_alice, m_bob), amount(200));
}

TEST_F(erc20_test, unlimited_allowance_not_spent) {
    ASSERT_FALSE(m_token->approve(m_chain.context(m_alice),
                                  m_bob,
                                  gauss::max_uint256()));
    ASSERT_FALSE(m_token->transfer_from(m_chain.context(m_bob),
                                        m_alice,
                                        m_bob,
                                        amount(500)));
    EXPECT_EQ(m_token->allowance(m_alice, m_bob), gauss::max_uint256());
}

TEST_F(erc20_test, failed_transfer_from_keeps_allowance) {
    ASSERT_FALSE(m_token->approve(m_chain.context(m_alice), m_bob, amount(5000)));
    expect_error(m_token->transfer_from(m_chain.context(m_bob),
                                        m_alice,
                                        m_bob,
                                        amount(2000)),
                 gauss::error_code::transfer_amount_exceeds_balance);
    EXPECT_EQ(m_token->allowance(m_alice, m_bob), amount(5000));
}

TEST_F(erc20_test, allowance_checked_before_balance) {
    ASSERT_FALSE(m_token->approve(m_chain.context(m_alice), m_bob, amount(5)));
    expect_error(m_token->transfer_from(m_chain.context(m_bob),
                                        m_alice,
                                        m_bob,
                                        amount(2000)),
                 gauss::error_code::insufficient_allowance);
    expect_error(
        m_token->burn_from(m_chain.context(m_bob), m_alice, amount(2000)),
        gauss::error_code::insufficient_allowance);
    EXPECT_EQ(m_token->allowance(m_alice, m_bob), amount(5));
    EXPECT_EQ(m_token->balance_of(m_alice), amount(1000));
}

TEST_F(erc20_test, approve_zero_address_rejected) {
    expect_error(m_token->approve(m_chain.context(m_alice),
                                  evmc::address(),
                                  amount(1)),
                 gauss::error_code::approve_zero_address);
}

TEST_F(erc20_test, burn) {
    ASSERT_FALSE(m_token->burn(m_chain.context(m_alice), amount(250)));
    EXPECT_EQ(m_token->balance_of(m_alice), amount(750));
    EXPECT_EQ(m_token->total_supply(), amount(750));
    expect_error(m_token->burn(m_chain.context(m_alice), amount(751)),
                 gauss::error_code::burn_amount_exceeds_balance);
}

TEST_F(erc20_test, burn_from_requires_allowance) {
    expect_error(m_token->burn_from(m_chain.context(m_bob), m_alice, amount(1)),
                 gauss::error_code::insufficient_allowance);
    ASSERT_FALSE(m_token->approve(m_chain.context(m_alice), m_bob, amount(10)));
    ASSERT_FALSE(
        m_token->burn_from(m_chain.context(m_bob), m_alice, amount(10)));
    EXPECT_EQ(m_token->total_supply(), amount(990));
    EXPECT_EQ(m_token->allowance(m_alice, m_bob), evmc::uint256be());
}

TEST_F(erc20_test, reverted_call_discards_changes) {
    auto res = m_chain.execute([&]() -> gauss::result_type {
        if(auto err = m_token->transfer(m_chain.context(m_alice),
                                        m_bob,
                                        amount(100))) {
            return err;
        }
        return m_token->transfer(m_chain.context(m_bob), m_alice, amount(101));
    });
    expect_error(res, gauss::error_code::transfer_amount_exceeds_balance);
    EXPECT_EQ(m_token->balance_of(m_alice), amount(1000));
    EXPECT_EQ(m_token->balance_of(m_bob), evmc::uint256be());
}
