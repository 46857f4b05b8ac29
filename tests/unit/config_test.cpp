// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/config.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

class config_validation_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_example_config = "home_chain_count=1\n"
                           "home_chain0_id=1452\n"
                           "away_chain_count=2\n"
                           "away_chain0_id=80001\n"
                           "away_chain1_id=137\n"
                           "unknown_chain_policy=reject_unknown\n"
                           "home_chain_id=1452\n"
                           "away_chain_id=80001\n"
                           "fee_amount=1000000\n"
                           "confirmations=12\n"
                           "token_name=\"Gauss Stable\"\n"
                           "token_symbol=\"GUD\"\n"
                           "token_decimals=6\n"
                           "loglevel=\"DEBUG\"\n";
    }

    gauss::config::options m_opts;
    std::string m_example_config;
};

TEST_F(config_validation_test, defaults_are_valid) {
    auto err = gauss::config::check_options(m_opts);
    ASSERT_FALSE(err.has_value()) << err.value();
    EXPECT_EQ(m_opts.m_home_chain_id, gauss::chain::gauss_mainnet_chain_id);
    EXPECT_EQ(m_opts.m_away_chain_id, gauss::chain::polygon_mainnet_chain_id);
    EXPECT_EQ(m_opts.m_token_symbol, "GUD");
    EXPECT_EQ(m_opts.m_token_decimals, 6U);
}

TEST_F(config_validation_test, home_set_invariant) {
    m_opts.m_home_chain_ids.clear();
    auto err = gauss::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, distinct_chains_invariant) {
    m_opts.m_away_chain_id = m_opts.m_home_chain_id;
    auto err = gauss::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, home_chain_must_be_home) {
    m_opts.m_home_chain_id = gauss::chain::polygon_testnet_chain_id;
    auto err = gauss::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, away_chain_must_not_be_home) {
    m_opts.m_away_chain_id = gauss::chain::gauss_testnet_chain_id;
    auto err = gauss::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, unknown_away_chain_policy) {
    m_opts.m_away_chain_id = 5;
    auto err = gauss::config::check_options(m_opts);
    ASSERT_FALSE(err.has_value());

    m_opts.m_unknown_chain_policy
        = gauss::chain::unknown_chain_policy::reject_unknown;
    err = gauss::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, decimals_invariant) {
    m_opts.m_token_decimals = gauss::config::max_token_decimals + 1;
    auto err = gauss::config::check_options(m_opts);
    ASSERT_TRUE(err.has_value());
}

TEST_F(config_validation_test, parsing_validation) {
    std::istringstream cfg(m_example_config);
    gauss::config::parser ex(cfg);

    auto confirmations = ex.get_ulong("confirmations");
    EXPECT_TRUE(confirmations.has_value());
    EXPECT_EQ(confirmations.value(), 12UL);

    auto name = ex.get_string("token_name");
    EXPECT_TRUE(name.has_value());
    EXPECT_EQ(name.value(), "Gauss Stable");

    auto policy = ex.get_string("unknown_chain_policy");
    EXPECT_TRUE(policy.has_value());
    EXPECT_EQ(policy.value(), "reject_unknown");

    auto loglevel = ex.get_loglevel("loglevel");
    EXPECT_TRUE(loglevel.has_value());
    EXPECT_EQ(loglevel.value(), gauss::logging::log_level::debug);

    auto decimals = ex.get_ulong("token_decimals");
    EXPECT_TRUE(decimals.has_value());
    EXPECT_EQ(decimals.value(), 6UL);

    EXPECT_FALSE(ex.has("missing_key"));
    EXPECT_FALSE(ex.get_ulong("token_name").has_value());
}

TEST_F(config_validation_test, read_deployment_options) {
    std::istringstream cfg(m_example_config);
    auto res = gauss::config::load_options(cfg);
    ASSERT_TRUE(std::holds_alternative<gauss::config::options>(res))
        << std::get<std::string>(res);
    const auto& opts = std::get<gauss::config::options>(res);

    EXPECT_EQ(opts.m_home_chain_ids, std::set<uint64_t>{1452});
    EXPECT_EQ(opts.m_away_chain_ids, (std::set<uint64_t>{137, 80001}));
    EXPECT_EQ(opts.m_unknown_chain_policy,
              gauss::chain::unknown_chain_policy::reject_unknown);
    EXPECT_EQ(opts.m_home_chain_id, 1452U);
    EXPECT_EQ(opts.m_away_chain_id, 80001U);
    EXPECT_EQ(opts.m_fee_amount, evmc::uint256be(1000000));
    EXPECT_EQ(opts.m_confirmations, 12U);
    EXPECT_EQ(opts.m_token_decimals, 6U);
    EXPECT_EQ(opts.m_loglevel, gauss::logging::log_level::debug);
}

TEST_F(config_validation_test, hex_fee_amount) {
    std::istringstream cfg("fee_amount=\"0x0f4240\"\n");
    auto res = gauss::config::read_options(cfg);
    ASSERT_TRUE(std::holds_alternative<gauss::config::options>(res));
    EXPECT_EQ(std::get<gauss::config::options>(res).m_fee_amount,
              evmc::uint256be(1000000));
}

TEST_F(config_validation_test, invalid_fee_amount) {
    std::istringstream cfg("fee_amount=\"lots\"\n");
    auto res = gauss::config::read_options(cfg);
    EXPECT_TRUE(std::holds_alternative<std::string>(res));
}

TEST_F(config_validation_test, invalid_chain_policy) {
    std::istringstream cfg("unknown_chain_policy=\"sometimes\"\n");
    auto res = gauss::config::read_options(cfg);
    EXPECT_TRUE(std::holds_alternative<std::string>(res));
}

TEST_F(config_validation_test, missing_chain_id) {
    std::istringstream cfg("home_chain_count=2\nhome_chain0_id=1777\n");
    auto res = gauss::config::read_options(cfg);
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
    EXPECT_NE(std::get<std::string>(res).find(
                  gauss::config::get_home_chain_id_key(1)),
              std::string::npos);
}

TEST_F(config_validation_test, load_rejects_invalid_options) {
    std::istringstream cfg("home_chain_id=137\n");
    auto res = gauss::config::load_options(cfg);
    EXPECT_TRUE(std::holds_alternative<std::string>(res));
}

TEST_F(config_validation_test, missing_file) {
    auto res = gauss::config::load_options(
        std::string("/nonexistent/gauss-bridge.cfg"));
    EXPECT_TRUE(std::holds_alternative<std::string>(res));
}

TEST_F(config_validation_test, environment_overrides_file) {
    ASSERT_EQ(setenv("CONFIRMATIONS", "40", 1), 0);
    std::istringstream cfg(m_example_config);
    gauss::config::parser ex(cfg);
    auto confirmations = ex.get_ulong("confirmations");
    unsetenv("CONFIRMATIONS");
    ASSERT_TRUE(confirmations.has_value());
    EXPECT_EQ(confirmations.value(), 40UL);
}

TEST(config_test, chain_id_keys) {
    EXPECT_EQ(gauss::config::get_home_chain_id_key(0), "home_chain0_id");
    EXPECT_EQ(gauss::config::get_away_chain_id_key(3), "away_chain3_id");
}

TEST(config_test, parse_unknown_chain_policy) {
    EXPECT_EQ(gauss::config::parse_unknown_chain_policy("default_away"),
              gauss::chain::unknown_chain_policy::default_away);
    EXPECT_EQ(gauss::config::parse_unknown_chain_policy("reject_unknown"),
              gauss::chain::unknown_chain_policy::reject_unknown);
    EXPECT_FALSE(
        gauss::config::parse_unknown_chain_policy("REJECT").has_value());
}
