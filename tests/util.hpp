// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_TESTS_UTIL_H_
#define GAUSS_BRIDGE_TESTS_UTIL_H_

#include "chain/chain.hpp"
#include "chain/error.hpp"
#include "token/interface.hpp"
#include "util/common/logging.hpp"

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <functional>
#include <map>
#include <memory>

namespace gauss::test {
    /// Returns an account address whose last byte is the given tag.
    auto make_address(uint8_t tag) -> evmc::address;

    /// Returns a 256-bit amount.
    auto amount(uint64_t v) -> evmc::uint256be;

    /// Returns a logger that writes nothing to stdout.
    auto quiet_logger() -> std::shared_ptr<logging::log>;

    /// Counts the events with the given signature emitted by a contract.
    auto count_events(const chain::chain& c,
                      const evmc::address& emitter,
                      const std::string& signature) -> size_t;

    /// Checks that a call returning \ref result_type failed with the given
    /// error code.
    void expect_error(const result_type& res, error_code expected);

    /// Checks that a call returning \ref value_result_type failed with the
    /// given error code.
    template<typename T>
    void expect_error(const value_result_type<T>& res, error_code expected) {
        ASSERT_TRUE(failed(res));
        EXPECT_EQ(std::get<error_code>(res), expected)
            << to_string(std::get<error_code>(res));
    }

    /// Token whose transfer_from calls back into a hook before moving
    /// funds. Used to exercise reentrancy protection.
    class callback_token : public chain::contract, public token::interface {
      public:
        using hook_t = std::function<result_type(const chain::call_context&)>;

        callback_token(const evmc::address& addr, chain::chain& c);

        /// Sets the hook run by transfer_from.
        void set_hook(hook_t hook);

        /// Credits an account without any checks.
        void credit(const evmc::address& account,
                    const evmc::uint256be& amount);

        [[nodiscard]] auto name() const -> std::string override;
        [[nodiscard]] auto symbol() const -> std::string override;
        [[nodiscard]] auto decimals() const -> uint8_t override;
        [[nodiscard]] auto total_supply() const -> evmc::uint256be override;
        [[nodiscard]] auto balance_of(const evmc::address& account) const
            -> evmc::uint256be override;
        [[nodiscard]] auto allowance(const evmc::address& owner,
                                     const evmc::address& spender) const
            -> evmc::uint256be override;
        auto transfer(const chain::call_context& ctx,
                      const evmc::address& to,
                      const evmc::uint256be& amount) -> result_type override;
        auto transfer_from(const chain::call_context& ctx,
                           const evmc::address& from,
                           const evmc::address& to,
                           const evmc::uint256be& amount)
            -> result_type override;
        auto approve(const chain::call_context& ctx,
                     const evmc::address& spender,
                     const evmc::uint256be& amount) -> result_type override;
        auto mint(const chain::call_context& ctx,
                  const evmc::address& to,
                  const evmc::uint256be& amount) -> result_type override;
        auto burn(const chain::call_context& ctx,
                  const evmc::uint256be& amount) -> result_type override;
        auto burn_from(const chain::call_context& ctx,
                       const evmc::address& account,
                       const evmc::uint256be& amount)
            -> result_type override;

        void checkpoint() override;
        void revert() override;
        void commit() override;

      private:
        hook_t m_hook;
        chain::journal<std::map<evmc::address, evmc::uint256be>> m_balances;
    };
}

#endif // GAUSS_BRIDGE_TESTS_UTIL_H_
