// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_TOKEN_ERC20_H_
#define GAUSS_BRIDGE_SRC_TOKEN_ERC20_H_

#include "balance_store.hpp"
#include "chain/chain.hpp"
#include "chain/contract.hpp"
#include "interface.hpp"
#include "util/common/logging.hpp"

#include <memory>
#include <string>

namespace gauss::token {
    /// Plain fungible token. Used as the underlying asset of the wrapped
    /// token and as a fee token. A single minter account may create
    /// supply; anyone may burn their own balance.
    class erc20 : public chain::contract, public interface {
      public:
        /// Constructor.
        /// \param addr address the token is deployed at.
        /// \param c chain the token is deployed on.
        /// \param name token name.
        /// \param symbol token symbol.
        /// \param decimals number of decimals.
        /// \param minter account allowed to mint.
        erc20(const evmc::address& addr,
              chain::chain& c,
              std::string name,
              std::string symbol,
              uint8_t decimals,
              const evmc::address& minter);

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

        /// Creates tokens.
        /// \return not_authorized unless the caller is the minter.
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
        chain::chain& m_chain;
        std::shared_ptr<logging::log> m_log;
        std::string m_name;
        std::string m_symbol;
        uint8_t m_decimals;
        evmc::address m_minter;
        chain::journal<balance_store> m_store;

        auto rejected(const char* op, error_code err) const -> result_type;
    };
}

#endif // GAUSS_BRIDGE_SRC_TOKEN_ERC20_H_
