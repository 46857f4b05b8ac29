// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_CHAIN_CHAIN_H_
#define GAUSS_BRIDGE_SRC_CHAIN_CHAIN_H_

#include "address.hpp"
#include "context.hpp"
#include "contract.hpp"
#include "error.hpp"
#include "event_log.hpp"
#include "util/common/logging.hpp"

#include <evmc/evmc.hpp>
#include <map>
#include <memory>
#include <mutex>

namespace gauss::chain {
    /// In-process model of one chain: a registry of contracts addressed by
    /// the CREATE rule, native currency balances and the event log. All
    /// contract calls that should be atomic run through \ref execute.
    class chain {
      public:
        /// Constructor.
        /// \param chain_id identifier observed by contracts on this chain.
        /// \param logger log instance.
        chain(uint64_t chain_id, std::shared_ptr<logging::log> logger);

        ~chain() = default;
        chain(const chain&) = delete;
        auto operator=(const chain&) -> chain& = delete;
        chain(chain&&) = delete;
        auto operator=(chain&&) -> chain& = delete;

        /// Returns the chain id.
        [[nodiscard]] auto id() const -> uint64_t;

        /// Returns a call context for a call made by the given account.
        /// \param sender calling account.
        /// \return context for this chain.
        [[nodiscard]] auto context(const evmc::address& sender) const
            -> call_context;

        /// Returns the logger of this chain.
        [[nodiscard]] auto logger() const -> const std::shared_ptr<logging::log>&;

        /// Deploys a contract. The address is derived from the deployer and
        /// its deployment count on this chain, so replaying the same sequence
        /// of deployments on another chain yields the same addresses.
        /// \tparam T contract type, constructible from
        ///           (address, chain&, args...).
        /// \param deployer account deploying the contract.
        /// \param args remaining constructor arguments.
        /// \return the deployed contract.
        template<typename T, typename... Args>
        auto deploy(const evmc::address& deployer, Args&&... args)
            -> std::shared_ptr<T> {
            const std::lock_guard<std::recursive_mutex> l(m_exec_mut);
            auto& nonce = m_nonces[deployer];
            const auto addr = contract_address(deployer, nonce);
            nonce++;
            auto c = std::make_shared<T>(addr,
                                         *this,
                                         std::forward<Args>(args)...);
            m_contracts[addr] = c;
            m_log->debug("Deployed contract at", to_hex(addr));
            return c;
        }

        /// Returns the address the next contract deployed by the given
        /// account will have.
        [[nodiscard]] auto next_address(const evmc::address& deployer) const
            -> evmc::address;

        /// Looks up a contract by address and capability.
        /// \tparam T required interface.
        /// \param addr contract address.
        /// \return the contract, or nullptr if there is no contract at the
        ///         address or it does not implement T.
        template<typename T>
        [[nodiscard]] auto get(const evmc::address& addr) const
            -> std::shared_ptr<T> {
            const std::lock_guard<std::recursive_mutex> l(m_exec_mut);
            auto it = m_contracts.find(addr);
            if(it == m_contracts.end()) {
                return nullptr;
            }
            return std::dynamic_pointer_cast<T>(it->second);
        }

        /// Returns the native currency balance of an account.
        [[nodiscard]] auto native_balance(const evmc::address& addr) const
            -> evmc::uint256be;

        /// Credits native currency to an account out of thin air. Used to
        /// fund accounts when setting up a chain.
        /// \param addr account to credit.
        /// \param value amount to credit.
        /// \return arithmetic_overflow if the balance would overflow.
        auto credit_native(const evmc::address& addr,
                           const evmc::uint256be& value) -> result_type;

        /// Moves native currency from the caller to another account.
        /// \param ctx call context; the sender pays.
        /// \param to receiving account.
        /// \param value amount to move.
        /// \return insufficient_native_balance if the sender cannot pay.
        auto send_native(const call_context& ctx,
                         const evmc::address& to,
                         const evmc::uint256be& value) -> result_type;

        /// Returns the event log of this chain.
        auto events() -> event_log&;

        /// Returns the event log of this chain.
        [[nodiscard]] auto events() const -> const event_log&;

        /// Runs a top-level call atomically. Every contract, the native
        /// balances and the event log are checkpointed first; if the call
        /// returns an error all of them are restored, otherwise the changes
        /// are kept. Calls from different threads are serialized. A call made
        /// from inside a running call joins the outer call. If fn throws,
        /// the changes are restored and the exception propagates.
        /// \param fn call to run, returning \ref result_type or
        ///           \ref value_result_type.
        /// \return the result of fn.
        template<typename F>
        auto execute(F&& fn) -> decltype(fn()) {
            const std::lock_guard<std::recursive_mutex> l(m_exec_mut);
            if(m_depth > 0) {
                return fn();
            }
            auto call = top_level_call(*this);
            auto res = fn();
            call.finish(!failed(res));
            return res;
        }

        /// Runs a read-only function under the execution lock, so it
        /// observes no call in progress.
        /// \param fn function to run.
        /// \return the result of fn.
        template<typename F>
        auto view(F&& fn) const -> decltype(fn()) {
            const std::lock_guard<std::recursive_mutex> l(m_exec_mut);
            return fn();
        }

      private:
        /// Checkpoints on construction. Reverts on destruction unless
        /// finished.
        class top_level_call {
          public:
            explicit top_level_call(chain& c);
            ~top_level_call();
            top_level_call(const top_level_call&) = delete;
            auto operator=(const top_level_call&) = delete;
            top_level_call(top_level_call&&) = delete;
            auto operator=(top_level_call&&) = delete;

            void finish(bool commit);

          private:
            chain& m_chain;
            bool m_finished{false};
        };

        uint64_t m_id;
        std::shared_ptr<logging::log> m_log;

        mutable std::recursive_mutex m_exec_mut;
        size_t m_depth{};

        std::map<evmc::address, std::shared_ptr<contract>> m_contracts;
        std::map<evmc::address, uint64_t> m_nonces;
        journal<std::map<evmc::address, evmc::uint256be>> m_native;
        event_log m_events;

        void checkpoint_all();
        void revert_all();
        void commit_all();
    };
}

#endif // GAUSS_BRIDGE_SRC_CHAIN_CHAIN_H_
