// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_CHAIN_CONTRACT_H_
#define GAUSS_BRIDGE_SRC_CHAIN_CONTRACT_H_

#include <evmc/evmc.hpp>
#include <optional>

namespace gauss::chain {
    /// Holds a value together with a copy taken at the start of the current
    /// top-level call, so the value can be restored if the call reverts.
    template<typename T>
    class journal {
      public:
        journal() = default;

        /// Constructor.
        /// \param initial initial value.
        explicit journal(T initial) : m_state(std::move(initial)) {}

        /// Returns the current value.
        auto get() -> T& {
            return m_state;
        }

        /// Returns the current value.
        auto get() const -> const T& {
            return m_state;
        }

        /// Saves a copy of the current value.
        void checkpoint() {
            m_saved = m_state;
        }

        /// Restores the saved copy, if any.
        void revert() {
            if(m_saved.has_value()) {
                m_state = std::move(m_saved.value());
                m_saved.reset();
            }
        }

        /// Drops the saved copy.
        void commit() {
            m_saved.reset();
        }

      private:
        T m_state{};
        std::optional<T> m_saved;
    };

    /// Base class for state-holding objects deployed at an address on a
    /// \ref chain. The chain checkpoints every contract before a top-level
    /// call and reverts or commits all of them afterwards.
    class contract {
      public:
        /// Constructor.
        /// \param addr address the contract is deployed at.
        explicit contract(const evmc::address& addr) : m_address(addr) {}

        virtual ~contract() = default;

        contract(const contract&) = delete;
        auto operator=(const contract&) -> contract& = delete;
        contract(contract&&) = delete;
        auto operator=(contract&&) -> contract& = delete;

        /// Returns the address of the contract.
        [[nodiscard]] auto address() const -> const evmc::address& {
            return m_address;
        }

        /// Saves the contract state at the start of a top-level call.
        virtual void checkpoint() = 0;

        /// Restores the state saved by \ref checkpoint.
        virtual void revert() = 0;

        /// Keeps the state changes made since \ref checkpoint.
        virtual void commit() = 0;

      private:
        evmc::address m_address;
    };
}

#endif // GAUSS_BRIDGE_SRC_CHAIN_CONTRACT_H_
