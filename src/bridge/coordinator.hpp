// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_BRIDGE_COORDINATOR_H_
#define GAUSS_BRIDGE_SRC_BRIDGE_COORDINATOR_H_

#include "access/initializable.hpp"
#include "access/ownable.hpp"
#include "access/pausable.hpp"
#include "access/reentrancy_guard.hpp"
#include "chain/chain.hpp"
#include "chain/role.hpp"
#include "relay/interface.hpp"
#include "token/interface.hpp"
#include "util/common/logging.hpp"

#include <memory>
#include <optional>

namespace gauss::bridge {
    /// Configuration supplied to \ref coordinator::init.
    struct settings {
        /// Relay gateway endpoint on this chain.
        evmc::address m_relay{};
        /// Asset taken from users on outbound transfers.
        evmc::address m_local_asset{};
        /// Asset credited to recipients on inbound transfers.
        evmc::address m_paired_asset{};
        /// Token the relay charges its fee in.
        evmc::address m_fee_token{};
        /// Fee kept on every outbound transfer.
        evmc::uint256be m_fee_amount{};
        /// Relay confirmations requested for normal transfers.
        uint64_t m_confirmations{};
        /// Chain hosting the twin coordinator.
        uint64_t m_destination_chain_id{};
    };

    /// Bridge coordinator. Twin instances are deployed at the same address
    /// on the home and the away chain and exchange transfer packages through
    /// the relay. Outbound transfers lock (away) or burn (home) the local
    /// asset and send the net amount; inbound transfers unlock (away) or
    /// mint (home) the paired asset.
    ///
    /// The sending chain keeps the fee: net = amount - fee. The receiving
    /// chain applies the net amount as is.
    class coordinator : public chain::contract, public relay::receiver {
      public:
        /// Constructor.
        /// \param addr address the coordinator is deployed at.
        /// \param c chain the coordinator is deployed on.
        /// \param owner initial owner.
        /// \param resolver resolver consulted once by \ref init.
        coordinator(const evmc::address& addr,
                    chain::chain& c,
                    const evmc::address& owner,
                    chain::role_resolver resolver);

        /// Resolves the chain role and stores the configuration. Grants the
        /// relay an unlimited allowance over this contract's fee tokens.
        /// Owner only, once.
        /// \param ctx call context.
        /// \param cfg configuration.
        /// \return error on rejection.
        auto init(const chain::call_context& ctx, const settings& cfg)
            -> result_type;

        /// Starts a transfer to the twin coordinator.
        /// \param ctx call context; the caller must have approved amount of
        ///            the local asset to this contract.
        /// \param recipient recipient on the destination chain.
        /// \param amount gross amount; must exceed the fee.
        /// \param source caller-supplied source address, forwarded as is.
        /// \param express request immediate delivery.
        /// \return the relay transaction id.
        auto initiate_transfer(const chain::call_context& ctx,
                               const evmc::address& recipient,
                               const evmc::uint256be& amount,
                               const evmc::address& source,
                               bool express)
            -> value_result_type<evmc::bytes32>;

        /// Credits a transfer sent by the twin coordinator. Relay only.
        auto message_process(const chain::call_context& ctx,
                             const evmc::bytes32& tx_id,
                             uint64_t source_chain_id,
                             const evmc::address& sender,
                             const evmc::address& recipient_placeholder,
                             const evmc::uint256be& amount_placeholder,
                             const buffer& data) -> result_type override;

        /// Replaces the relay and moves the fee token allowance to it.
        /// Owner only.
        auto update_bridge(const chain::call_context& ctx,
                           const evmc::address& relay) -> result_type;

        /// Replaces the fee token and moves the relay's allowance to it.
        /// Owner only.
        auto update_fee_token(const chain::call_context& ctx,
                              const evmc::address& fee_token)
            -> result_type;

        /// Replaces the fee amount. Owner only.
        auto update_fee_amount(const chain::call_context& ctx,
                               const evmc::uint256be& fee_amount)
            -> result_type;

        /// Replaces the confirmation count. Owner only.
        auto update_confirmations(const chain::call_context& ctx,
                                  uint64_t confirmations) -> result_type;

        /// Sets the pause flag. Owner only.
        auto pause(const chain::call_context& ctx) -> result_type;

        /// Clears the pause flag. Owner only.
        auto unpause(const chain::call_context& ctx) -> result_type;

        /// Sends tokens held by this contract to an account. Owner only.
        auto withdraw_erc20(const chain::call_context& ctx,
                            const evmc::address& token,
                            const evmc::address& to,
                            std::optional<evmc::uint256be> amount
                            = std::nullopt) -> result_type;

        /// Sends all native currency held by this contract to an account.
        /// Owner only.
        auto native_recover(const chain::call_context& ctx,
                            const evmc::address& to) -> result_type;

        /// Hands ownership to another account. Owner only.
        auto transfer_ownership(const chain::call_context& ctx,
                                const evmc::address& new_owner)
            -> result_type;

        /// Returns the configuration stored by init and the update calls.
        [[nodiscard]] auto config() const -> const settings&;

        /// Returns true if init resolved the home role.
        [[nodiscard]] auto is_home() const -> bool;

        /// Returns the resolved role.
        [[nodiscard]] auto role() const -> chain::chain_role;

        /// Returns true once init has run.
        [[nodiscard]] auto initialized() const -> bool;

        /// Returns the current owner.
        [[nodiscard]] auto owner() const -> evmc::address;

        /// Returns true while paused.
        [[nodiscard]] auto paused() const -> bool;

        void checkpoint() override;
        void revert() override;
        void commit() override;

      private:
        struct state {
            access::ownable m_owner;
            access::pausable m_pause;
            access::initializable m_init;
            chain::chain_role m_role{chain::chain_role::unresolved};
            settings m_cfg;
        };

        chain::chain& m_chain;
        std::shared_ptr<logging::log> m_log;
        chain::role_resolver m_resolver;
        access::reentrancy_guard m_guard;
        chain::journal<state> m_state;

        [[nodiscard]] auto token_at(const evmc::address& addr) const
            -> std::shared_ptr<token::interface>;
        auto take_local(const chain::call_context& ctx,
                        const evmc::uint256be& amount,
                        const evmc::uint256be& net) -> result_type;
        auto credit_paired(const chain::call_context& ctx,
                           const evmc::address& recipient,
                           const evmc::uint256be& amount) -> result_type;
        auto move_allowance(const chain::call_context& ctx,
                            const evmc::address& old_token,
                            const evmc::address& old_relay,
                            const evmc::address& new_token,
                            const evmc::address& new_relay) -> result_type;
        auto owner_config_check(const chain::call_context& ctx) const
            -> result_type;
        auto rejected(const char* op, error_code err) const -> result_type;
    };
}

#endif // GAUSS_BRIDGE_SRC_BRIDGE_COORDINATOR_H_
