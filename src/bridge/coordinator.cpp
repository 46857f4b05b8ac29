// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "coordinator.hpp"

#include "access/events.hpp"
#include "chain/math.hpp"
#include "events.hpp"
#include "package.hpp"
#include "token/recovery.hpp"

namespace gauss::bridge {
    coordinator::coordinator(const evmc::address& addr,
                             chain::chain& c,
                             const evmc::address& owner,
                             chain::role_resolver resolver)
        : chain::contract(addr),
          m_chain(c),
          m_log(c.logger()->tagged("coordinator")),
          m_resolver(std::move(resolver)) {
        m_state.get().m_owner = access::ownable(owner);
    }

    auto coordinator::init(const chain::call_context& ctx,
                           const settings& cfg) -> result_type {
        auto& s = m_state.get();
        if(auto err = s.m_owner.only_owner(ctx)) {
            return rejected("init", *err);
        }
        if(auto err = s.m_init.require_uninitialized()) {
            return rejected("init", *err);
        }
        if(evmc::is_zero(cfg.m_relay) || evmc::is_zero(cfg.m_local_asset)
           || evmc::is_zero(cfg.m_paired_asset)
           || evmc::is_zero(cfg.m_fee_token)) {
            return rejected("init", error_code::zero_address);
        }
        if(ctx.m_chain_id != m_chain.id()) {
            return rejected("init", error_code::chain_mismatch);
        }
        const auto role = m_resolver.resolve(m_chain.id());
        if(failed(role)) {
            return rejected("init", std::get<error_code>(role));
        }
        auto fee_token = token_at(cfg.m_fee_token);
        if(!fee_token) {
            return rejected("init", error_code::unknown_contract);
        }
        if(auto err = fee_token->approve(ctx.from(address()),
                                         cfg.m_relay,
                                         max_uint256())) {
            return rejected("init", *err);
        }
        s.m_role = std::get<chain::chain_role>(role);
        s.m_cfg = cfg;
        if(auto err = s.m_init.initialize()) {
            return rejected("init", *err);
        }
        m_log->info("Initialized as",
                    chain::to_string(s.m_role),
                    "relay",
                    chain::to_hex(cfg.m_relay),
                    "destination chain",
                    cfg.m_destination_chain_id);
        return std::nullopt;
    }

    auto coordinator::initiate_transfer(const chain::call_context& ctx,
                                        const evmc::address& recipient,
                                        const evmc::uint256be& amount,
                                        const evmc::address& source,
                                        bool express)
        -> value_result_type<evmc::bytes32> {
        auto guard = m_guard.enter();
        if(!guard.has_value()) {
            return *rejected("initiate_transfer", error_code::reentrant_call);
        }
        const auto& s = m_state.get();
        if(auto err = s.m_init.require_initialized()) {
            return *rejected("initiate_transfer", *err);
        }
        if(auto err = s.m_pause.when_not_paused()) {
            return *rejected("initiate_transfer", *err);
        }
        if(evmc::is_zero(recipient)) {
            return *rejected("initiate_transfer",
                             error_code::invalid_recipient);
        }
        const auto cfg = s.m_cfg;
        if(!(cfg.m_fee_amount < amount)) {
            return *rejected("initiate_transfer",
                             error_code::amount_too_low);
        }
        const auto net = amount - cfg.m_fee_amount;
        if(evmc::is_zero(net)) {
            return *rejected("initiate_transfer",
                             error_code::invalid_net_amount);
        }

        if(auto err = take_local(ctx, amount, net)) {
            return *rejected("initiate_transfer", *err);
        }

        auto gateway = m_chain.get<relay::interface>(cfg.m_relay);
        if(!gateway) {
            return *rejected("initiate_transfer",
                             error_code::unknown_contract);
        }
        const auto data = encode(transfer_package{recipient, net, source});
        const auto self = ctx.from(address());
        auto res = value_result_type<evmc::bytes32>();
        if(express) {
            res = gateway->send_request_express(self,
                                                address(),
                                                cfg.m_destination_chain_id,
                                                cfg.m_fee_amount,
                                                source,
                                                data,
                                                cfg.m_confirmations);
        } else {
            res = gateway->send_request(self,
                                        address(),
                                        cfg.m_destination_chain_id,
                                        cfg.m_fee_amount,
                                        source,
                                        data,
                                        cfg.m_confirmations);
        }
        if(failed(res)) {
            return *rejected("initiate_transfer", std::get<error_code>(res));
        }
        const auto tx_id = std::get<evmc::bytes32>(res);
        m_chain.events().emit(transfer_initiated_event(address(),
                                                       tx_id,
                                                       ctx.m_sender,
                                                       recipient,
                                                       amount,
                                                       net));
        m_log->info("Transfer initiated",
                    chain::to_hex(tx_id),
                    "to",
                    chain::to_hex(recipient),
                    express ? "(express)" : "");
        return tx_id;
    }

    auto coordinator::message_process(const chain::call_context& ctx,
                                      const evmc::bytes32& tx_id,
                                      uint64_t source_chain_id,
                                      const evmc::address& sender,
                                      const evmc::address& /* unused */,
                                      const evmc::uint256be& /* unused */,
                                      const buffer& data) -> result_type {
        auto guard = m_guard.enter();
        if(!guard.has_value()) {
            return rejected("message_process", error_code::reentrant_call);
        }
        const auto& s = m_state.get();
        if(auto err = s.m_init.require_initialized()) {
            return rejected("message_process", *err);
        }
        if(ctx.m_sender != s.m_cfg.m_relay) {
            return rejected("message_process", error_code::not_relay);
        }
        if(sender != address()) {
            return rejected("message_process", error_code::invalid_sender);
        }
        const auto pkg = decode(data);
        if(!pkg.has_value()) {
            return rejected("message_process", error_code::invalid_package);
        }
        if(auto err = credit_paired(ctx, pkg->m_recipient, pkg->m_amount)) {
            return rejected("message_process", *err);
        }
        m_chain.events().emit(transfer_completed_event(address(),
                                                       tx_id,
                                                       source_chain_id,
                                                       pkg->m_recipient,
                                                       pkg->m_amount));
        m_log->info("Transfer completed",
                    chain::to_hex(tx_id),
                    "from chain",
                    source_chain_id,
                    "to",
                    chain::to_hex(pkg->m_recipient));
        return std::nullopt;
    }

    auto coordinator::update_bridge(const chain::call_context& ctx,
                                    const evmc::address& relay)
        -> result_type {
        if(auto err = owner_config_check(ctx)) {
            return rejected("update_bridge", *err);
        }
        if(evmc::is_zero(relay)) {
            return rejected("update_bridge", error_code::zero_address);
        }
        auto& cfg = m_state.get().m_cfg;
        if(auto err = move_allowance(ctx.from(address()),
                                     cfg.m_fee_token,
                                     cfg.m_relay,
                                     cfg.m_fee_token,
                                     relay)) {
            return rejected("update_bridge", *err);
        }
        cfg.m_relay = relay;
        m_log->info("Relay updated to", chain::to_hex(relay));
        return std::nullopt;
    }

    auto coordinator::update_fee_token(const chain::call_context& ctx,
                                       const evmc::address& fee_token)
        -> result_type {
        if(auto err = owner_config_check(ctx)) {
            return rejected("update_fee_token", *err);
        }
        if(evmc::is_zero(fee_token)) {
            return rejected("update_fee_token", error_code::zero_address);
        }
        auto& cfg = m_state.get().m_cfg;
        if(auto err = move_allowance(ctx.from(address()),
                                     cfg.m_fee_token,
                                     cfg.m_relay,
                                     fee_token,
                                     cfg.m_relay)) {
            return rejected("update_fee_token", *err);
        }
        cfg.m_fee_token = fee_token;
        m_log->info("Fee token updated to", chain::to_hex(fee_token));
        return std::nullopt;
    }

    auto coordinator::update_fee_amount(const chain::call_context& ctx,
                                        const evmc::uint256be& fee_amount)
        -> result_type {
        if(auto err = owner_config_check(ctx)) {
            return rejected("update_fee_amount", *err);
        }
        m_state.get().m_cfg.m_fee_amount = fee_amount;
        m_log->info("Fee amount updated to", chain::to_hex(fee_amount));
        return std::nullopt;
    }

    auto coordinator::update_confirmations(const chain::call_context& ctx,
                                           uint64_t confirmations)
        -> result_type {
        if(auto err = owner_config_check(ctx)) {
            return rejected("update_confirmations", *err);
        }
        m_state.get().m_cfg.m_confirmations = confirmations;
        m_log->info("Confirmations updated to", confirmations);
        return std::nullopt;
    }

    auto coordinator::pause(const chain::call_context& ctx) -> result_type {
        auto& s = m_state.get();
        if(auto err = s.m_owner.only_owner(ctx)) {
            return rejected("pause", *err);
        }
        if(auto err = s.m_pause.pause()) {
            return rejected("pause", *err);
        }
        m_chain.events().emit(access::paused_event(address(), ctx.m_sender));
        m_log->info("Paused");
        return std::nullopt;
    }

    auto coordinator::unpause(const chain::call_context& ctx)
        -> result_type {
        auto& s = m_state.get();
        if(auto err = s.m_owner.only_owner(ctx)) {
            return rejected("unpause", *err);
        }
        if(auto err = s.m_pause.unpause()) {
            return rejected("unpause", *err);
        }
        m_chain.events().emit(
            access::unpaused_event(address(), ctx.m_sender));
        m_log->info("Unpaused");
        return std::nullopt;
    }

    auto coordinator::withdraw_erc20(const chain::call_context& ctx,
                                     const evmc::address& token,
                                     const evmc::address& to,
                                     std::optional<evmc::uint256be> amount)
        -> result_type {
        if(auto err = m_state.get().m_owner.only_owner(ctx)) {
            return rejected("withdraw_erc20", *err);
        }
        if(auto err = token::withdraw_erc20(m_chain,
                                            ctx.from(address()),
                                            token,
                                            to,
                                            amount)) {
            return rejected("withdraw_erc20", *err);
        }
        return std::nullopt;
    }

    auto coordinator::native_recover(const chain::call_context& ctx,
                                     const evmc::address& to)
        -> result_type {
        if(auto err = m_state.get().m_owner.only_owner(ctx)) {
            return rejected("native_recover", *err);
        }
        if(auto err
           = token::native_recover(m_chain, ctx.from(address()), to)) {
            return rejected("native_recover", *err);
        }
        return std::nullopt;
    }

    auto coordinator::transfer_ownership(const chain::call_context& ctx,
                                         const evmc::address& new_owner)
        -> result_type {
        auto& s = m_state.get();
        const auto previous = s.m_owner.owner();
        if(auto err = s.m_owner.transfer_ownership(ctx, new_owner)) {
            return rejected("transfer_ownership", *err);
        }
        m_chain.events().emit(
            access::ownership_transferred_event(address(),
                                                previous,
                                                new_owner));
        return std::nullopt;
    }

    auto coordinator::config() const -> const settings& {
        return m_state.get().m_cfg;
    }

    auto coordinator::is_home() const -> bool {
        return m_state.get().m_role == chain::chain_role::home;
    }

    auto coordinator::role() const -> chain::chain_role {
        return m_state.get().m_role;
    }

    auto coordinator::initialized() const -> bool {
        return m_state.get().m_init.initialized();
    }

    auto coordinator::owner() const -> evmc::address {
        return m_state.get().m_owner.owner();
    }

    auto coordinator::paused() const -> bool {
        return m_state.get().m_pause.paused();
    }

    void coordinator::checkpoint() {
        m_state.checkpoint();
    }

    void coordinator::revert() {
        m_state.revert();
    }

    void coordinator::commit() {
        m_state.commit();
    }

    auto coordinator::token_at(const evmc::address& addr) const
        -> std::shared_ptr<token::interface> {
        return m_chain.get<token::interface>(addr);
    }

    auto coordinator::take_local(const chain::call_context& ctx,
                                 const evmc::uint256be& amount,
                                 const evmc::uint256be& net) -> result_type {
        auto local = token_at(m_state.get().m_cfg.m_local_asset);
        if(!local) {
            return error_code::unknown_contract;
        }
        const auto self = ctx.from(address());
        switch(m_state.get().m_role) {
            case chain::chain_role::away:
                return local->transfer_from(self,
                                            ctx.m_sender,
                                            address(),
                                            amount);
            case chain::chain_role::home:
                if(auto err = local->transfer_from(self,
                                                   ctx.m_sender,
                                                   address(),
                                                   amount)) {
                    return err;
                }
                // The fee stays in custody as the relay fee float.
                return local->burn(self, net);
            case chain::chain_role::unresolved:
                break;
        }
        return error_code::invalid_configuration;
    }

    auto coordinator::credit_paired(const chain::call_context& ctx,
                                    const evmc::address& recipient,
                                    const evmc::uint256be& amount)
        -> result_type {
        auto paired = token_at(m_state.get().m_cfg.m_paired_asset);
        if(!paired) {
            return error_code::unknown_contract;
        }
        const auto self = ctx.from(address());
        switch(m_state.get().m_role) {
            case chain::chain_role::home:
                return paired->mint(self, recipient, amount);
            case chain::chain_role::away:
                return paired->transfer(self, recipient, amount);
            case chain::chain_role::unresolved:
                break;
        }
        return error_code::invalid_configuration;
    }

    auto coordinator::move_allowance(const chain::call_context& ctx,
                                     const evmc::address& old_token,
                                     const evmc::address& old_relay,
                                     const evmc::address& new_token,
                                     const evmc::address& new_relay)
        -> result_type {
        auto old_tok = token_at(old_token);
        auto new_tok = token_at(new_token);
        if(!old_tok || !new_tok) {
            return error_code::unknown_contract;
        }
        if(auto err = old_tok->approve(ctx, old_relay, evmc::uint256be{})) {
            return err;
        }
        return new_tok->approve(ctx, new_relay, max_uint256());
    }

    auto coordinator::owner_config_check(const chain::call_context& ctx) const
        -> result_type {
        const auto& s = m_state.get();
        if(auto err = s.m_owner.only_owner(ctx)) {
            return err;
        }
        return s.m_init.require_initialized();
    }

    auto coordinator::rejected(const char* op, error_code err) const
        -> result_type {
        m_log->warn(op, "rejected:", to_string(err));
        return err;
    }
}
