// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAUSS_BRIDGE_SRC_CHAIN_ERROR_H_
#define GAUSS_BRIDGE_SRC_CHAIN_ERROR_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace gauss {
    /// Reasons a contract call is rejected. Any rejection aborts the whole
    /// top-level call; see \ref chain::chain::execute.
    enum class error_code : uint8_t {
        /// init called on an initialized contract.
        already_initialized,
        /// Role-dependent call before init.
        not_initialized,
        /// A required address was zero.
        zero_address,
        /// Chain id is neither a known home nor away chain and the resolver
        /// fails closed.
        unsupported_chain,
        /// Caller is not the owner.
        not_owner,
        /// Caller is not the configured relay.
        not_relay,
        /// Caller is not the designated bridge.
        not_authorized,
        /// Relayed message did not originate from the twin contract.
        invalid_sender,
        /// Transfer recipient is the zero address.
        invalid_recipient,
        /// Transfer amount does not exceed the fee floor.
        amount_too_low,
        /// Amount left after the fee is zero.
        invalid_net_amount,
        /// Burn larger than the account balance.
        burn_amount_exceeds_balance,
        /// Transfer larger than the sender balance.
        transfer_amount_exceeds_balance,
        /// transfer_from larger than the allowance.
        insufficient_allowance,
        /// Mint to the zero address.
        mint_to_zero_address,
        /// Transfer to the zero address.
        transfer_to_zero_address,
        /// Transfer from the zero address.
        transfer_from_zero_address,
        /// Approval involving the zero address.
        approve_zero_address,
        /// Burn from the zero address.
        burn_from_zero_address,
        /// Call gated by pause while paused.
        paused,
        /// unpause while not paused.
        not_paused,
        /// Mint or burn on a chain that is not the home chain.
        minting_home_only,
        /// Emergency recovery on the home chain.
        recovering_away_only,
        /// Relayed payload could not be decoded.
        invalid_package,
        /// Guarded entry point entered recursively.
        reentrant_call,
        /// 256-bit arithmetic overflow.
        arithmetic_overflow,
        /// Native currency transfer larger than the balance.
        insufficient_native_balance,
        /// Chain role is neither home nor away.
        invalid_configuration,
        /// No contract with the required capability at the address.
        unknown_contract,
        /// Relay has no endpoint for the destination chain.
        unknown_destination,
        /// Relay has no pending message with the given id.
        unknown_message,
        /// Relay message has not reached its confirmation count.
        message_not_confirmed,
        /// Relay message is being delivered by another caller.
        delivery_in_progress,
        /// Call context names a different chain than the contract's host.
        chain_mismatch,
    };

    /// Classification of \ref error_code values.
    enum class error_category : uint8_t {
        /// Re-initialization, missing setup, unset addresses.
        configuration,
        /// Caller identity checks.
        authorization,
        /// Argument and balance checks.
        validation,
        /// Defensive checks that indicate a deployment bug.
        invariant,
        /// Failures reported by a collaborator such as the relay.
        external
    };

    /// Returns the stable reason string for an error code. Callers may match
    /// on these strings.
    /// \param code error code.
    /// \return reason string.
    auto to_string(error_code code) -> std::string;

    /// Returns the category of an error code.
    /// \param code error code.
    /// \return error category.
    auto category(error_code code) -> error_category;

    /// Result of a call with no return value. Empty on success.
    using result_type = std::optional<error_code>;

    /// Result of a call returning a value of type T.
    template<typename T>
    using value_result_type = std::variant<T, error_code>;

    /// Returns true if the result holds an error.
    inline auto failed(const result_type& res) -> bool {
        return res.has_value();
    }

    /// Returns true if the result holds an error.
    template<typename T>
    auto failed(const value_result_type<T>& res) -> bool {
        return std::holds_alternative<error_code>(res);
    }
}

#endif // GAUSS_BRIDGE_SRC_CHAIN_ERROR_H_
