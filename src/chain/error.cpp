// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "error.hpp"

namespace gauss {
    auto to_string(error_code code) -> std::string {
        switch(code) {
            case error_code::already_initialized:
                return "Contract already initialized";
            case error_code::not_initialized:
                return "Contract not initialized";
            case error_code::zero_address:
                return "Zero address";
            case error_code::unsupported_chain:
                return "Unsupported chain";
            case error_code::not_owner:
                return "Ownable: caller is not the owner";
            case error_code::not_relay:
                return "Caller is not the bridge";
            case error_code::not_authorized:
                return "Address not authorized";
            case error_code::invalid_sender:
                return "Invalid sender";
            case error_code::invalid_recipient:
                return "Invalid recipient";
            case error_code::amount_too_low:
                return "amount too low";
            case error_code::invalid_net_amount:
                return "Invalid net amount";
            case error_code::burn_amount_exceeds_balance:
                return "ERC20: burn amount exceeds balance";
            case error_code::transfer_amount_exceeds_balance:
                return "ERC20: transfer amount exceeds balance";
            case error_code::insufficient_allowance:
                return "ERC20: insufficient allowance";
            case error_code::mint_to_zero_address:
                return "ERC20: mint to the zero address";
            case error_code::transfer_to_zero_address:
                return "ERC20: transfer to the zero address";
            case error_code::transfer_from_zero_address:
                return "ERC20: transfer from the zero address";
            case error_code::approve_zero_address:
                return "ERC20: approve to the zero address";
            case error_code::burn_from_zero_address:
                return "ERC20: burn from the zero address";
            case error_code::paused:
                return "Pausable: paused";
            case error_code::not_paused:
                return "Pausable: not paused";
            case error_code::minting_home_only:
                return "Minting only supported on the Gauss Chain";
            case error_code::recovering_away_only:
                return "Recovering only supported on the 'Away' Chain";
            case error_code::invalid_package:
                return "Invalid package";
            case error_code::reentrant_call:
                return "ReentrancyGuard: reentrant call";
            case error_code::arithmetic_overflow:
                return "Arithmetic overflow";
            case error_code::insufficient_native_balance:
                return "Address: insufficient balance";
            case error_code::invalid_configuration:
                return "invalid configuration";
            case error_code::unknown_contract:
                return "Address: call to non-contract";
            case error_code::unknown_destination:
                return "Relay: unknown destination chain";
            case error_code::unknown_message:
                return "Relay: unknown message";
            case error_code::message_not_confirmed:
                return "Relay: message not confirmed";
            case error_code::delivery_in_progress:
                return "Relay: delivery in progress";
            case error_code::chain_mismatch:
                return "Chain id mismatch";
        }
        return "Unknown error";
    }

    auto category(error_code code) -> error_category {
        switch(code) {
            case error_code::already_initialized:
            case error_code::not_initialized:
            case error_code::zero_address:
            case error_code::unsupported_chain:
            case error_code::chain_mismatch:
                return error_category::configuration;
            case error_code::not_owner:
            case error_code::not_relay:
            case error_code::not_authorized:
            case error_code::invalid_sender:
                return error_category::authorization;
            case error_code::invalid_configuration:
                return error_category::invariant;
            case error_code::unknown_contract:
            case error_code::unknown_destination:
            case error_code::unknown_message:
            case error_code::message_not_confirmed:
            case error_code::delivery_in_progress:
                return error_category::external;
            default:
                return error_category::validation;
        }
    }
}
