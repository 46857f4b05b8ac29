// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Tools for reading options from a configuration file and building the
 * parameter set of a bridge deployment.
 */

#ifndef GAUSS_BRIDGE_SRC_COMMON_CONFIG_H_
#define GAUSS_BRIDGE_SRC_COMMON_CONFIG_H_

#include "chain/role.hpp"
#include "logging.hpp"

#include <evmc/evmc.hpp>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>

namespace gauss::config {
    namespace defaults {
        static constexpr uint64_t home_chain_id{chain::gauss_mainnet_chain_id};
        static constexpr uint64_t away_chain_id{
            chain::polygon_mainnet_chain_id};
        static constexpr uint64_t confirmations{1};
        static constexpr size_t token_decimals{6};
        static constexpr auto token_name = "Gauss Stable";
        static constexpr auto token_symbol = "GUD";
        static constexpr auto unknown_chain_policy
            = chain::unknown_chain_policy::default_away;

        static constexpr auto log_level = logging::log_level::warn;
    }

    /// Largest decimals value whose unit, 10^decimals, fits in 256 bits.
    static constexpr size_t max_token_decimals = 77;

    static constexpr auto home_chain_count_key = "home_chain_count";
    static constexpr auto away_chain_count_key = "away_chain_count";
    static constexpr auto home_chain_prefix = "home_chain";
    static constexpr auto away_chain_prefix = "away_chain";
    static constexpr auto chain_id_postfix = "id";
    static constexpr auto unknown_chain_policy_key = "unknown_chain_policy";
    static constexpr auto home_chain_id_key = "home_chain_id";
    static constexpr auto away_chain_id_key = "away_chain_id";
    static constexpr auto fee_amount_key = "fee_amount";
    static constexpr auto confirmations_key = "confirmations";
    static constexpr auto token_name_key = "token_name";
    static constexpr auto token_symbol_key = "token_symbol";
    static constexpr auto token_decimals_key = "token_decimals";
    static constexpr auto loglevel_key = "loglevel";

    /// Returns the config key holding the chain id of the i-th home chain.
    /// \param idx index of the home chain.
    /// \return key, e.g. "home_chain0_id".
    auto get_home_chain_id_key(size_t idx) -> std::string;

    /// Returns the config key holding the chain id of the i-th known away
    /// chain.
    /// \param idx index of the away chain.
    /// \return key, e.g. "away_chain0_id".
    auto get_away_chain_id_key(size_t idx) -> std::string;

    /// Parses an unknown-chain policy name.
    /// \param name "default_away" or "reject_unknown".
    /// \return the policy, or std::nullopt for any other name.
    auto parse_unknown_chain_policy(const std::string& name)
        -> std::optional<chain::unknown_chain_policy>;

    /// Project-wide configuration options.
    struct options {
        /// Chain ids resolved as home chains.
        std::set<uint64_t> m_home_chain_ids{chain::gauss_mainnet_chain_id,
                                            chain::gauss_testnet_chain_id};
        /// Chain ids known to be away chains.
        std::set<uint64_t> m_away_chain_ids{chain::polygon_mainnet_chain_id,
                                            chain::polygon_testnet_chain_id};
        /// Treatment of chain ids in neither set.
        chain::unknown_chain_policy m_unknown_chain_policy{
            defaults::unknown_chain_policy};

        /// Home chain of the deployment.
        uint64_t m_home_chain_id{defaults::home_chain_id};
        /// Away chain of the deployment.
        uint64_t m_away_chain_id{defaults::away_chain_id};

        /// Fee kept on every outbound transfer, in fee token units.
        evmc::uint256be m_fee_amount{};
        /// Relay confirmations requested for normal transfers.
        uint64_t m_confirmations{defaults::confirmations};

        /// Wrapped token name.
        std::string m_token_name{defaults::token_name};
        /// Wrapped token symbol.
        std::string m_token_symbol{defaults::token_symbol};
        /// Wrapped token decimals.
        size_t m_token_decimals{defaults::token_decimals};

        /// Log level of the deployment.
        logging::log_level m_loglevel{defaults::log_level};
    };

    /// Reads the configuration parameters from the specified file and
    /// returns a populated options struct, or an error string on failure.
    /// \param config_file path to the config file.
    /// \return options struct or an error string.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Reads the configuration parameters from a stream.
    /// \param stream stream holding key=value lines.
    /// \return options struct or an error string.
    auto read_options(std::istream& stream)
        -> std::variant<options, std::string>;

    /// Checks a fully populated options struct for invariant errors.
    /// \param opts options struct to check.
    /// \return error string, or std::nullopt if there are no errors.
    auto check_options(const options& opts) -> std::optional<std::string>;

    /// Loads options from the given config file and checks for invariant
    /// violations.
    /// \param config_file path to the config file.
    /// \return valid options struct or an error string.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Loads options from a stream and checks for invariant violations.
    /// \param stream stream holding key=value lines.
    /// \return valid options struct or an error string.
    auto load_options(std::istream& stream)
        -> std::variant<options, std::string>;

    /// Reads configuration files line by line. Each line holds key=value.
    /// Values are integers or double-quoted strings. An
    /// environment variable named after the upper-cased key overrides the
    /// value in the file.
    class parser {
      public:
        /// Constructor.
        /// \param stream the generic stream used to add config values.
        explicit parser(std::istream& stream);

        /// Returns the given key if its value is a string.
        /// \param key key to retrieve.
        /// \return value associated with the key or std::nullopt if the value
        ///         was not a string or does not exist.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Return the value for the given key if its value is a long.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a long or doesn't exist.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<size_t>;

        /// Return the value for the given key if its value is a loglevel.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a loglevel or does not exist.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

        /// Return the value for the given key as a 256-bit amount. Accepts
        /// an integer or a quoted 0x-prefixed hex string.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was neither form or does not exist.
        [[nodiscard]] auto get_uint256(const std::string& key) const
            -> std::optional<evmc::uint256be>;

        /// Returns true if the key is set, in the file or the environment.
        [[nodiscard]] auto has(const std::string& key) const -> bool;

      private:
        using value_t = std::variant<std::string, size_t>;

        [[nodiscard]] auto find_or_env(const std::string& key) const
            -> std::optional<value_t>;

        template<typename T>
        [[nodiscard]] auto get_val(const std::string& key) const
            -> std::optional<T> {
            const auto it = find_or_env(key);
            if(it) {
                const auto* val = std::get_if<T>(&it.value());
                if(val != nullptr) {
                    return *val;
                }
            }

            return std::nullopt;
        }

        void init(std::istream& stream);

        [[nodiscard]] static auto parse_value(const std::string& val)
            -> value_t;

        std::map<std::string, value_t> m_options;
    };
}

#endif // GAUSS_BRIDGE_SRC_COMMON_CONFIG_H_
