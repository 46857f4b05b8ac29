// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include "chain/address.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace gauss::config {
    namespace {
        auto get_chain_id_key(const char* prefix, size_t idx) -> std::string {
            std::stringstream ss;
            ss << prefix << idx << "_" << chain_id_postfix;
            return ss.str();
        }

        auto read_chain_ids(const parser& cfg,
                            const char* count_key,
                            const char* prefix,
                            std::set<uint64_t>& ids)
            -> std::optional<std::string> {
            const auto count = cfg.get_ulong(count_key);
            if(!count.has_value()) {
                return std::nullopt;
            }
            ids.clear();
            for(size_t i{0}; i < count.value(); i++) {
                const auto key = get_chain_id_key(prefix, i);
                const auto id = cfg.get_ulong(key);
                if(!id.has_value()) {
                    return "No chain id specified for " + std::string(prefix)
                         + " " + std::to_string(i) + " (" + key + ")";
                }
                ids.insert(id.value());
            }
            return std::nullopt;
        }

        auto read_deployment_options(options& opts, const parser& cfg)
            -> std::optional<std::string> {
            if(cfg.has(unknown_chain_policy_key)) {
                const auto name = cfg.get_string(unknown_chain_policy_key);
                const auto policy
                    = parse_unknown_chain_policy(name.value_or(""));
                if(!policy.has_value()) {
                    return "Invalid unknown chain policy ("
                         + std::string(unknown_chain_policy_key) + ")";
                }
                opts.m_unknown_chain_policy = policy.value();
            }

            opts.m_home_chain_id = cfg.get_ulong(home_chain_id_key)
                                       .value_or(opts.m_home_chain_id);
            opts.m_away_chain_id = cfg.get_ulong(away_chain_id_key)
                                       .value_or(opts.m_away_chain_id);

            if(cfg.has(fee_amount_key)) {
                const auto fee = cfg.get_uint256(fee_amount_key);
                if(!fee.has_value()) {
                    return "Invalid fee amount ("
                         + std::string(fee_amount_key) + ")";
                }
                opts.m_fee_amount = fee.value();
            }
            opts.m_confirmations = cfg.get_ulong(confirmations_key)
                                       .value_or(opts.m_confirmations);

            opts.m_token_name
                = cfg.get_string(token_name_key).value_or(opts.m_token_name);
            opts.m_token_symbol = cfg.get_string(token_symbol_key)
                                      .value_or(opts.m_token_symbol);
            opts.m_token_decimals = cfg.get_ulong(token_decimals_key)
                                        .value_or(opts.m_token_decimals);

            opts.m_loglevel
                = cfg.get_loglevel(loglevel_key).value_or(opts.m_loglevel);
            return std::nullopt;
        }
    }

    auto get_home_chain_id_key(size_t idx) -> std::string {
        return get_chain_id_key(home_chain_prefix, idx);
    }

    auto get_away_chain_id_key(size_t idx) -> std::string {
        return get_chain_id_key(away_chain_prefix, idx);
    }

    auto parse_unknown_chain_policy(const std::string& name)
        -> std::optional<chain::unknown_chain_policy> {
        if(name == "default_away") {
            return chain::unknown_chain_policy::default_away;
        }
        if(name == "reject_unknown") {
            return chain::unknown_chain_policy::reject_unknown;
        }
        return std::nullopt;
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        std::ifstream file(config_file);
        if(!file.good()) {
            return "Unable to open config file " + config_file;
        }
        return read_options(file);
    }

    auto read_options(std::istream& stream)
        -> std::variant<options, std::string> {
        auto opts = options{};
        auto cfg = parser(stream);

        auto err = read_chain_ids(cfg,
                                  home_chain_count_key,
                                  home_chain_prefix,
                                  opts.m_home_chain_ids);
        if(err.has_value()) {
            return err.value();
        }

        err = read_chain_ids(cfg,
                             away_chain_count_key,
                             away_chain_prefix,
                             opts.m_away_chain_ids);
        if(err.has_value()) {
            return err.value();
        }

        err = read_deployment_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        return opts;
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opt = read_options(config_file);
        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto load_options(std::istream& stream)
        -> std::variant<options, std::string> {
        auto opt = read_options(stream);
        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_home_chain_ids.empty()) {
            return "At least one home chain id is required";
        }
        if(opts.m_home_chain_id == opts.m_away_chain_id) {
            return "Home and away chain ids must differ";
        }
        if(opts.m_home_chain_ids.count(opts.m_home_chain_id) == 0) {
            return "Home chain id " + std::to_string(opts.m_home_chain_id)
                 + " is not a configured home chain";
        }
        if(opts.m_home_chain_ids.count(opts.m_away_chain_id) != 0) {
            return "Away chain id " + std::to_string(opts.m_away_chain_id)
                 + " is configured as a home chain";
        }
        if(opts.m_unknown_chain_policy
               == chain::unknown_chain_policy::reject_unknown
           && opts.m_away_chain_ids.count(opts.m_away_chain_id) == 0) {
            return "Away chain id " + std::to_string(opts.m_away_chain_id)
                 + " is unknown and unknown chains are rejected";
        }
        if(opts.m_token_decimals > max_token_decimals) {
            return "Token decimals must be at most "
                 + std::to_string(max_token_decimals);
        }
        return std::nullopt;
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    void parser::init(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            std::istringstream line_stream(line);
            std::string key;
            if(std::getline(line_stream, key, '=')) {
                std::string value;
                if(std::getline(line_stream, value) && !value.empty()) {
                    m_options.emplace(key, parse_value(value));
                }
            }
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return get_val<size_t>(key);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val_str.value());
    }

    auto parser::get_uint256(const std::string& key) const
        -> std::optional<evmc::uint256be> {
        if(const auto as_int = get_ulong(key)) {
            return evmc::uint256be(as_int.value());
        }
        const auto as_str = get_string(key);
        if(!as_str.has_value() || as_str->rfind("0x", 0) != 0) {
            return std::nullopt;
        }
        auto padded = as_str->substr(2);
        constexpr auto hex_len = sizeof(evmc::uint256be::bytes) * 2;
        if(padded.size() > hex_len) {
            return std::nullopt;
        }
        padded.insert(0, hex_len - padded.size(), '0');
        return chain::from_hex<evmc::uint256be>(padded);
    }

    auto parser::has(const std::string& key) const -> bool {
        return find_or_env(key).has_value();
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            auto value = std::string(env_v);
            if(!value.empty()) {
                return parse_value(value);
            }
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value) -> value_t {
        if(value.size() >= 2 && value.front() == '\"'
           && value.back() == '\"') {
            return value.substr(1, value.size() - 2);
        }
        const auto is_digit = [](unsigned char c) {
            return std::isdigit(c) != 0;
        };
        const auto digits
            = std::count_if(value.begin(), value.end(), is_digit);
        const auto len = static_cast<std::ptrdiff_t>(value.size());
        constexpr auto max_digits = std::numeric_limits<size_t>::digits10;
        if(digits == len && len > 0 && len <= max_digits) {
            return static_cast<size_t>(std::stoull(value));
        }
        // Bare words such as log levels are kept as strings.
        return value;
    }
}
