// Copyright (c) 2023 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "role.hpp"

namespace gauss::chain {
    auto to_string(chain_role role) -> std::string {
        switch(role) {
            case chain_role::unresolved:
                return "unresolved";
            case chain_role::home:
                return "home";
            case chain_role::away:
                return "away";
        }
        return "invalid";
    }

    role_resolver::role_resolver()
        : role_resolver({gauss_mainnet_chain_id, gauss_testnet_chain_id},
                        {polygon_mainnet_chain_id, polygon_testnet_chain_id},
                        unknown_chain_policy::default_away) {}

    role_resolver::role_resolver(std::set<uint64_t> home_chain_ids,
                                 std::set<uint64_t> away_chain_ids,
                                 unknown_chain_policy policy)
        : m_home_chain_ids(std::move(home_chain_ids)),
          m_away_chain_ids(std::move(away_chain_ids)),
          m_policy(policy) {}

    auto role_resolver::resolve(uint64_t observed_chain_id) const
        -> value_result_type<chain_role> {
        if(is_home(observed_chain_id)) {
            return chain_role::home;
        }
        if(m_policy == unknown_chain_policy::reject_unknown
           && m_away_chain_ids.find(observed_chain_id)
                  == m_away_chain_ids.end()) {
            return error_code::unsupported_chain;
        }
        return chain_role::away;
    }

    auto role_resolver::is_home(uint64_t chain_id) const -> bool {
        return m_home_chain_ids.find(chain_id) != m_home_chain_ids.end();
    }

    auto role_resolver::policy() const -> unknown_chain_policy {
        return m_policy;
    }
}
