/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <set>
#include <fm/logger.hpp>
#include <fm/migration/state.hpp>
#include <fm/zpp.hpp>

namespace ft_migrator::migration {
    state_data state_data::load(const std::string &path)
    {
        state_data st {};
        try {
            st = zpp::load<state_data>(path);
        } catch (const std::exception &ex) {
            throw error("failed to load the migration state from {}: {}", path, ex.what());
        }
        st.validate();
        logger::info("loaded {}: accounts: {} proofs: {} supply on near: {}", path, st.accounts.size(), st.proofs.size(), st.totals.supply_on_near);
        return st;
    }

    void state_data::save(const std::string &path) const
    {
        validate();
        zpp::save(path, *this);
    }

    void state_data::validate() const
    {
        if (accounts.size() != accounts_counter)
            throw error("wrong accounts count: the state lists {} accounts but its counter is {}", accounts.size(), accounts_counter);
    }

    state_data state_data::merge(const state_data &a, const state_data &b)
    {
        state_data res { a };
        for (const auto &[id, amount]: b.accounts) {
            const auto [it, created] = res.accounts.try_emplace(id, amount);
            if (!created && it->second != amount) {
                logger::warn("account {} has balance {} in the first state and {} in the second; using the second", id, it->second, amount);
                it->second = amount;
            }
        }
        std::set<std::string> known { res.proofs.begin(), res.proofs.end() };
        for (const auto &p: b.proofs) {
            if (known.emplace(p).second)
                res.proofs.emplace_back(p);
        }
        res.accounts_counter = res.accounts.size();
        res.validate();
        return res;
    }
}
