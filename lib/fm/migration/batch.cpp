/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <fm/migration/batch.hpp>

namespace ft_migrator::migration {
    batch_list make_batches(const state_data &st, const size_t limit)
    {
        if (limit == 0)
            throw error("the batch size limit must be positive");
        batch_list res {};
        for (size_t i = 0; i < st.proofs.size(); i += limit) {
            auto &b = res.emplace_back(batch { batch_kind::proofs });
            const auto end = std::min(i + limit, st.proofs.size());
            b.input.used_proofs.assign(st.proofs.begin() + i, st.proofs.begin() + end);
            b.counter = end;
        }
        size_t num_accounts = 0;
        for (const auto &[id, amount]: st.accounts) {
            if (num_accounts % limit == 0)
                res.emplace_back(batch { batch_kind::accounts });
            res.back().input.accounts.emplace_back(id, amount);
            res.back().counter = ++num_accounts;
        }
        auto &totals = res.emplace_back(batch { batch_kind::totals });
        totals.input.total_supply = st.totals.supply_on_near;
        totals.input.account_storage_usage = st.totals.storage_usage;
        totals.input.statistics_aurora_accounts_counter = st.accounts_counter;
        totals.counter = 1;
        return res;
    }
}
