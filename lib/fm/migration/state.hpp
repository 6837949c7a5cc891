/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_MIGRATION_STATE_HPP
#define FT_MIGRATOR_MIGRATION_STATE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <fm/uint128.hpp>

namespace ft_migrator::migration {
    // The aggregate ledger record of the source contract
    struct contract_totals {
        u128 supply_on_near {};
        u128 supply_on_aurora {};
        // unknown when the state is derived from an index
        std::optional<uint64_t> storage_usage {};

        constexpr static auto serialize(auto &archive, auto &self)
        {
            return archive(self.supply_on_near, self.supply_on_aurora, self.storage_usage);
        }

        bool operator==(const contract_totals &o) const =default;
    };

    // A migration-ready ledger: the output of snapshot decoding and the input of a migration run
    struct state_data {
        contract_totals totals {};
        std::map<std::string, u128> accounts {};
        uint64_t accounts_counter = 0;
        std::vector<std::string> proofs {};

        constexpr static auto serialize(auto &archive, auto &self)
        {
            return archive(self.totals, self.accounts, self.accounts_counter, self.proofs);
        }

        // Throws when the file cannot be read or the loaded state is inconsistent
        static state_data load(const std::string &path);
        // The second state wins on account conflicts; the totals come from the first one
        static state_data merge(const state_data &a, const state_data &b);

        void save(const std::string &path) const;
        void validate() const;
        bool operator==(const state_data &o) const =default;
    };
}

#endif // !FT_MIGRATOR_MIGRATION_STATE_HPP
