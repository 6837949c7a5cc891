/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_MIGRATION_EXECUTOR_HPP
#define FT_MIGRATOR_MIGRATION_EXECUTOR_HPP

#include <fm/chain/client.hpp>
#include <fm/index/checkpoint.hpp>
#include <fm/migration/batch.hpp>

namespace ft_migrator::migration {
    struct executor_settings {
        std::string contract { "aurora" };
        size_t batch_size = 750;
        std::string migrate_method { "migrate" };
        std::string check_method { "check_migration_correctness" };
        std::string balance_method { "ft_balance_of" };
        std::string supply_on_near_method { "ft_total_eth_supply_on_near" };
        std::string supply_on_aurora_method { "ft_total_eth_supply_on_aurora" };

        static executor_settings from_config(const config &migration_cfg);
    };

    // A batch accepted by the target contract, kept to re-check it with the identical payload
    struct committed_batch {
        batch_kind kind = batch_kind::accounts;
        uint8_vector payload {};
        size_t counter = 0;
    };

    struct verification {
        batch_kind kind = batch_kind::accounts;
        size_t counter = 0;
        // empty when the check call itself failed
        std::optional<check_result> result {};
        std::string failure {};

        bool success() const
        {
            return result && std::holds_alternative<check::success>(*result);
        }
    };

    struct report {
        size_t num_committed = 0;
        std::vector<verification> items {};

        size_t num_success() const;
        size_t num_mismatches() const;
        bool ok() const
        {
            return num_success() == items.size();
        }
    };

    extern std::string describe(const report &rep);

    // Replays a migration-ready state into the target contract and re-verifies every batch
    struct executor {
        explicit executor(chain::client &client, const executor_settings &settings={});

        // Throws fatal_error when a commit exhausts its retry budget; verification mismatches are only reported
        report migrate(const near::signer &signer, const state_data &st);
        // Checks every batch of the state against an already migrated contract without committing anything
        report validate(const state_data &st);
        // Builds a migration-ready state from the accounts and proofs of an index by querying the source contract
        state_data prepare_indexed(const index::checkpoint &cp);

        const std::vector<committed_batch> &committed() const noexcept
        {
            return _committed;
        }

        const executor_settings &settings() const noexcept
        {
            return _settings;
        }
    private:
        chain::client &_client;
        const executor_settings _settings;
        std::vector<committed_batch> _committed {};

        uint8_vector _view(std::string_view method, buffer args);
        u128 _view_amount(std::string_view method, buffer args);
        verification _check(const committed_batch &b);
        report _verify(const std::vector<committed_batch> &batches, size_t num_committed);
    };
}

#endif // !FT_MIGRATOR_MIGRATION_EXECUTOR_HPP
