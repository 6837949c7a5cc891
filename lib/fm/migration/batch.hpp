/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_MIGRATION_BATCH_HPP
#define FT_MIGRATOR_MIGRATION_BATCH_HPP

#include <fm/migration/abi.hpp>
#include <fm/migration/state.hpp>

namespace ft_migrator::migration {
    enum class batch_kind {
        proofs, accounts, totals
    };

    struct batch {
        batch_kind kind = batch_kind::accounts;
        input_data input {};
        // the number of records of this kind committed once this batch lands
        size_t counter = 0;

        size_t size() const
        {
            switch (kind) {
                case batch_kind::proofs: return input.used_proofs.size();
                case batch_kind::accounts: return input.accounts.size();
                default: return 1;
            }
        }
    };

    using batch_list = std::vector<batch>;

    // Proof batches come first, then account batches in account order, then one totals batch
    extern batch_list make_batches(const state_data &st, size_t limit);
}

namespace fmt {
    template<>
    struct formatter<ft_migrator::migration::batch_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ft_migrator::migration::batch_kind;
            switch (v) {
                case batch_kind::proofs: return fmt::format_to(ctx.out(), "proofs");
                case batch_kind::accounts: return fmt::format_to(ctx.out(), "accounts");
                case batch_kind::totals: return fmt::format_to(ctx.out(), "totals");
                default: throw ft_migrator::error("unsupported batch_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !FT_MIGRATOR_MIGRATION_BATCH_HPP
