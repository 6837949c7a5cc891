/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_INDEX_CHECKPOINT_HPP
#define FT_MIGRATOR_INDEX_CHECKPOINT_HPP

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <fm/chain/node.hpp>

namespace ft_migrator::index {
    using chain::height_t;
    using chain::hash_t;

    // One recognized contract call seen in a transaction or a receipt
    struct action_record {
        std::string method {};
        std::vector<std::string> accounts {};
        std::optional<std::string> proof {};
        // the transaction hash or the receipt id
        hash_t source {};
        // set when outcome lookups are enabled
        std::optional<bool> success {};

        constexpr static auto serialize(auto &archive, auto &self)
        {
            return archive(self.method, self.accounts, self.proof, self.source, self.success);
        }

        bool operator==(const action_record &o) const =default;
    };

    struct block_log {
        height_t height = 0;
        std::vector<action_record> actions {};

        constexpr static auto serialize(auto &archive, auto &self)
        {
            return archive(self.height, self.actions);
        }

        bool operator==(const block_log &o) const =default;
    };

    struct dataset {
        std::set<std::string> accounts {};
        std::set<std::string> proofs {};
        // ordered by height, at most one group per height
        std::vector<block_log> logs {};

        constexpr static auto serialize(auto &archive, auto &self)
        {
            return archive(self.accounts, self.proofs, self.logs);
        }

        // Set union for accounts and proofs; a log group replaces an existing one of the same height
        void merge(const std::set<std::string> &new_accounts, const std::set<std::string> &new_proofs, block_log &&log);
        bool operator==(const dataset &o) const =default;
    };

    struct checkpoint {
        std::optional<height_t> first_block {};
        // the next height to attempt
        height_t last_block = 0;
        height_t last_handled_block = 0;
        // the last observed chain tip
        height_t current_block = 0;
        // the hash of the block at last_handled_block while continuity is known
        std::optional<hash_t> last_block_hash {};
        std::set<height_t> missed_blocks {};
        dataset data {};

        constexpr static auto serialize(auto &archive, auto &self)
        {
            return archive(self.first_block, self.last_block, self.last_handled_block, self.current_block,
                self.last_block_hash, self.missed_blocks, self.data);
        }

        // A missing file yields a default checkpoint; an unreadable one is fatal
        static checkpoint load(const std::string &path);
        void save(const std::string &path) const;
        void validate() const;
        // Moves the scan pointer to an explicit height requested at startup
        void override_start(height_t height);
        bool operator==(const checkpoint &o) const =default;
    };

    // The short form reports the scan pointers and the dataset sizes, the full one also lists every item
    extern std::string stats(const checkpoint &cp, bool full=false);
}

#endif // !FT_MIGRATOR_INDEX_CHECKPOINT_HPP
