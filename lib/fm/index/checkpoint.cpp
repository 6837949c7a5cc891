/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <filesystem>
#include <fm/index/checkpoint.hpp>
#include <fm/logger.hpp>
#include <fm/zpp.hpp>

namespace ft_migrator::index {
    void dataset::merge(const std::set<std::string> &new_accounts, const std::set<std::string> &new_proofs, block_log &&log)
    {
        accounts.insert(new_accounts.begin(), new_accounts.end());
        proofs.insert(new_proofs.begin(), new_proofs.end());
        // appending is the common case
        if (logs.empty() || logs.back().height < log.height) {
            if (!log.actions.empty())
                logs.emplace_back(std::move(log));
            return;
        }
        const auto it = std::lower_bound(logs.begin(), logs.end(), log.height, [](const auto &l, const height_t h) { return l.height < h; });
        if (it != logs.end() && it->height == log.height) {
            if (log.actions.empty())
                logs.erase(it);
            else
                *it = std::move(log);
        } else if (!log.actions.empty()) {
            logs.emplace(it, std::move(log));
        }
    }

    checkpoint checkpoint::load(const std::string &path)
    {
        if (!std::filesystem::exists(path)) {
            logger::info("checkpoint {} does not exist, starting with an empty one", path);
            return {};
        }
        checkpoint cp {};
        try {
            zpp::deserialize(cp, file::read(path));
        } catch (const std::exception &ex) {
            throw error("checkpoint {} is unreadable: {}", path, ex.what());
        }
        cp.validate();
        logger::info("loaded checkpoint {}: last handled block: {} accounts: {} proofs: {} missed blocks: {}",
            path, cp.last_handled_block, cp.data.accounts.size(), cp.data.proofs.size(), cp.missed_blocks.size());
        return cp;
    }

    void checkpoint::save(const std::string &path) const
    {
        zpp::save(path, *this);
    }

    void checkpoint::validate() const
    {
        if (first_block) {
            if (*first_block > last_handled_block)
                throw error("checkpoint: first block {} is after the last handled block {}", *first_block, last_handled_block);
            if (last_block < last_handled_block)
                throw error("checkpoint: the next block {} is before the last handled block {}", last_block, last_handled_block);
        } else if (last_block_hash) {
            throw error("checkpoint: a block hash is recorded but no block has been handled");
        }
        for (size_t i = 1; i < data.logs.size(); ++i) {
            if (data.logs[i - 1].height >= data.logs[i].height)
                throw error("checkpoint: log groups are out of order at heights {} and {}", data.logs[i - 1].height, data.logs[i].height);
        }
    }

    void checkpoint::override_start(const height_t height)
    {
        logger::info("scan start overridden: {} -> {}", last_block, height);
        last_block = height;
        last_block_hash.reset();
        if (last_handled_block >= height)
            last_handled_block = height > 0 ? height - 1 : 0;
        if (first_block && *first_block > last_handled_block)
            first_block.reset();
    }

    std::string stats(const checkpoint &cp, const bool full)
    {
        size_t num_actions = 0;
        for (const auto &l: cp.data.logs)
            num_actions += l.actions.size();
        auto res = fmt::format("first block: {}\nnext block: {}\nlast handled block: {}\nchain tip: {}\nlast block hash: {}\n"
            "missed blocks: {}\naccounts: {}\nproofs: {}\nlog groups: {}\nrecorded actions: {}\n",
            cp.first_block, cp.last_block, cp.last_handled_block, cp.current_block, cp.last_block_hash,
            cp.missed_blocks.size(), cp.data.accounts.size(), cp.data.proofs.size(), cp.data.logs.size(), num_actions);
        if (full) {
            res += fmt::format("missed heights: {}\n", cp.missed_blocks);
            for (const auto &acc: cp.data.accounts)
                res += fmt::format("account: {}\n", acc);
            for (const auto &p: cp.data.proofs)
                res += fmt::format("proof: {}\n", p);
            for (const auto &l: cp.data.logs) {
                for (const auto &a: l.actions)
                    res += fmt::format("log: height: {} method: {} accounts: {} proof: {} source: {} success: {}\n",
                        l.height, a.method, a.accounts, a.proof, a.source, a.success);
            }
        }
        return res;
    }
}
