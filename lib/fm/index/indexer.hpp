/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_INDEX_INDEXER_HPP
#define FT_MIGRATOR_INDEX_INDEXER_HPP

#include <chrono>
#include <initializer_list>
#include <fm/cancellation.hpp>
#include <fm/chain/client.hpp>
#include <fm/index/checkpoint-writer.hpp>

namespace ft_migrator::index {
    struct indexer_settings {
        std::string contract { "aurora" };
        std::optional<height_t> start_height {};
        std::chrono::milliseconds tip_refresh { 5000 };
        std::chrono::milliseconds tip_backoff { 1000 };
        std::chrono::milliseconds save_interval { 60000 };
        bool fetch_outcomes = false;

        static indexer_settings from_config(const config &indexer_cfg);
    };

    enum class step_result {
        merged, missed, reorg, at_tip
    };

    // Scans the chain block by block and accumulates the accounts and proofs touched by the tracked contract
    struct indexer {
        // start_override takes precedence over the configured start height and the saved position
        indexer(chain::client &client, const std::string &path, const indexer_settings &settings={},
            std::optional<height_t> start_override={});
        ~indexer();

        // One iteration of the scan loop
        step_result step();
        // Scans until the cancellation is triggered and saves the checkpoint
        void run(const cancellation &cancel);
        // Handles n heights, merged or missed, and saves the checkpoint; returns the number merged
        size_t run_n_blocks(size_t n, const cancellation *cancel=nullptr);
        // Fetches every missed height once; returns the number resolved
        size_t retry_missed();
        // Submits a snapshot to the background writer and waits for it to land
        void save();

        checkpoint snapshot() const;
        std::string stats(bool full=false) const;
    private:
        struct block_data {
            std::set<std::string> accounts {};
            std::set<std::string> proofs {};
            block_log log {};
            bool complete = true;
        };

        chain::client &_client;
        const indexer_settings _settings;
        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _mutex {};
        checkpoint _state;
        checkpoint_writer _writer;
        std::optional<height_t> _tip {};
        std::chrono::steady_clock::time_point _tip_updated {};
        std::chrono::steady_clock::time_point _last_save;
        std::optional<height_t> _last_reorg {};

        void _refresh_tip();
        block_data _process_block(const chain::block_info &blk);
        void _process_actions(block_data &res, const std::vector<chain::function_call> &actions, const hash_t &source,
            std::initializer_list<std::string_view> parties, const std::optional<std::string_view> &outcome_signer);
        void _merge(const chain::block_info &blk, block_data &&data, bool update_position);
        void _maybe_save();
    };
}

namespace fmt {
    template<>
    struct formatter<ft_migrator::index::step_result>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ft_migrator::index::step_result;
            switch (v) {
                case step_result::merged: return fmt::format_to(ctx.out(), "merged");
                case step_result::missed: return fmt::format_to(ctx.out(), "missed");
                case step_result::reorg: return fmt::format_to(ctx.out(), "reorg");
                case step_result::at_tip: return fmt::format_to(ctx.out(), "at_tip");
                default: throw ft_migrator::error("unsupported step_result: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !FT_MIGRATOR_INDEX_INDEXER_HPP
