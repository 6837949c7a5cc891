/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <thread>
#include <fm/index/indexer.hpp>
#include <fm/logger.hpp>
#include <fm/progress.hpp>

namespace ft_migrator::index {
    indexer_settings indexer_settings::from_config(const config &indexer_cfg)
    {
        const auto &obj = indexer_cfg.json();
        indexer_settings s {};
        s.contract = json::string_or(obj, "contract", s.contract);
        near::validate_account_id(s.contract);
        if (const auto *h = obj.if_contains("startHeight"); h && !h->is_null())
            s.start_height = json::as_uint(*h);
        s.tip_refresh = std::chrono::seconds { json::uint_or(obj, "tipRefreshSecs", 5) };
        s.tip_backoff = std::chrono::milliseconds { json::uint_or(obj, "tipBackoffMs", s.tip_backoff.count()) };
        s.save_interval = std::chrono::seconds { json::uint_or(obj, "saveIntervalSecs", 60) };
        s.fetch_outcomes = json::bool_or(obj, "fetchOutcomes", s.fetch_outcomes);
        return s;
    }

    indexer::indexer(chain::client &client, const std::string &path, const indexer_settings &settings, const std::optional<height_t> start_override)
        : _client { client }, _settings { settings }, _state { checkpoint::load(path) }, _writer { path },
            _last_save { std::chrono::steady_clock::now() }
    {
        if (start_override)
            _state.override_start(*start_override);
        else if (!_state.first_block && _state.last_block == 0 && _settings.start_height)
            _state.last_block = *_settings.start_height;
        _client.add_unresolved(_state.missed_blocks);
    }

    indexer::~indexer() =default;

    checkpoint indexer::snapshot() const
    {
        mutex::scoped_lock lk { _mutex };
        return _state;
    }

    std::string indexer::stats(const bool full) const
    {
        return index::stats(snapshot(), full);
    }

    void indexer::save()
    {
        _writer.submit(snapshot());
        _writer.flush();
        _last_save = std::chrono::steady_clock::now();
    }

    void indexer::_maybe_save()
    {
        if (const auto now = std::chrono::steady_clock::now(); now - _last_save >= _settings.save_interval) {
            _writer.submit(snapshot());
            _last_save = now;
        }
    }

    void indexer::_refresh_tip()
    {
        const auto now = std::chrono::steady_clock::now();
        if (_tip && now - _tip_updated < _settings.tip_refresh)
            return;
        try {
            _tip = _client.latest_height();
            _tip_updated = now;
            mutex::scoped_lock lk { _mutex };
            _state.current_block = std::max(_state.current_block, *_tip);
        } catch (const std::exception &ex) {
            logger::warn("failed to refresh the chain tip: {}", ex.what());
        }
    }

    void indexer::_process_actions(block_data &res, const std::vector<chain::function_call> &actions, const hash_t &source,
        const std::initializer_list<std::string_view> parties, const std::optional<std::string_view> &outcome_signer)
    {
        std::optional<std::optional<bool>> tx_success {};
        for (const auto &act: actions) {
            if (!chain::call::recognized(act.method))
                continue;
            const auto eff = chain::client::parse_call(act.method, act.args);
            std::set<std::string> accounts { eff.accounts.begin(), eff.accounts.end() };
            for (const auto &p: parties)
                accounts.emplace(p);
            accounts.emplace(_settings.contract);
            res.accounts.insert(accounts.begin(), accounts.end());
            if (eff.proof)
                res.proofs.emplace(*eff.proof);
            auto &rec = res.log.actions.emplace_back();
            rec.method = act.method;
            rec.accounts.assign(accounts.begin(), accounts.end());
            rec.proof = eff.proof;
            rec.source = source;
            if (outcome_signer) {
                if (!tx_success) {
                    const auto out = _client.tx_status(source, *outcome_signer);
                    tx_success.emplace(out ? std::optional<bool> { out->success } : std::optional<bool> {});
                }
                rec.success = *tx_success;
            }
        }
    }

    indexer::block_data indexer::_process_block(const chain::block_info &blk)
    {
        block_data res {};
        res.log.height = blk.height;
        for (const auto &chunk_id: blk.chunks) {
            const auto chunk = _client.chunk(chunk_id);
            if (!chunk) {
                res.complete = false;
                continue;
            }
            for (const auto &tx: chunk->transactions) {
                if (tx.receiver_id != _settings.contract)
                    continue;
                std::optional<std::string_view> outcome_signer {};
                if (_settings.fetch_outcomes)
                    outcome_signer = tx.signer_id;
                _process_actions(res, tx.actions, tx.hash, { tx.signer_id }, outcome_signer);
            }
            for (const auto &r: chunk->receipts) {
                // receipts converted from a transaction repeat the actions already taken from it
                if (r.receiver_id != _settings.contract || r.predecessor_id == r.signer_id)
                    continue;
                _process_actions(res, r.actions, r.receipt_id, { r.predecessor_id, r.signer_id }, {});
            }
        }
        return res;
    }

    void indexer::_merge(const chain::block_info &blk, block_data &&data, const bool update_position)
    {
        if (!data.complete) {
            logger::warn("block {} was merged partially since some of its chunks are unavailable", blk.height);
            _client.add_unresolved({ blk.height });
        }
        mutex::scoped_lock lk { _mutex };
        _state.data.merge(data.accounts, data.proofs, std::move(data.log));
        _state.missed_blocks = _client.unresolved_blocks();
        if (update_position) {
            if (!_state.first_block)
                _state.first_block = blk.height;
            _state.last_block = blk.height + 1;
            _state.last_handled_block = blk.height;
            _state.last_block_hash = blk.hash;
            if (_tip)
                _state.current_block = std::max(_state.current_block, *_tip);
        }
    }

    step_result indexer::step()
    {
        _refresh_tip();
        height_t next;
        std::optional<hash_t> prev_hash {};
        {
            mutex::scoped_lock lk { _mutex };
            // without a configured start the scan begins at the chain tip
            if (!_state.first_block && _state.last_block == 0 && _tip)
                _state.last_block = *_tip;
            next = _state.last_block;
            prev_hash = _state.last_block_hash;
        }
        if (!_tip || next > *_tip)
            return step_result::at_tip;
        const auto blk = _client.block_at(next);
        if (!blk) {
            mutex::scoped_lock lk { _mutex };
            _state.last_block = next + 1;
            // continuity to the next available block is unknown
            _state.last_block_hash.reset();
            _state.missed_blocks = _client.unresolved_blocks();
            return step_result::missed;
        }
        if (prev_hash && *prev_hash != blk->prev_hash) {
            if (_last_reorg != next) {
                _last_reorg = next;
                mutex::scoped_lock lk { _mutex };
                logger::warn("reorganization at height {}: parent {} differs from the recorded hash {}; rolling back to {}",
                    next, blk->prev_hash, *prev_hash, _state.last_handled_block);
                _state.last_block = _state.last_handled_block;
                _state.last_block_hash.reset();
                return step_result::reorg;
            }
            // the block is never merged; it stays visible as missed and can be backfilled with retry_missed
            logger::warn("block {} still does not continue the re-validated block {}; recording it as missed", next, next - 1);
            _last_reorg.reset();
            _client.add_unresolved({ next });
            mutex::scoped_lock lk { _mutex };
            _state.last_block = next + 1;
            _state.last_block_hash.reset();
            _state.missed_blocks = _client.unresolved_blocks();
            return step_result::missed;
        }
        _merge(*blk, _process_block(*blk), true);
        if (_last_reorg && *_last_reorg < next)
            _last_reorg.reset();
        _maybe_save();
        return step_result::merged;
    }

    void indexer::run(const cancellation &cancel)
    {
        logger::info("indexing {} starting from height {}", _settings.contract, snapshot().last_block);
        size_t num_handled = 0;
        // the progress merged before a failure is persisted as well
        logger::run_log_errors_rethrow([&] {
            while (!cancel.triggered()) {
                if (const auto res = step(); res == step_result::at_tip) {
                    cancel.wait_for(_settings.tip_backoff);
                } else if (++num_handled % 100 == 0) {
                    const auto cp = snapshot();
                    logger::info("height: {} tip: {} accounts: {} proofs: {} missed: {}",
                        cp.last_handled_block, cp.current_block, cp.data.accounts.size(), cp.data.proofs.size(), cp.missed_blocks.size());
                }
            }
        }, [&] { save(); });
        logger::info("indexing stopped at height {}", snapshot().last_block);
    }

    size_t indexer::run_n_blocks(const size_t n, const cancellation *cancel)
    {
        progress_guard pg { "index" };
        size_t num_handled = 0;
        size_t num_merged = 0;
        while (num_handled < n && !(cancel && cancel->triggered())) {
            switch (step()) {
                case step_result::merged:
                    ++num_merged;
                    ++num_handled;
                    break;
                case step_result::missed:
                    ++num_handled;
                    break;
                case step_result::reorg:
                    break;
                case step_result::at_tip:
                    if (cancel)
                        cancel->wait_for(_settings.tip_backoff);
                    else
                        std::this_thread::sleep_for(_settings.tip_backoff);
                    break;
            }
            progress::get().update("index", num_handled, n);
        }
        progress::get().inform();
        save();
        return num_merged;
    }

    size_t indexer::retry_missed()
    {
        std::set<height_t> missed {};
        {
            mutex::scoped_lock lk { _mutex };
            missed = _state.missed_blocks;
        }
        size_t num_resolved = 0;
        for (const auto h: missed) {
            const auto blk = _client.block_at(h);
            if (!blk)
                continue;
            auto data = _process_block(*blk);
            const auto complete = data.complete;
            _client.resolve(h);
            _merge(*blk, std::move(data), false);
            if (complete)
                ++num_resolved;
        }
        {
            mutex::scoped_lock lk { _mutex };
            _state.missed_blocks = _client.unresolved_blocks();
        }
        logger::info("missed blocks resolved: {} of {}", num_resolved, missed.size());
        save();
        return num_resolved;
    }
}
