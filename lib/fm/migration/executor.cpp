/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/logger.hpp>
#include <fm/migration/executor.hpp>
#include <fm/progress.hpp>
#include <fm/timer.hpp>

namespace ft_migrator::migration {
    executor_settings executor_settings::from_config(const config &migration_cfg)
    {
        const auto &obj = migration_cfg.json();
        executor_settings s {};
        s.contract = json::string_or(obj, "contract", s.contract);
        near::validate_account_id(s.contract);
        s.batch_size = json::uint_or(obj, "batchSize", s.batch_size);
        if (s.batch_size == 0)
            throw error("migration.batchSize must be positive");
        s.migrate_method = json::string_or(obj, "migrateMethod", s.migrate_method);
        s.check_method = json::string_or(obj, "checkMethod", s.check_method);
        s.balance_method = json::string_or(obj, "balanceMethod", s.balance_method);
        s.supply_on_near_method = json::string_or(obj, "supplyOnNearMethod", s.supply_on_near_method);
        s.supply_on_aurora_method = json::string_or(obj, "supplyOnAuroraMethod", s.supply_on_aurora_method);
        return s;
    }

    size_t report::num_success() const
    {
        size_t n = 0;
        for (const auto &v: items)
            n += v.success() ? 1 : 0;
        return n;
    }

    size_t report::num_mismatches() const
    {
        size_t n = 0;
        for (const auto &v: items) {
            if (v.result)
                n += mismatch_count(*v.result);
        }
        return n;
    }

    std::string describe(const report &rep)
    {
        std::string res = fmt::format("committed batches: {}\nverified batches: {}\nsuccessful: {}\nfailed: {}\nmismatched items: {}\n",
            rep.num_committed, rep.items.size(), rep.num_success(), rep.items.size() - rep.num_success(), rep.num_mismatches());
        for (const auto &v: rep.items) {
            if (v.success())
                continue;
            if (v.result)
                res += fmt::format("{} batch at {}: {}\n", v.kind, v.counter, migration::describe(*v.result));
            else
                res += fmt::format("{} batch at {}: check failed: {}\n", v.kind, v.counter, v.failure);
        }
        return res;
    }

    executor::executor(chain::client &client, const executor_settings &settings)
        : _client { client }, _settings { settings }
    {
    }

    uint8_vector executor::_view(const std::string_view method, const buffer args)
    {
        retry_policy policy { fmt::format("view {}.{}", _settings.contract, method), _client.settings().commit_retries };
        policy.retryable = [](const std::exception &ex) {
            const auto *rpc_ex = dynamic_cast<const chain::rpc_error *>(&ex);
            return rpc_ex && rpc_ex->retryable();
        };
        return with_retries(policy, [&](const size_t) {
            return _client.request_view(_settings.contract, method, args);
        });
    }

    u128 executor::_view_amount(const std::string_view method, const buffer args)
    {
        const auto bytes = _view(method, args);
        try {
            const auto res = json::parse(buffer { bytes });
            if (res.is_string())
                return u128::from_string(std::string_view { res.get_string().data(), res.get_string().size() });
            return u128 { json::as_uint(res) };
        } catch (const std::exception &ex) {
            throw error("{} returned an unexpected result {}: {}", method, bytes.str(), ex.what());
        }
    }

    verification executor::_check(const committed_batch &b)
    {
        verification v { b.kind, b.counter };
        try {
            v.result = decode_check_result(_view(_settings.check_method, b.payload));
        } catch (const std::exception &ex) {
            v.failure = ex.what();
        }
        return v;
    }

    report executor::_verify(const std::vector<committed_batch> &batches, const size_t num_committed)
    {
        timer t { "verification", logger::level::info };
        progress_guard pg { "verify" };
        report rep { num_committed };
        for (size_t i = 0; i < batches.size(); ++i) {
            auto v = _check(batches[i]);
            if (v.success())
                logger::info("{} batch at {}: Success", v.kind, v.counter);
            else if (v.result)
                logger::warn("{} batch at {}: {} mismatched items: {}", v.kind, v.counter, mismatch_count(*v.result), migration::describe(*v.result));
            else
                logger::error("{} batch at {}: the check call failed: {}", v.kind, v.counter, v.failure);
            rep.items.emplace_back(std::move(v));
            progress::get().update("verify", i + 1, batches.size());
        }
        return rep;
    }

    report executor::migrate(const near::signer &signer, const state_data &st)
    {
        st.validate();
        const auto batches = make_batches(st, _settings.batch_size);
        logger::info("migrating {} accounts and {} proofs to {} in {} batches", st.accounts.size(), st.proofs.size(), _settings.contract, batches.size());
        {
            timer t { "commit", logger::level::info };
            progress_guard pg { "migrate" };
            _committed.clear();
            for (size_t i = 0; i < batches.size(); ++i) {
                const auto &b = batches[i];
                auto payload = b.input.encode();
                _client.commit_transaction(signer, _settings.contract, _settings.migrate_method, payload);
                logger::info("committed {} batch {}/{}: {} records, counter: {}", b.kind, i + 1, batches.size(), b.size(), b.counter);
                _committed.emplace_back(committed_batch { b.kind, std::move(payload), b.counter });
                progress::get().update("migrate", i + 1, batches.size());
            }
        }
        auto rep = _verify(_committed, _committed.size());
        logger::info("migration report:\n{}", describe(rep));
        return rep;
    }

    report executor::validate(const state_data &st)
    {
        st.validate();
        const auto batches = make_batches(st, _settings.batch_size);
        std::vector<committed_batch> recs {};
        recs.reserve(batches.size());
        for (const auto &b: batches)
            recs.emplace_back(committed_batch { b.kind, b.input.encode(), b.counter });
        auto rep = _verify(recs, 0);
        logger::info("validation report:\n{}", describe(rep));
        return rep;
    }

    state_data executor::prepare_indexed(const index::checkpoint &cp)
    {
        timer t { "prepare migration from the index", logger::level::info };
        progress_guard pg { "balances" };
        state_data st {};
        size_t num_zero = 0;
        size_t num_done = 0;
        for (const auto &id: cp.data.accounts) {
            const json::object args { { "account_id", id } };
            const auto balance = _view_amount(_settings.balance_method, buffer { json::serialize(args) });
            if (balance == u128 {})
                ++num_zero;
            else
                st.accounts.emplace(id, balance);
            progress::get().update("balances", ++num_done, cp.data.accounts.size());
        }
        st.accounts_counter = st.accounts.size();
        st.proofs.assign(cp.data.proofs.begin(), cp.data.proofs.end());
        st.totals.supply_on_near = _view_amount(_settings.supply_on_near_method, buffer { std::string_view { "{}" } });
        st.totals.supply_on_aurora = _view_amount(_settings.supply_on_aurora_method, buffer { std::string_view { "{}" } });
        logger::info("indexed accounts: {} with a balance: {} with a zero balance: {} proofs: {}",
            cp.data.accounts.size(), st.accounts.size(), num_zero, st.proofs.size());
        st.validate();
        return st;
    }
}
