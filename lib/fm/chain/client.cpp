/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <thread>
#include <fm/chain/client.hpp>
#include <fm/logger.hpp>
#include <fm/near/transaction.hpp>

namespace ft_migrator::chain {
    client_settings client_settings::from_config(const config &node_cfg)
    {
        const auto &obj = node_cfg.json();
        client_settings s {};
        s.request_delay = std::chrono::milliseconds { json::uint_or(obj, "requestDelayMs", s.request_delay.count()) };
        s.commit_retries = json::uint_or(obj, "commitRetries", s.commit_retries);
        s.commit_gas = json::uint_or(obj, "commitGas", s.commit_gas);
        if (s.commit_retries == 0)
            throw error("commitRetries must be positive");
        if (s.commit_gas > near::max_gas)
            throw error("commitGas {} exceeds the per-call maximum of {}", s.commit_gas, near::max_gas);
        return s;
    }

    client::client(node &n, const client_settings &settings)
        : _node { n }, _settings { settings }
    {
    }

    void client::_throttle()
    {
        if (_last_request != std::chrono::steady_clock::time_point {}) {
            const auto next = _last_request + _settings.request_delay;
            if (const auto now = std::chrono::steady_clock::now(); now < next)
                std::this_thread::sleep_until(next);
        }
        _last_request = std::chrono::steady_clock::now();
    }

    height_t client::latest_height()
    {
        return _request([&] { return _node.final_block(); }).height;
    }

    outcome<block_info, block_unavailable> client::block_at(const height_t height)
    {
        try {
            auto blk = _request([&] { return _node.block(height); });
            if (blk.height != height)
                throw error("the node returned block {} instead", blk.height);
            return blk;
        } catch (const std::exception &ex) {
            logger::warn("failed to fetch block {}: {}", height, ex.what());
            _unresolved_blocks.emplace(height);
            return block_unavailable { height, ex.what() };
        }
    }

    outcome<chunk_info, chunk_unavailable> client::chunk(const hash_t &chunk_id)
    {
        try {
            return _request([&] { return _node.chunk(chunk_id); });
        } catch (const std::exception &ex) {
            logger::warn("failed to fetch chunk {}: {}", chunk_id, ex.what());
            return chunk_unavailable { chunk_id, ex.what() };
        }
    }

    outcome<tx_outcome> client::tx_status(const hash_t &tx_hash, const std::string_view signer_id)
    {
        try {
            return _request([&] { return _node.tx_status(tx_hash, signer_id); });
        } catch (const std::exception &ex) {
            logger::warn("failed to fetch the status of transaction {}: {}", tx_hash, ex.what());
            return error { std::string_view { ex.what() } };
        }
    }

    tx_outcome client::commit_transaction(const near::signer &signer, const std::string_view contract, const std::string_view method, const buffer payload)
    {
        retry_policy policy { fmt::format("commit {}.{}", contract, method), _settings.commit_retries };
        policy.retryable = [](const std::exception &ex) {
            return dynamic_cast<const rpc_error *>(&ex) != nullptr || dynamic_cast<const commit_failure *>(&ex) != nullptr;
        };
        return with_retries(policy, [&](const size_t attempt) {
            // the nonce is re-read on every attempt since a failed transaction may still have consumed one
            const auto ak = _request([&] { return _node.access_key(signer.account_id, signer.pk); });
            near::transaction tx {};
            tx.signer_id = signer.account_id;
            tx.pk = signer.pk;
            tx.nonce = ak.nonce + 1;
            tx.receiver_id = contract;
            tx.block_hash = ak.block_hash;
            tx.actions.emplace_back(near::function_call_action { std::string { method }, uint8_vector { payload }, _settings.commit_gas, u128 {} });
            const auto signed_tx = near::sign(tx, signer);
            logger::debug("commit attempt {}: tx {} nonce {} payload {} bytes", attempt, near::hash_to_base58(signed_tx.tx_hash), tx.nonce, payload.size());
            auto res = _request([&] { return _node.broadcast_tx_commit(signed_tx.bytes); });
            if (!res.success)
                throw commit_failure("transaction {} failed: {}", near::hash_to_base58(signed_tx.tx_hash), res.failure);
            return res;
        });
    }

    uint8_vector client::request_view(const std::string_view contract, const std::string_view method, const buffer args)
    {
        return _request([&] { return _node.call_function(contract, method, args); });
    }
}
