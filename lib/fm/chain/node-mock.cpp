/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/borsh/decoder.hpp>
#include <fm/chain/node-mock.hpp>
#include <fm/json.hpp>
#include <fm/logger.hpp>
#include <fm/sha2.hpp>

namespace ft_migrator::chain {
    void contract_mock::migrate(const migration::input_data &in)
    {
        for (const auto &[id, amount]: in.accounts)
            accounts[id] = amount;
        if (in.total_supply)
            total_supply_on_near = *in.total_supply;
        if (in.account_storage_usage)
            account_storage_usage = *in.account_storage_usage;
        if (in.statistics_aurora_accounts_counter)
            accounts_counter = *in.statistics_aurora_accounts_counter;
        for (const auto &p: in.used_proofs)
            used_proofs.emplace(p);
    }

    migration::check_result contract_mock::check(const migration::input_data &in) const
    {
        migration::check::account_not_exist missing {};
        migration::check::account_amount mismatched {};
        for (const auto &[id, amount]: in.accounts) {
            const auto it = accounts.find(id);
            if (it == accounts.end())
                missing.accounts.emplace_back(id);
            else if (it->second != amount)
                mismatched.accounts.emplace_back(id, it->second);
        }
        if (!missing.accounts.empty())
            return missing;
        if (!mismatched.accounts.empty())
            return mismatched;
        if (in.total_supply && *in.total_supply != total_supply_on_near)
            return migration::check::total_supply { total_supply_on_near };
        if (in.account_storage_usage && *in.account_storage_usage != account_storage_usage)
            return migration::check::storage_usage { account_storage_usage };
        if (in.statistics_aurora_accounts_counter && *in.statistics_aurora_accounts_counter != accounts_counter)
            return migration::check::statistics_counter { accounts_counter };
        migration::check::proof missing_proofs {};
        for (const auto &p: in.used_proofs) {
            if (!used_proofs.contains(p))
                missing_proofs.proofs.emplace_back(p);
        }
        if (!missing_proofs.proofs.empty())
            return missing_proofs;
        return migration::check::success {};
    }

    namespace {
        struct decoded_call {
            std::string signer_id {};
            near::public_key pk {};
            uint64_t nonce = 0;
            std::string receiver_id {};
            std::string method {};
            uint8_vector args {};
            hash_t tx_hash {};
        };

        decoded_call decode_signed_tx(const buffer signed_tx)
        {
            if (signed_tx.size() < 65)
                throw rpc_error(rpc_error_kind::handler, "signed transaction is too short: {} bytes", signed_tx.size());
            const auto tx_bytes = signed_tx.subbuf(0, signed_tx.size() - 65);
            borsh::decoder dec { tx_bytes };
            decoded_call res {};
            res.signer_id = dec.string();
            if (dec.u8() != 0)
                throw rpc_error(rpc_error_kind::handler, "only ed25519 keys are supported");
            res.pk.key = near::hash { dec.fixed(32) };
            res.nonce = dec.u64();
            res.receiver_id = dec.string();
            dec.fixed(32);
            if (dec.u32() != 1)
                throw rpc_error(rpc_error_kind::handler, "only single-action transactions are supported");
            if (dec.u8() != 2)
                throw rpc_error(rpc_error_kind::handler, "only function call actions are supported");
            res.method = dec.string();
            res.args = dec.bytes();
            dec.u64();
            dec.u128();
            dec.ensure_end();
            res.tx_hash = sha2::digest(tx_bytes);
            borsh::decoder sig_dec { signed_tx.subbuf(tx_bytes.size(), 65) };
            if (sig_dec.u8() != 0)
                throw rpc_error(rpc_error_kind::handler, "only ed25519 signatures are supported");
            if (!ed25519::verify(sig_dec.fixed(64), res.pk.key, res.tx_hash))
                throw rpc_error(rpc_error_kind::handler, "invalid transaction signature");
            return res;
        }

        uint8_vector json_result(const json::value &v)
        {
            return uint8_vector { buffer { json::serialize(v) } };
        }
    }

    node_mock::node_mock(std::string contract_id): _contract_id { std::move(contract_id) }
    {
    }

    hash_t node_mock::make_hash(const std::string_view seed)
    {
        return sha2::digest(buffer { seed });
    }

    const block_info &node_mock::add_block(const height_t height, const std::vector<chunk_info> &chunks, const std::string_view fork)
    {
        block_info blk {};
        blk.height = height;
        blk.hash = make_hash(fmt::format("block-{}-{}", height, fork));
        if (const auto it = _blocks.lower_bound(height); it != _blocks.begin())
            blk.prev_hash = std::prev(it)->second.hash;
        for (const auto &chunk: chunks) {
            blk.chunks.emplace_back(chunk.hash);
            _chunks[chunk.hash] = chunk;
        }
        auto &res = _blocks[height];
        res = std::move(blk);
        return res;
    }

    void node_mock::remove_block(const height_t height)
    {
        _blocks.erase(height);
    }

    void node_mock::remove_chunk(const hash_t &chunk_id)
    {
        _chunks.erase(chunk_id);
    }

    void node_mock::set_final_height(const height_t height)
    {
        _final_height = height;
    }

    void node_mock::set_tx_outcome(const hash_t &tx_hash, const tx_outcome &outcome)
    {
        _outcomes[tx_hash] = outcome;
    }

    void node_mock::fail_next_requests(const size_t n)
    {
        _fail_requests = n;
    }

    void node_mock::fail_next_commits(const size_t n)
    {
        _fail_commits = n;
    }

    void node_mock::add_access_key(const std::string &account_id, const near::public_key &pk, const uint64_t nonce)
    {
        _access_keys[account_id] = { pk, nonce };
    }

    uint64_t node_mock::nonce(const std::string &account_id) const
    {
        const auto it = _access_keys.find(account_id);
        if (it == _access_keys.end())
            throw error("unknown account {}", account_id);
        return it->second.second;
    }

    void node_mock::_on_request(const std::string_view name)
    {
        _request_times.emplace_back(std::chrono::steady_clock::now());
        if (_fail_requests > 0) {
            --_fail_requests;
            throw rpc_error(rpc_error_kind::transport, "{}: simulated transport failure", name);
        }
    }

    block_info node_mock::_block_impl(const height_t height)
    {
        _on_request("block");
        const auto it = _blocks.find(height);
        if (it == _blocks.end())
            throw rpc_error(rpc_error_kind::unknown_block, "block {} is unknown", height);
        return it->second;
    }

    block_info node_mock::_final_block_impl()
    {
        _on_request("final_block");
        if (_blocks.empty())
            throw rpc_error(rpc_error_kind::unknown_block, "the chain is empty");
        if (_final_height) {
            auto it = _blocks.upper_bound(*_final_height);
            if (it == _blocks.begin())
                throw rpc_error(rpc_error_kind::unknown_block, "no block at or below the final height {}", *_final_height);
            return std::prev(it)->second;
        }
        return _blocks.rbegin()->second;
    }

    chunk_info node_mock::_chunk_impl(const hash_t &chunk_id)
    {
        _on_request("chunk");
        const auto it = _chunks.find(chunk_id);
        if (it == _chunks.end())
            throw rpc_error(rpc_error_kind::unknown_chunk, "chunk {} is unknown", chunk_id);
        return it->second;
    }

    tx_outcome node_mock::_tx_status_impl(const hash_t &tx_hash, const std::string_view)
    {
        _on_request("tx");
        const auto it = _outcomes.find(tx_hash);
        if (it == _outcomes.end())
            throw rpc_error(rpc_error_kind::unknown_transaction, "transaction {} is unknown", tx_hash);
        return it->second;
    }

    access_key_info node_mock::_access_key_impl(const std::string_view account_id, const near::public_key &pk)
    {
        _on_request("access_key");
        const auto it = _access_keys.find(std::string { account_id });
        if (it == _access_keys.end() || it->second.first != pk)
            throw rpc_error(rpc_error_kind::handler, "access key {} of {} does not exist", pk, account_id);
        return { it->second.second, _blocks.empty() ? hash_t {} : _blocks.rbegin()->second.hash };
    }

    tx_outcome node_mock::_broadcast_tx_commit_impl(const buffer signed_tx)
    {
        _on_request("broadcast_tx_commit");
        const auto call = decode_signed_tx(signed_tx);
        const auto key_it = _access_keys.find(call.signer_id);
        if (key_it == _access_keys.end())
            throw rpc_error(rpc_error_kind::handler, "InvalidAccessKeyError: {} has no access keys", call.signer_id);
        auto &[pk, nonce] = key_it->second;
        if (pk != call.pk)
            throw rpc_error(rpc_error_kind::handler, "InvalidAccessKeyError for {}", call.signer_id);
        if (call.nonce <= nonce)
            throw rpc_error(rpc_error_kind::handler, "InvalidNonce: {} <= {}", call.nonce, nonce);
        nonce = call.nonce;
        ++_num_commits;
        tx_outcome res {};
        res.tx_hash = call.tx_hash;
        if (_fail_commits > 0) {
            --_fail_commits;
            res.failure = R"({"ActionError":{"kind":"simulated"}})";
        } else if (call.receiver_id != _contract_id || call.method != "migrate") {
            res.failure = fmt::format(R"({{"ActionError":{{"kind":{{"MethodNotFound":"{}"}}}}}})", call.method);
        } else {
            _contract.migrate(migration::input_data::decode(call.args));
            res.success = true;
        }
        _outcomes[res.tx_hash] = res;
        return res;
    }

    uint8_vector node_mock::_call_function_impl(const std::string_view contract, const std::string_view method, const buffer args)
    {
        _on_request("call_function");
        if (contract != _contract_id)
            throw rpc_error(rpc_error_kind::handler, "account {} has no contract", contract);
        if (method == "check_migration_correctness")
            return migration::encode(_contract.check(migration::input_data::decode(args)));
        if (method == "ft_balance_of") {
            const auto req = json::parse(args);
            const auto &id = req.as_object().at("account_id").as_string();
            const auto it = _contract.accounts.find(std::string { id.data(), id.size() });
            return json_result(json::string { it == _contract.accounts.end() ? "0" : it->second.to_string() });
        }
        if (method == "ft_total_eth_supply_on_near")
            return json_result(json::string { _contract.total_supply_on_near.to_string() });
        if (method == "ft_total_eth_supply_on_aurora")
            return json_result(json::string { _contract.total_supply_on_aurora.to_string() });
        throw rpc_error(rpc_error_kind::handler, "MethodNotFound: {}", method);
    }
}
