/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_CHAIN_NODE_MOCK_HPP
#define FT_MIGRATOR_CHAIN_NODE_MOCK_HPP

#include <chrono>
#include <map>
#include <set>
#include <fm/chain/node.hpp>
#include <fm/migration/abi.hpp>

namespace ft_migrator::chain {
    // The state of a target contract implementing the migrate and check entry points
    struct contract_mock {
        std::map<std::string, u128> accounts {};
        u128 total_supply_on_near {};
        u128 total_supply_on_aurora {};
        uint64_t account_storage_usage = 0;
        uint64_t accounts_counter = 0;
        std::set<std::string> used_proofs {};

        void migrate(const migration::input_data &in);
        migration::check_result check(const migration::input_data &in) const;
    };

    // An in-memory chain node used as a test double
    struct node_mock: node {
        using time_point = std::chrono::steady_clock::time_point;

        explicit node_mock(std::string contract_id="aurora");

        // Adds or replaces the block at the height; its parent is the closest lower block
        const block_info &add_block(height_t height, const std::vector<chunk_info> &chunks={}, std::string_view fork="");
        void remove_block(height_t height);
        void remove_chunk(const hash_t &chunk_id);
        void set_final_height(height_t height);
        void set_tx_outcome(const hash_t &tx_hash, const tx_outcome &outcome);
        // The following n requests of any kind fail with a transport error
        void fail_next_requests(size_t n);
        // The following n broadcasts execute with a failure status
        void fail_next_commits(size_t n);
        void add_access_key(const std::string &account_id, const near::public_key &pk, uint64_t nonce=0);

        contract_mock &contract() noexcept
        {
            return _contract;
        }

        const std::vector<time_point> &request_times() const noexcept
        {
            return _request_times;
        }

        size_t num_requests() const noexcept
        {
            return _request_times.size();
        }

        size_t num_commits() const noexcept
        {
            return _num_commits;
        }

        uint64_t nonce(const std::string &account_id) const;

        static hash_t make_hash(std::string_view seed);
    private:
        std::string _contract_id;
        contract_mock _contract {};
        std::map<height_t, block_info> _blocks {};
        std::map<hash_t, chunk_info> _chunks {};
        std::map<hash_t, tx_outcome> _outcomes {};
        std::map<std::string, std::pair<near::public_key, uint64_t>> _access_keys {};
        std::optional<height_t> _final_height {};
        std::vector<time_point> _request_times {};
        size_t _fail_requests = 0;
        size_t _fail_commits = 0;
        size_t _num_commits = 0;

        void _on_request(std::string_view name);
        block_info _block_impl(height_t height) override;
        block_info _final_block_impl() override;
        chunk_info _chunk_impl(const hash_t &chunk_id) override;
        tx_outcome _tx_status_impl(const hash_t &tx_hash, std::string_view signer_id) override;
        access_key_info _access_key_impl(std::string_view account_id, const near::public_key &pk) override;
        tx_outcome _broadcast_tx_commit_impl(buffer signed_tx) override;
        uint8_vector _call_function_impl(std::string_view contract, std::string_view method, buffer args) override;
    };
}

#endif // !FT_MIGRATOR_CHAIN_NODE_MOCK_HPP
