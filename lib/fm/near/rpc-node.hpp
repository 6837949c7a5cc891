/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_NEAR_RPC_NODE_HPP
#define FT_MIGRATOR_NEAR_RPC_NODE_HPP

#include <chrono>
#include <memory>
#include <fm/chain/node.hpp>
#include <fm/json.hpp>

namespace ft_migrator::near {
    // chain::node over the NEAR JSON-RPC 2.0 interface
    struct rpc_node: chain::node {
        static json::value unwrap_response(const json::value &response);
        static chain::block_info parse_block(const json::value &result);
        static chain::chunk_info parse_chunk(const json::value &result);
        static chain::tx_outcome parse_outcome(const json::value &result);
        static chain::access_key_info parse_access_key(const json::value &result);
        static uint8_vector parse_call_result(const json::value &result);

        explicit rpc_node(const std::string &url, std::chrono::seconds timeout=std::chrono::seconds { 30 });
        ~rpc_node() override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;

        chain::block_info _block_impl(chain::height_t height) override;
        chain::block_info _final_block_impl() override;
        chain::chunk_info _chunk_impl(const chain::hash_t &chunk_id) override;
        chain::tx_outcome _tx_status_impl(const chain::hash_t &tx_hash, std::string_view signer_id) override;
        chain::access_key_info _access_key_impl(std::string_view account_id, const public_key &pk) override;
        chain::tx_outcome _broadcast_tx_commit_impl(buffer signed_tx) override;
        uint8_vector _call_function_impl(std::string_view contract, std::string_view method, buffer args) override;
    };
}

#endif // !FT_MIGRATOR_NEAR_RPC_NODE_HPP
