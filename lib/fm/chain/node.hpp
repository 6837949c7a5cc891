/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_CHAIN_NODE_HPP
#define FT_MIGRATOR_CHAIN_NODE_HPP

#include <optional>
#include <string>
#include <vector>
#include <fm/near/types.hpp>

namespace ft_migrator::chain {
    using height_t = uint64_t;
    using hash_t = near::hash;

    struct block_info {
        height_t height = 0;
        hash_t hash {};
        hash_t prev_hash {};
        std::vector<hash_t> chunks {};
    };

    struct function_call {
        std::string method {};
        uint8_vector args {};
    };

    struct transaction_view {
        hash_t hash {};
        std::string signer_id {};
        std::string receiver_id {};
        std::vector<function_call> actions {};
    };

    struct receipt_view {
        hash_t receipt_id {};
        std::string predecessor_id {};
        std::string receiver_id {};
        std::string signer_id {};
        std::vector<function_call> actions {};
    };

    struct chunk_info {
        hash_t hash {};
        std::vector<transaction_view> transactions {};
        std::vector<receipt_view> receipts {};
    };

    struct tx_outcome {
        hash_t tx_hash {};
        bool success = false;
        // the return value of a successful call, the failure description otherwise
        uint8_vector value {};
        std::string failure {};
        std::vector<std::string> logs {};
    };

    struct access_key_info {
        uint64_t nonce = 0;
        hash_t block_hash {};
    };

    enum class rpc_error_kind {
        unknown_block, unknown_chunk, unknown_transaction, transport, handler, timeout
    };

    struct rpc_error: error {
        template<typename... Args>
        explicit rpc_error(const rpc_error_kind kind, const std::string_view fmt, Args&&... a):
            error { std::string_view { fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...) } }, _kind { kind }
        {
        }

        rpc_error_kind kind() const noexcept
        {
            return _kind;
        }

        // transient conditions that a later identical request may not hit
        bool retryable() const noexcept
        {
            return _kind == rpc_error_kind::transport || _kind == rpc_error_kind::timeout;
        }
    private:
        rpc_error_kind _kind;
    };

    // The seven request shapes the tool needs from a chain node
    struct node {
        virtual ~node() =default;

        block_info block(const height_t height)
        {
            return _block_impl(height);
        }

        block_info final_block()
        {
            return _final_block_impl();
        }

        chunk_info chunk(const hash_t &chunk_id)
        {
            return _chunk_impl(chunk_id);
        }

        tx_outcome tx_status(const hash_t &tx_hash, const std::string_view signer_id)
        {
            return _tx_status_impl(tx_hash, signer_id);
        }

        access_key_info access_key(const std::string_view account_id, const near::public_key &pk)
        {
            return _access_key_impl(account_id, pk);
        }

        tx_outcome broadcast_tx_commit(const buffer signed_tx)
        {
            return _broadcast_tx_commit_impl(signed_tx);
        }

        uint8_vector call_function(const std::string_view contract, const std::string_view method, const buffer args)
        {
            return _call_function_impl(contract, method, args);
        }
    private:
        virtual block_info _block_impl(height_t height) =0;
        virtual block_info _final_block_impl() =0;
        virtual chunk_info _chunk_impl(const hash_t &chunk_id) =0;
        virtual tx_outcome _tx_status_impl(const hash_t &tx_hash, std::string_view signer_id) =0;
        virtual access_key_info _access_key_impl(std::string_view account_id, const near::public_key &pk) =0;
        virtual tx_outcome _broadcast_tx_commit_impl(buffer signed_tx) =0;
        virtual uint8_vector _call_function_impl(std::string_view contract, std::string_view method, buffer args) =0;
    };
}

namespace fmt {
    template<>
    struct formatter<ft_migrator::chain::rpc_error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ft_migrator::chain::rpc_error_kind;
            switch (v) {
                case rpc_error_kind::unknown_block: return fmt::format_to(ctx.out(), "unknown_block");
                case rpc_error_kind::unknown_chunk: return fmt::format_to(ctx.out(), "unknown_chunk");
                case rpc_error_kind::unknown_transaction: return fmt::format_to(ctx.out(), "unknown_transaction");
                case rpc_error_kind::transport: return fmt::format_to(ctx.out(), "transport");
                case rpc_error_kind::handler: return fmt::format_to(ctx.out(), "handler");
                case rpc_error_kind::timeout: return fmt::format_to(ctx.out(), "timeout");
                default: throw ft_migrator::error("unsupported rpc_error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !FT_MIGRATOR_CHAIN_NODE_HPP
