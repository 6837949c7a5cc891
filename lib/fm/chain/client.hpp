/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_CHAIN_CLIENT_HPP
#define FT_MIGRATOR_CHAIN_CLIENT_HPP

#include <chrono>
#include <set>
#include <variant>
#include <fm/chain/call.hpp>
#include <fm/chain/node.hpp>
#include <fm/config.hpp>
#include <fm/retry.hpp>

namespace ft_migrator::chain {
    struct block_unavailable: error {
        explicit block_unavailable(const height_t height, const std::string_view reason):
            error { std::string_view { fmt::format("block {} is unavailable: {}", height, reason) } }, _height { height }
        {
        }

        height_t height() const noexcept
        {
            return _height;
        }
    private:
        height_t _height;
    };

    struct chunk_unavailable: error {
        explicit chunk_unavailable(const hash_t &chunk_id, const std::string_view reason):
            error { std::string_view { fmt::format("chunk {} is unavailable: {}", chunk_id, reason) } }, _chunk_id { chunk_id }
        {
        }

        const hash_t &chunk_id() const noexcept
        {
            return _chunk_id;
        }
    private:
        hash_t _chunk_id;
    };

    // A committed transaction finished with a failure status
    struct commit_failure: error {
        using error::error;
    };

    // The result of a boundary call that may legitimately fail: a value or the error describing the failure
    template<typename T, typename E=error>
    struct outcome {
        outcome(T &&val): _val { std::move(val) }
        {
        }

        outcome(E &&err): _val { std::move(err) }
        {
        }

        explicit operator bool() const noexcept
        {
            return std::holds_alternative<T>(_val);
        }

        // Throws the stored error when the call failed
        const T &value() const
        {
            if (const auto *err = std::get_if<E>(&_val))
                throw *err;
            return std::get<T>(_val);
        }

        const T &operator*() const
        {
            return value();
        }

        const T *operator->() const
        {
            return &value();
        }

        const E &error() const
        {
            if (const auto *err = std::get_if<E>(&_val))
                return *err;
            throw ft_migrator::error("the call succeeded and has no error");
        }
    private:
        std::variant<T, E> _val;
    };

    struct client_settings {
        std::chrono::milliseconds request_delay { 50 };
        size_t commit_retries = 10;
        uint64_t commit_gas = 300'000'000'000'000ULL;

        static client_settings from_config(const config &node_cfg);
    };

    // The sole point of contact with a chain node: every request is rate-limited and issued one at a time
    struct client {
        explicit client(node &n, const client_settings &settings={});

        height_t latest_height();
        // Failed block requests are remembered in the unresolved set
        outcome<block_info, block_unavailable> block_at(height_t height);
        outcome<chunk_info, chunk_unavailable> chunk(const hash_t &chunk_id);
        outcome<tx_outcome> tx_status(const hash_t &tx_hash, std::string_view signer_id);

        static call::effect parse_call(const std::string_view method, const buffer args)
        {
            return call::parse(method, args);
        }

        // Signs and broadcasts a single function call and waits for its final outcome.
        // Throws fatal_error once the retry budget is exhausted.
        tx_outcome commit_transaction(const near::signer &signer, std::string_view contract, std::string_view method, buffer payload);
        // Throws rpc_error when the node does not return a call result
        uint8_vector request_view(std::string_view contract, std::string_view method, buffer args);

        const std::set<height_t> &unresolved_blocks() const noexcept
        {
            return _unresolved_blocks;
        }

        void add_unresolved(const std::set<height_t> &heights)
        {
            _unresolved_blocks.insert(heights.begin(), heights.end());
        }

        void resolve(const height_t height)
        {
            _unresolved_blocks.erase(height);
        }

        const client_settings &settings() const noexcept
        {
            return _settings;
        }
    private:
        node &_node;
        const client_settings _settings;
        std::chrono::steady_clock::time_point _last_request {};
        std::set<height_t> _unresolved_blocks {};

        void _throttle();

        template<typename F>
        auto _request(const F &f) -> decltype(f())
        {
            _throttle();
            return f();
        }
    };
}

#endif // !FT_MIGRATOR_CHAIN_CLIENT_HPP
