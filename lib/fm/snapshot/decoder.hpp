/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_SNAPSHOT_DECODER_HPP
#define FT_MIGRATOR_SNAPSHOT_DECODER_HPP

#include <optional>
#include <fm/json.hpp>
#include <fm/migration/state.hpp>

namespace ft_migrator::snapshot {
    struct format_error: error {
        using error::error;
    };

    // Storage keys: a version byte, a subsystem byte, a field byte and an optional suffix
    static constexpr uint8_t version_prefix = 0x07;
    static constexpr uint8_t eth_connector_prefix = 0x06;
    static constexpr uint8_t fungible_token_field = 0x01;
    static constexpr uint8_t used_event_field = 0x02;
    static constexpr uint8_t accounts_counter_field = 0x04;

    enum class key_kind {
        account_balance, contract_totals, used_proof, account_counter, unrecognized
    };

    struct key_info {
        key_kind kind = key_kind::unrecognized;
        // the account or proof identifier for the kinds that carry one
        std::string suffix {};
    };

    extern key_info classify(buffer key);
    extern uint8_vector make_key(uint8_t field, std::string_view suffix="");

    struct decode_result {
        uint64_t block_height = 0;
        size_t num_values = 0;
        migration::state_data state {};
    };

    // Accepts the full RPC response or its bare result object; throws format_error on any malformed item
    extern decode_result decode(const json::value &doc);
    extern decode_result decode_file(const std::string &path);
    extern std::string default_output_path(uint64_t block_height);
    // Decodes the export, reports its statistics and saves the migration-ready state; returns the output path
    extern std::string convert(const std::string &export_path, const std::optional<std::string> &output_path={});
}

namespace fmt {
    template<>
    struct formatter<ft_migrator::snapshot::key_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using ft_migrator::snapshot::key_kind;
            switch (v) {
                case key_kind::account_balance: return fmt::format_to(ctx.out(), "account_balance");
                case key_kind::contract_totals: return fmt::format_to(ctx.out(), "contract_totals");
                case key_kind::used_proof: return fmt::format_to(ctx.out(), "used_proof");
                case key_kind::account_counter: return fmt::format_to(ctx.out(), "account_counter");
                case key_kind::unrecognized: return fmt::format_to(ctx.out(), "unrecognized");
                default: throw ft_migrator::error("unsupported key_kind: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !FT_MIGRATOR_SNAPSHOT_DECODER_HPP
