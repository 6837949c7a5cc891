/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <utf8.h>
#include <fm/base64.hpp>
#include <fm/borsh/decoder.hpp>
#include <fm/logger.hpp>
#include <fm/near/types.hpp>
#include <fm/snapshot/decoder.hpp>
#include <fm/timer.hpp>

namespace ft_migrator::snapshot {
    namespace {
        uint8_vector decode_text(const json::value &v, const std::string_view what, const size_t idx)
        {
            if (!v.is_string())
                throw format_error("value #{}: the {} is not a string", idx, what);
            const auto &s = v.get_string();
            try {
                return base64::decode(std::string_view { s.data(), s.size() });
            } catch (const error &ex) {
                throw format_error("value #{}: the {} is not valid base64: {}", idx, what, ex.what());
            }
        }

        migration::contract_totals decode_totals(const buffer val)
        {
            if (val.size() != 40)
                throw format_error("the contract totals record must have 40 bytes but has {}", val.size());
            borsh::decoder dec { val };
            migration::contract_totals res {};
            res.supply_on_near = dec.u128();
            res.supply_on_aurora = dec.u128();
            res.storage_usage = dec.u64();
            return res;
        }

        u128 decode_balance(const std::string &account_id, const buffer val)
        {
            if (val.size() != 16)
                throw format_error("the balance of {} must have 16 bytes but has {}", account_id, val.size());
            borsh::decoder dec { val };
            return dec.u128();
        }

        uint64_t decode_counter(const buffer val)
        {
            if (val.size() != 8)
                throw format_error("the accounts counter must have 8 bytes but has {}", val.size());
            borsh::decoder dec { val };
            return dec.u64();
        }

        const json::object &result_object(const json::value &doc)
        {
            if (!doc.is_object())
                throw format_error("the snapshot export must be a JSON object");
            const auto &obj = doc.get_object();
            if (const auto *res = obj.if_contains("result"); res) {
                if (!res->is_object())
                    throw format_error("the result element of the snapshot export must be an object");
                return res->get_object();
            }
            return obj;
        }
    }

    uint8_vector make_key(const uint8_t field, const std::string_view suffix)
    {
        uint8_vector key {};
        key.reserve(3 + suffix.size());
        key.emplace_back(version_prefix);
        key.emplace_back(eth_connector_prefix);
        key.emplace_back(field);
        key.insert(key.end(), suffix.begin(), suffix.end());
        return key;
    }

    key_info classify(const buffer key)
    {
        if (key.size() < 3 || key[0] != version_prefix || key[1] != eth_connector_prefix)
            return {};
        const std::string suffix { static_cast<std::string_view>(key.subbuf(3)) };
        switch (key[2]) {
            case fungible_token_field:
                if (suffix.empty())
                    return { key_kind::contract_totals };
                return { key_kind::account_balance, suffix };
            case used_event_field:
                if (suffix.empty())
                    return {};
                return { key_kind::used_proof, suffix };
            case accounts_counter_field:
                if (!suffix.empty())
                    return {};
                return { key_kind::account_counter };
            default:
                return {};
        }
    }

    decode_result decode(const json::value &doc)
    {
        const auto &res_obj = result_object(doc);
        const auto *height = res_obj.if_contains("block_height");
        if (!height)
            throw format_error("the snapshot export has no block_height");
        const auto *values = res_obj.if_contains("values");
        if (!values || !values->is_array())
            throw format_error("the snapshot export has no values array");
        decode_result res {};
        try {
            res.block_height = json::as_uint(*height);
        } catch (const std::exception &ex) {
            throw format_error("invalid block_height: {}", ex.what());
        }
        const auto &items = values->get_array();
        res.num_values = items.size();
        auto &st = res.state;
        size_t num_ignored = 0;
        for (size_t i = 0; i < items.size(); ++i) {
            if (!items[i].is_object())
                throw format_error("value #{} is not an object", i);
            const auto &item = items[i].get_object();
            const auto *key_v = item.if_contains("key");
            const auto *val_v = item.if_contains("value");
            if (!key_v || !val_v)
                throw format_error("value #{} must have both a key and a value", i);
            const auto key = decode_text(*key_v, "key", i);
            auto info = classify(key);
            switch (info.kind) {
                case key_kind::account_balance: {
                    if (!near::valid_account_id(info.suffix))
                        throw format_error("value #{}: invalid account id: '{}'", i, info.suffix);
                    const auto balance = decode_balance(info.suffix, decode_text(*val_v, "value", i));
                    st.accounts.insert_or_assign(std::move(info.suffix), balance);
                    break;
                }
                case key_kind::contract_totals:
                    st.totals = decode_totals(decode_text(*val_v, "value", i));
                    break;
                case key_kind::used_proof:
                    if (utf8::find_invalid(info.suffix.begin(), info.suffix.end()) != info.suffix.end())
                        throw format_error("value #{}: the proof id is not a valid utf8 string: {}", i, buffer { info.suffix });
                    st.proofs.emplace_back(std::move(info.suffix));
                    break;
                case key_kind::account_counter:
                    st.accounts_counter = decode_counter(decode_text(*val_v, "value", i));
                    break;
                case key_kind::unrecognized:
                    ++num_ignored;
                    break;
            }
        }
        if (num_ignored)
            logger::debug("snapshot at {}: ignored {} values with unrecognized keys", res.block_height, num_ignored);
        if (st.accounts.size() != st.accounts_counter)
            throw format_error("wrong accounts count: the snapshot has {} accounts but its counter is {}", st.accounts.size(), st.accounts_counter);
        return res;
    }

    decode_result decode_file(const std::string &path)
    {
        json::value doc {};
        try {
            doc = json::load(path);
        } catch (const std::exception &ex) {
            throw format_error("failed to parse the snapshot export {}: {}", path, ex.what());
        }
        return decode(doc);
    }

    std::string default_output_path(const uint64_t block_height)
    {
        return fmt::format("contract_state{}.bin", block_height);
    }

    std::string convert(const std::string &export_path, const std::optional<std::string> &output_path)
    {
        timer t { fmt::format("decode snapshot {}", export_path), logger::level::info };
        const auto export_size = std::filesystem::file_size(export_path);
        const auto res = decode_file(export_path);
        const auto out_path = output_path ? *output_path : default_output_path(res.block_height);
        logger::info("block height: {}", res.block_height);
        logger::info("export size: {:0.3f} GB", static_cast<double>(export_size) / 1'000'000'000);
        logger::info("values: {}", res.num_values);
        logger::info("proofs: {}", res.state.proofs.size());
        logger::info("accounts: {}", res.state.accounts.size());
        res.state.save(out_path);
        logger::info("result file: {}", out_path);
        return out_path;
    }
}
