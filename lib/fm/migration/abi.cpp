/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/borsh/decoder.hpp>
#include <fm/borsh/encoder.hpp>
#include <fm/migration/abi.hpp>

namespace ft_migrator::migration {
    namespace {
        std::vector<std::string> decode_strings(borsh::decoder &dec)
        {
            const auto sz = dec.u32();
            if (sz > dec.remaining() / 4)
                throw borsh::decode_error("a string list declares {} items but only {} bytes remain", sz, dec.remaining());
            std::vector<std::string> res {};
            res.reserve(sz);
            for (uint32_t i = 0; i < sz; ++i)
                res.emplace_back(dec.string());
            return res;
        }

        account_balance_list decode_balances(borsh::decoder &dec)
        {
            const auto sz = dec.u32();
            // an entry takes at least a 4-byte length and a 16-byte amount
            if (sz > dec.remaining() / 20)
                throw borsh::decode_error("a balance list declares {} items but only {} bytes remain", sz, dec.remaining());
            account_balance_list res {};
            res.reserve(sz);
            for (uint32_t i = 0; i < sz; ++i) {
                auto id = dec.string();
                const auto amount = dec.u128();
                res.emplace_back(std::move(id), amount);
            }
            return res;
        }

        void encode_strings(borsh::encoder &enc, const std::vector<std::string> &items)
        {
            enc.vec(items, [](auto &e, const auto &s) { e.string(s); });
        }

        void encode_balances(borsh::encoder &enc, const account_balance_list &items)
        {
            enc.vec(items, [](auto &e, const auto &item) { e.string(item.first).u128(item.second); });
        }
    }

    input_data input_data::decode(const buffer bytes)
    {
        borsh::decoder dec { bytes };
        input_data res {};
        res.accounts = decode_balances(dec);
        if (dec.option())
            res.total_supply = dec.u128();
        if (dec.option())
            res.account_storage_usage = dec.u64();
        if (dec.option())
            res.statistics_aurora_accounts_counter = dec.u64();
        res.used_proofs = decode_strings(dec);
        dec.ensure_end();
        return res;
    }

    uint8_vector input_data::encode() const
    {
        borsh::encoder enc {};
        encode_balances(enc, accounts);
        enc.option<u128>(total_supply, [](auto &e, const auto &v) { e.u128(v); })
            .option<uint64_t>(account_storage_usage, [](auto &e, const auto &v) { e.u64(v); })
            .option<uint64_t>(statistics_aurora_accounts_counter, [](auto &e, const auto &v) { e.u64(v); });
        encode_strings(enc, used_proofs);
        return std::move(enc.bytes());
    }

    check_result decode_check_result(const buffer bytes)
    {
        borsh::decoder dec { bytes };
        check_result res {};
        switch (const auto tag = dec.u8(); tag) {
            case 0: res = check::success {}; break;
            case 1: res = check::account_not_exist { decode_strings(dec) }; break;
            case 2: res = check::account_amount { decode_balances(dec) }; break;
            case 3: res = check::total_supply { dec.u128() }; break;
            case 4: res = check::storage_usage { dec.u64() }; break;
            case 5: res = check::statistics_counter { dec.u64() }; break;
            case 6: res = check::proof { decode_strings(dec) }; break;
            default: throw borsh::decode_error("unsupported migration check result tag: {}", tag);
        }
        dec.ensure_end();
        return res;
    }

    uint8_vector encode(const check_result &res)
    {
        borsh::encoder enc {};
        enc.u8(static_cast<uint8_t>(res.index()));
        std::visit([&](const auto &r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, check::account_not_exist>)
                encode_strings(enc, r.accounts);
            else if constexpr (std::is_same_v<T, check::account_amount>)
                encode_balances(enc, r.accounts);
            else if constexpr (std::is_same_v<T, check::total_supply>)
                enc.u128(r.value);
            else if constexpr (std::is_same_v<T, check::storage_usage> || std::is_same_v<T, check::statistics_counter>)
                enc.u64(r.value);
            else if constexpr (std::is_same_v<T, check::proof>)
                encode_strings(enc, r.proofs);
        }, res);
        return std::move(enc.bytes());
    }

    size_t mismatch_count(const check_result &res)
    {
        return std::visit([](const auto &r) -> size_t {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, check::success>)
                return 0;
            else if constexpr (std::is_same_v<T, check::account_not_exist> || std::is_same_v<T, check::account_amount>)
                return r.accounts.size();
            else if constexpr (std::is_same_v<T, check::proof>)
                return r.proofs.size();
            else
                return 1;
        }, res);
    }

    std::string describe(const check_result &res)
    {
        return std::visit([](const auto &r) -> std::string {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, check::success>) {
                return "Success";
            } else if constexpr (std::is_same_v<T, check::account_not_exist>) {
                return fmt::format("AccountNotExist({}): {}", r.accounts.size(), r.accounts);
            } else if constexpr (std::is_same_v<T, check::account_amount>) {
                std::string items {};
                for (const auto &[id, amount]: r.accounts)
                    items += fmt::format("{}{}: {}", items.empty() ? "" : ", ", id, amount);
                return fmt::format("AccountAmount({}): [{}]", r.accounts.size(), items);
            } else if constexpr (std::is_same_v<T, check::total_supply>) {
                return fmt::format("TotalSupply: {}", r.value);
            } else if constexpr (std::is_same_v<T, check::storage_usage>) {
                return fmt::format("StorageUsage: {}", r.value);
            } else if constexpr (std::is_same_v<T, check::statistics_counter>) {
                return fmt::format("StatisticsCounter: {}", r.value);
            } else {
                return fmt::format("Proof({}): {}", r.proofs.size(), r.proofs);
            }
        }, res);
    }
}
