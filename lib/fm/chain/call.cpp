/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/borsh/decoder.hpp>
#include <fm/chain/call.hpp>
#include <fm/json.hpp>
#include <fm/logger.hpp>
#include <fm/near/types.hpp>
#include <fm/sha2.hpp>

namespace ft_migrator::chain::call {
    namespace {
        std::string json_str(const json::object &obj, const std::string_view key)
        {
            const auto &s = obj.at(key).as_string();
            return { s.data(), s.size() };
        }

        std::optional<std::string> json_opt_str(const json::object &obj, const std::string_view key)
        {
            if (const auto *v = obj.if_contains(key); v && !v->is_null())
                return std::string { v->as_string().data(), v->as_string().size() };
            return {};
        }

        // amounts are JSON strings but older clients sent plain numbers
        u128 json_amount(const json::object &obj, const std::string_view key)
        {
            const auto &v = obj.at(key);
            if (v.is_string())
                return u128::from_string(std::string_view { v.get_string().data(), v.get_string().size() });
            return u128 { json::as_uint(v), 0 };
        }

        std::string account_id(const std::string_view id)
        {
            near::validate_account_id(id);
            return std::string { id };
        }

        json::object json_args(const buffer args)
        {
            auto jv = json::parse(args);
            if (!jv.is_object())
                throw error("function call arguments must be a JSON object but got: {}", json::serialize(jv));
            return std::move(jv.as_object());
        }

        ft_transfer decode_ft_transfer(const buffer args)
        {
            const auto obj = json_args(args);
            return { account_id(json_str(obj, "receiver_id")), json_amount(obj, "amount"), json_opt_str(obj, "memo") };
        }

        ft_transfer_call decode_ft_transfer_call(const buffer args)
        {
            const auto obj = json_args(args);
            return { account_id(json_str(obj, "receiver_id")), json_amount(obj, "amount"), json_opt_str(obj, "memo"), json_str(obj, "msg") };
        }

        withdraw decode_withdraw(const buffer args)
        {
            borsh::decoder dec { args };
            withdraw res {};
            res.recipient_address = byte_array<20> { dec.fixed(20) };
            res.amount = dec.u128();
            dec.ensure_end();
            return res;
        }

        finish_deposit decode_finish_deposit(const buffer args)
        {
            borsh::decoder dec { args };
            finish_deposit res {};
            res.new_owner_id = account_id(dec.string());
            res.amount = dec.u128();
            res.proof_key = dec.string();
            res.relayer_id = account_id(dec.string());
            res.fee = dec.u128();
            if (dec.option())
                res.msg = dec.bytes();
            dec.ensure_end();
            return res;
        }

        deposit decode_deposit(const buffer args)
        {
            borsh::decoder dec { args };
            deposit res {};
            res.log_index = dec.u64();
            res.log_entry_data = dec.bytes();
            res.receipt_index = dec.u64();
            res.receipt_data = dec.bytes();
            res.header_data = dec.bytes();
            const auto num_nodes = dec.u32();
            // each proof node takes at least its 4-byte length prefix
            if (num_nodes > dec.remaining() / 4)
                throw borsh::decode_error("deposit proof declares {} nodes but only {} bytes remain", num_nodes, dec.remaining());
            res.proof.reserve(num_nodes);
            for (uint32_t i = 0; i < num_nodes; ++i)
                res.proof.emplace_back(dec.bytes());
            dec.ensure_end();
            return res;
        }
    }

    std::string deposit::proof_key() const
    {
        uint8_vector data {};
        data.reserve(16 + header_data.size());
        for (const auto v: { log_index, receipt_index }) {
            for (size_t i = 0; i < 8; ++i)
                data.emplace_back(static_cast<uint8_t>(v >> (i * 8)));
        }
        data.insert(data.end(), header_data.begin(), header_data.end());
        const auto h = sha2::digest(data);
        std::string res {};
        res.reserve(h.size() * 3);
        for (const auto b: h)
            res += std::to_string(static_cast<unsigned>(b));
        return res;
    }

    bool recognized(const std::string_view method)
    {
        return method == ft_transfer::method || method == ft_transfer_call::method || method == withdraw::method
            || method == finish_deposit::method || method == deposit::method;
    }

    value decode(const std::string_view method, const buffer args)
    {
        if (method == ft_transfer::method)
            return decode_ft_transfer(args);
        if (method == ft_transfer_call::method)
            return decode_ft_transfer_call(args);
        if (method == withdraw::method)
            return decode_withdraw(args);
        if (method == finish_deposit::method)
            return decode_finish_deposit(args);
        if (method == deposit::method)
            return decode_deposit(args);
        return ignored { std::string { method } };
    }

    effect effect_of(const value &v)
    {
        return std::visit([](const auto &c) -> effect {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, ft_transfer> || std::is_same_v<T, ft_transfer_call>) {
                return { { c.receiver_id }, {} };
            } else if constexpr (std::is_same_v<T, finish_deposit>) {
                return { { c.new_owner_id, c.relayer_id }, c.proof_key };
            } else if constexpr (std::is_same_v<T, deposit>) {
                return { {}, c.proof_key() };
            } else {
                return {};
            }
        }, v);
    }

    effect parse(const std::string_view method, const buffer args)
    {
        if (!recognized(method))
            return {};
        try {
            return effect_of(decode(method, args));
        } catch (const std::exception &ex) {
            logger::warn("failed to decode the arguments of {}: {}: {}", method, ex.what(), args);
            return {};
        }
    }
}
