/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/base64.hpp>
#include <fm/http/client.hpp>
#include <fm/logger.hpp>
#include <fm/near/rpc-node.hpp>

namespace ft_migrator::near {
    using chain::rpc_error;
    using chain::rpc_error_kind;

    static std::string_view str_at(const json::object &obj, const std::string_view key)
    {
        const auto &s = obj.at(key).as_string();
        return { s.data(), s.size() };
    }

    static hash hash_at(const json::object &obj, const std::string_view key)
    {
        return hash_from_base58(str_at(obj, key));
    }

    static rpc_error_kind error_kind(const json::object &err)
    {
        const auto *cause = err.if_contains("cause");
        if (cause && cause->is_object()) {
            if (const auto *name = cause->as_object().if_contains("name"); name && name->is_string()) {
                const std::string_view cause_name { name->as_string().data(), name->as_string().size() };
                if (cause_name == "UNKNOWN_BLOCK")
                    return rpc_error_kind::unknown_block;
                if (cause_name == "UNKNOWN_CHUNK")
                    return rpc_error_kind::unknown_chunk;
                if (cause_name == "UNKNOWN_TRANSACTION")
                    return rpc_error_kind::unknown_transaction;
                if (cause_name == "TIMEOUT_ERROR")
                    return rpc_error_kind::timeout;
            }
        }
        if (const auto *name = err.if_contains("name"); name && name->is_string() && name->as_string() == "INTERNAL_ERROR")
            return rpc_error_kind::transport;
        return rpc_error_kind::handler;
    }

    json::value rpc_node::unwrap_response(const json::value &response)
    {
        if (!response.is_object())
            throw rpc_error(rpc_error_kind::transport, "a JSON-RPC response must be an object but got: {}", json::serialize(response));
        const auto &obj = response.as_object();
        if (const auto *err = obj.if_contains("error"); err && !err->is_null()) {
            if (!err->is_object())
                throw rpc_error(rpc_error_kind::handler, "JSON-RPC error: {}", json::serialize(*err));
            const auto kind = error_kind(err->as_object());
            throw rpc_error(kind, "JSON-RPC error ({}): {}", kind, json::serialize(*err));
        }
        const auto *res = obj.if_contains("result");
        if (!res)
            throw rpc_error(rpc_error_kind::transport, "a JSON-RPC response has neither result nor error: {}", json::serialize(response));
        // view queries report failures inside the result object
        if (res->is_object()) {
            if (const auto *qerr = res->as_object().if_contains("error"); qerr && qerr->is_string())
                throw rpc_error(rpc_error_kind::handler, "query error: {}", std::string_view { qerr->as_string().data(), qerr->as_string().size() });
        }
        return *res;
    }

    chain::block_info rpc_node::parse_block(const json::value &result)
    {
        const auto &obj = result.as_object();
        const auto &header = obj.at("header").as_object();
        chain::block_info blk {};
        blk.height = json::as_uint(header.at("height"));
        blk.hash = hash_at(header, "hash");
        blk.prev_hash = hash_at(header, "prev_hash");
        for (const auto &chunk: obj.at("chunks").as_array())
            blk.chunks.emplace_back(hash_at(chunk.as_object(), "chunk_hash"));
        return blk;
    }

    static void parse_actions(std::vector<chain::function_call> &calls, const json::array &actions)
    {
        for (const auto &act: actions) {
            // actions without arguments are serialized as plain strings, e.g. "CreateAccount"
            if (!act.is_object())
                continue;
            const auto *fc = act.as_object().if_contains("FunctionCall");
            if (!fc)
                continue;
            const auto &fc_obj = fc->as_object();
            calls.emplace_back(chain::function_call { std::string { str_at(fc_obj, "method_name") }, base64::decode(str_at(fc_obj, "args")) });
        }
    }

    chain::chunk_info rpc_node::parse_chunk(const json::value &result)
    {
        const auto &obj = result.as_object();
        chain::chunk_info chunk {};
        chunk.hash = hash_at(obj.at("header").as_object(), "chunk_hash");
        for (const auto &tx_val: obj.at("transactions").as_array()) {
            const auto &tx_obj = tx_val.as_object();
            auto &tx = chunk.transactions.emplace_back();
            tx.hash = hash_at(tx_obj, "hash");
            tx.signer_id = str_at(tx_obj, "signer_id");
            tx.receiver_id = str_at(tx_obj, "receiver_id");
            parse_actions(tx.actions, tx_obj.at("actions").as_array());
        }
        for (const auto &r_val: obj.at("receipts").as_array()) {
            const auto &r_obj = r_val.as_object();
            const auto &receipt = r_obj.at("receipt").as_object();
            // data receipts carry no actions
            const auto *action = receipt.if_contains("Action");
            if (!action)
                continue;
            const auto &action_obj = action->as_object();
            auto &r = chunk.receipts.emplace_back();
            r.receipt_id = hash_at(r_obj, "receipt_id");
            r.predecessor_id = str_at(r_obj, "predecessor_id");
            r.receiver_id = str_at(r_obj, "receiver_id");
            r.signer_id = str_at(action_obj, "signer_id");
            parse_actions(r.actions, action_obj.at("actions").as_array());
        }
        return chunk;
    }

    static void collect_logs(std::vector<std::string> &logs, const json::object &outcome_with_id)
    {
        if (const auto *outcome = outcome_with_id.if_contains("outcome"); outcome && outcome->is_object()) {
            if (const auto *l = outcome->as_object().if_contains("logs"); l && l->is_array()) {
                for (const auto &log: l->as_array())
                    logs.emplace_back(log.as_string().data(), log.as_string().size());
            }
        }
    }

    chain::tx_outcome rpc_node::parse_outcome(const json::value &result)
    {
        const auto &obj = result.as_object();
        chain::tx_outcome res {};
        if (const auto *tx = obj.if_contains("transaction"); tx && tx->is_object())
            res.tx_hash = hash_at(tx->as_object(), "hash");
        const auto &status = obj.at("status");
        if (status.is_object()) {
            const auto &status_obj = status.as_object();
            if (const auto *val = status_obj.if_contains("SuccessValue")) {
                res.success = true;
                res.value = base64::decode(std::string_view { val->as_string().data(), val->as_string().size() });
            } else if (const auto *fail = status_obj.if_contains("Failure")) {
                res.failure = json::serialize(*fail);
            } else {
                res.failure = json::serialize(status);
            }
        } else {
            // NotStarted or Started: the transaction has not reached a final state
            res.failure = json::serialize(status);
        }
        if (const auto *tx_out = obj.if_contains("transaction_outcome"); tx_out && tx_out->is_object())
            collect_logs(res.logs, tx_out->as_object());
        if (const auto *r_outs = obj.if_contains("receipts_outcome"); r_outs && r_outs->is_array()) {
            for (const auto &r_out: r_outs->as_array())
                collect_logs(res.logs, r_out.as_object());
        }
        return res;
    }

    chain::access_key_info rpc_node::parse_access_key(const json::value &result)
    {
        const auto &obj = result.as_object();
        return { json::as_uint(obj.at("nonce")), hash_at(obj, "block_hash") };
    }

    uint8_vector rpc_node::parse_call_result(const json::value &result)
    {
        const auto &obj = result.as_object();
        const auto *bytes = obj.if_contains("result");
        if (!bytes || !bytes->is_array())
            throw rpc_error(rpc_error_kind::handler, "not a call_function result: {}", json::serialize(result));
        uint8_vector res {};
        res.reserve(bytes->as_array().size());
        for (const auto &b: bytes->as_array()) {
            const auto v = json::as_uint(b);
            if (v > 0xFF)
                throw rpc_error(rpc_error_kind::handler, "call_function result byte out of range: {}", v);
            res.emplace_back(static_cast<uint8_t>(v));
        }
        return res;
    }

    struct rpc_node::impl {
        impl(const std::string &url, const std::chrono::seconds timeout)
            : _http { url, timeout }
        {
        }

        json::value request(const std::string_view method, json::value params)
        {
            const json::object req {
                { "jsonrpc", "2.0" },
                { "id", fmt::format("fm-{}", ++_next_id) },
                { "method", method },
                { "params", std::move(params) }
            };
            logger::trace("rpc {} request: {}", _http.url(), json::serialize(req));
            std::string body {};
            try {
                body = _http.post("application/json", json::serialize(req));
            } catch (const http::error &ex) {
                throw rpc_error(ex.timeout() ? rpc_error_kind::timeout : rpc_error_kind::transport, "{} {}: {}", _http.url(), method, ex.what());
            }
            json::value resp {};
            try {
                resp = json::parse(buffer { body });
            } catch (const std::exception &ex) {
                throw rpc_error(rpc_error_kind::transport, "{} {}: invalid JSON response: {}", _http.url(), method, ex.what());
            }
            return unwrap_response(resp);
        }
    private:
        http::client _http;
        uint64_t _next_id = 0;
    };

    rpc_node::rpc_node(const std::string &url, const std::chrono::seconds timeout)
        : _impl { std::make_unique<impl>(url, timeout) }
    {
    }

    rpc_node::~rpc_node() =default;

    chain::block_info rpc_node::_block_impl(const chain::height_t height)
    {
        return parse_block(_impl->request("block", json::object { { "block_id", height } }));
    }

    chain::block_info rpc_node::_final_block_impl()
    {
        return parse_block(_impl->request("block", json::object { { "finality", "final" } }));
    }

    chain::chunk_info rpc_node::_chunk_impl(const chain::hash_t &chunk_id)
    {
        return parse_chunk(_impl->request("chunk", json::object { { "chunk_id", hash_to_base58(chunk_id) } }));
    }

    chain::tx_outcome rpc_node::_tx_status_impl(const chain::hash_t &tx_hash, const std::string_view signer_id)
    {
        return parse_outcome(_impl->request("tx", json::array { hash_to_base58(tx_hash), signer_id }));
    }

    chain::access_key_info rpc_node::_access_key_impl(const std::string_view account_id, const public_key &pk)
    {
        return parse_access_key(_impl->request("query", json::object {
            { "request_type", "view_access_key" },
            { "finality", "final" },
            { "account_id", account_id },
            { "public_key", pk.to_string() }
        }));
    }

    chain::tx_outcome rpc_node::_broadcast_tx_commit_impl(const buffer signed_tx)
    {
        return parse_outcome(_impl->request("broadcast_tx_commit", json::array { base64::encode(signed_tx) }));
    }

    uint8_vector rpc_node::_call_function_impl(const std::string_view contract, const std::string_view method, const buffer args)
    {
        return parse_call_result(_impl->request("query", json::object {
            { "request_type", "call_function" },
            { "finality", "final" },
            { "account_id", contract },
            { "method_name", method },
            { "args_base64", base64::encode(args) }
        }));
    }
}
