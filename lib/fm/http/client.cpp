/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <fm/http/client.hpp>
#include <fm/logger.hpp>

namespace ft_migrator::http {
    namespace beast = boost::beast;
    namespace bhttp = beast::http;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    struct client::impl {
        impl(const std::string &url, const std::chrono::seconds timeout)
            : _url { url }, _timeout { timeout }
        {
            boost::url_view uri { _url };
            if (uri.scheme() == "https")
                _tls = true;
            else if (uri.scheme() != "http")
                throw ft_migrator::error("only http and https urls are supported but got {}", _url);
            _host = uri.host();
            const auto port = uri.port();
            _port.assign(port.data(), port.size());
            if (_port.empty())
                _port = _tls ? "443" : "80";
            const auto path = uri.encoded_path();
            _target.assign(path.data(), path.size());
            if (_target.empty())
                _target = "/";
            if (uri.has_query()) {
                const auto query = uri.encoded_query();
                _target += '?';
                _target.append(query.data(), query.size());
            }
        }

        std::string post(const std::string &content_type, const std::string &body)
        {
            bhttp::request<bhttp::string_body> req { bhttp::verb::post, _target, 11 };
            req.set(bhttp::field::host, _host);
            req.set(bhttp::field::user_agent, BOOST_BEAST_VERSION_STRING);
            req.set(bhttp::field::content_type, content_type);
            req.keep_alive(false);
            req.body() = body;
            req.prepare_payload();

            net::io_context ioc {};
            tcp::resolver resolver { ioc };
            tcp::resolver::results_type endpoints {};
            _run_step(ioc, "resolve", [&](auto handler) {
                resolver.async_resolve(_host, _port, [&, handler](const beast::error_code ec, tcp::resolver::results_type results) {
                    endpoints = std::move(results);
                    handler(ec);
                });
            });

            beast::flat_buffer buf {};
            bhttp::response<bhttp::string_body> res {};
            if (_tls) {
                ssl::context ctx { ssl::context::tls_client };
                ctx.set_default_verify_paths();
                ctx.set_verify_mode(ssl::verify_peer);
                beast::ssl_stream<beast::tcp_stream> stream { ioc, ctx };
                if (!SSL_set_tlsext_host_name(stream.native_handle(), _host.c_str()))
                    throw error(false, {}, "{}: failed to set the TLS SNI host name", _url);
                stream.set_verify_callback(ssl::host_name_verification(_host));
                _exchange(ioc, beast::get_lowest_layer(stream), stream, req, buf, res, [&](auto handler) {
                    stream.async_handshake(ssl::stream_base::client, [handler](const beast::error_code ec) { handler(ec); });
                }, endpoints);
                beast::error_code ec {};
                beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
            } else {
                beast::tcp_stream stream { ioc };
                _exchange(ioc, stream, stream, req, buf, res, [](auto handler) { handler(beast::error_code {}); }, endpoints);
                beast::error_code ec {};
                stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            }
            if (res.result() != bhttp::status::ok)
                throw error(false, res.result_int(), "{}: bad http status: {}", _url, res.result_int());
            return std::move(res.body());
        }

        const std::string &url() const
        {
            return _url;
        }
    private:
        const std::string _url;
        const std::chrono::seconds _timeout;
        bool _tls = false;
        std::string _host {};
        std::string _port {};
        std::string _target {};

        // Runs a single asynchronous step to completion so that the stream's expiry timer applies
        template<typename Start>
        void _run_step(net::io_context &ioc, const std::string_view step, const Start &start)
        {
            std::optional<beast::error_code> res_ec {};
            start([&res_ec](const beast::error_code ec) { res_ec = ec; });
            ioc.restart();
            ioc.run();
            if (!res_ec)
                throw error(false, {}, "{}: {} did not complete", _url, step);
            if (*res_ec == beast::error::timeout)
                throw error(true, {}, "{}: {} timed out after {} secs", _url, step, _timeout.count());
            if (*res_ec)
                throw error(false, {}, "{}: {} failed: {}", _url, step, res_ec->message());
        }

        template<typename Lowest, typename Stream, typename Handshake>
        void _exchange(net::io_context &ioc, Lowest &lowest, Stream &stream, bhttp::request<bhttp::string_body> &req,
            beast::flat_buffer &buf, bhttp::response<bhttp::string_body> &res, const Handshake &handshake,
            const tcp::resolver::results_type &endpoints)
        {
            lowest.expires_after(_timeout);
            _run_step(ioc, "connect", [&](auto handler) {
                lowest.async_connect(endpoints, [handler](const beast::error_code ec, const auto &) { handler(ec); });
            });
            lowest.expires_after(_timeout);
            _run_step(ioc, "handshake", handshake);
            lowest.expires_after(_timeout);
            _run_step(ioc, "write", [&](auto handler) {
                bhttp::async_write(stream, req, [handler](const beast::error_code ec, size_t) { handler(ec); });
            });
            lowest.expires_after(_timeout);
            _run_step(ioc, "read", [&](auto handler) {
                bhttp::async_read(stream, buf, res, [handler](const beast::error_code ec, size_t) { handler(ec); });
            });
            logger::trace("{}: http status {} body size {}", _url, res.result_int(), res.body().size());
        }
    };

    client::client(const std::string &url, const std::chrono::seconds timeout)
        : _impl { std::make_unique<impl>(url, timeout) }
    {
    }

    client::~client() =default;

    std::string client::post(const std::string &content_type, const std::string &body)
    {
        return _impl->post(content_type, body);
    }

    const std::string &client::url() const
    {
        return _impl->url();
    }
}
