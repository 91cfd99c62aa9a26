#include <meridian/http.h>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <openssl/err.h>

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace meridian {

    namespace {
        // Streamed completions can be large; the parser default is 8 MB
        constexpr std::uint64_t kBodyLimit = 64ull * 1024 * 1024;

        ssl::context& get_client_ssl_ctx() {
            static ssl::context ctx = [] {
                ssl::context c{ssl::context::tls_client};
                c.set_default_verify_paths();
                c.set_verify_mode(ssl::verify_peer);
                return c;
            }();
            return ctx;
        }

        // getaddrinfo has no deadline of its own; the timer bounds it
        boost::asio::awaitable<tcp::resolver::results_type> resolve(
            tcp::resolver& resolver, const ParsedUrl& parsed, std::chrono::seconds timeout) {
            beast::error_code ec;
            tcp::resolver::results_type results;
            {
                Deadline deadline(resolver.get_executor(), timeout, resolver);
                results = co_await resolver.async_resolve(parsed.host, parsed.port,
                                                          net::redirect_error(net::use_awaitable, ec));
                if (deadline.expired()) {
                    throw boost::system::system_error(net::error::timed_out, "resolve " + parsed.host);
                }
            }
            if (ec) {
                throw boost::system::system_error(ec, "resolve " + parsed.host);
            }
            co_return results;
        }

        template <typename Stream>
        boost::asio::awaitable<bhttp::response<bhttp::string_body>> exchange(
            Stream& stream, bhttp::request<bhttp::string_body>& req) {
            co_await bhttp::async_write(stream, req, net::use_awaitable);

            beast::flat_buffer buffer;
            bhttp::response_parser<bhttp::string_body> parser;
            parser.body_limit(kBodyLimit);
            co_await bhttp::async_read(stream, buffer, parser, net::use_awaitable);
            co_return parser.release();
        }
    }

    void add_trusted_certificate(std::string_view pem) {
        get_client_ssl_ctx().add_certificate_authority(net::buffer(pem.data(), pem.size()));
    }

    ParsedUrl parse_url(const std::string& url) {
        ParsedUrl res;
        std::string s = url;

        if (s.rfind("https://", 0) == 0) {
            res.is_ssl = true;
            res.port = "443";
            s.erase(0, 8);
        } else if (s.rfind("http://", 0) == 0) {
            res.is_ssl = false;
            res.port = "80";
            s.erase(0, 7);
        } else {
            res.is_ssl = false;
            res.port = "80";
        }

        size_t path_pos = s.find('/');
        if (path_pos == std::string::npos) {
            res.host = s;
            res.target = "/";
        } else {
            res.host = s.substr(0, path_pos);
            res.target = s.substr(path_pos);
        }

        size_t port_pos = res.host.find(':');
        if (port_pos != std::string::npos) {
            res.port = res.host.substr(port_pos + 1);
            res.host = res.host.substr(0, port_pos);
        }

        return res;
    }

    boost::asio::awaitable<FetchResponse> fetch(
        std::string url,
        std::string method,
        std::map<std::string, std::string> headers,
        std::string body,
        FetchTimeouts timeouts
    ) {
        auto parsed = parse_url(url);
        auto executor = co_await net::this_coro::executor;
        tcp::resolver resolver(executor);

        bhttp::request<bhttp::string_body> req;
        req.method(bhttp::string_to_verb(method));
        req.target(parsed.target);
        req.version(11);
        req.set(bhttp::field::host, parsed.host);
        req.set(bhttp::field::user_agent, "Meridian/1.0");

        for (auto const& [k, v] : headers) {
            req.set(k, v);
        }

        if (!body.empty()) {
            req.body() = std::move(body);
        }
        req.prepare_payload();

        bhttp::response<bhttp::string_body> res_msg;

        if (parsed.is_ssl) {
            beast::ssl_stream<beast::tcp_stream> stream(executor, get_client_ssl_ctx());

            if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str()))
                throw boost::system::system_error(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());

            // OpenSSL rejects the handshake when the certificate was issued for another host
            if (!SSL_set1_host(stream.native_handle(), parsed.host.c_str()))
                throw boost::system::system_error(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());

            auto const results = co_await resolve(resolver, parsed, timeouts.connect);

            auto& lowest = beast::get_lowest_layer(stream);
            lowest.expires_after(timeouts.connect);
            co_await lowest.async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            lowest.expires_after(timeouts.read);
            res_msg = co_await exchange(stream, req);

            // One request per connection; no close_notify round trip
            beast::error_code ec;
            lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
        } else {
            beast::tcp_stream stream(executor);

            auto const results = co_await resolve(resolver, parsed, timeouts.connect);

            stream.expires_after(timeouts.connect);
            co_await stream.async_connect(results, net::use_awaitable);

            stream.expires_after(timeouts.read);
            res_msg = co_await exchange(stream, req);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        FetchResponse response;
        response.status = res_msg.result_int();
        response.body = std::move(res_msg.body());

        for (auto const& field : res_msg) {
            response.headers.insert({std::string(field.name_string()), std::string(field.value())});
        }

        co_return response;
    }

} // namespace meridian
