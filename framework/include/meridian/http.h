#ifndef MERIDIAN_HTTP_H
#define MERIDIAN_HTTP_H

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace meridian {

    struct CaseInsensitiveCompare {
        bool operator()(const std::string& a, const std::string& b) const {
            return std::lexicographical_compare(
                a.begin(), a.end(), b.begin(), b.end(),
                [](unsigned char c1, unsigned char c2) { return std::tolower(c1) < std::tolower(c2); }
            );
        }
    };

    struct ParsedUrl {
        std::string host;
        std::string port;
        std::string target;
        bool is_ssl = false;
    };

    ParsedUrl parse_url(const std::string& url);

    /**
     * @brief Cancels an asynchronous operation that outlives its deadline.
     *
     * The timer calls `target.cancel()` when it fires first. Destroying the
     * Deadline disarms it, so it must not outlive @p target.
     */
    class Deadline {
    public:
        template <typename Target>
        Deadline(const boost::asio::any_io_executor& executor,
                 std::chrono::steady_clock::duration timeout, Target& target)
            : timer_(executor, timeout), state_(std::make_shared<State>()) {
            timer_.async_wait([state = state_, &target](const boost::system::error_code& ec) {
                if (ec || state->disarmed) return;
                state->expired = true;
                target.cancel();
            });
        }

        ~Deadline() {
            state_->disarmed = true;
            timer_.cancel();
        }

        Deadline(const Deadline&) = delete;
        Deadline& operator=(const Deadline&) = delete;

        bool expired() const { return state_->expired; }

    private:
        struct State {
            bool expired = false;
            bool disarmed = false;
        };

        boost::asio::steady_timer timer_;
        std::shared_ptr<State> state_;
    };

    struct FetchTimeouts {
        std::chrono::seconds connect{5};   // name resolution, then TCP connect and TLS handshake
        std::chrono::seconds read{5};      // write the request and read the full response
    };

    struct FetchResponse {
        int status = 0;
        std::string body;   // raw bytes; event-stream bodies are binary
        std::multimap<std::string, std::string, CaseInsensitiveCompare> headers;

        std::string get_header(const std::string& key) const {
            auto it = headers.find(key);
            if (it != headers.end()) return it->second;
            return "";
        }

        bool ok() const { return status >= 200 && status < 300; }
    };

    /**
     * @brief Adds a PEM certificate to the trust store of every HTTPS fetch,
     * for endpoints served behind a private CA.
     * @throws boost::system::system_error when the PEM cannot be parsed.
     */
    void add_trusted_certificate(std::string_view pem);

    /**
     * @brief Performs one asynchronous HTTP/HTTPS request.
     *
     * HTTPS peers must present a chain that verifies against the trust store
     * and a certificate issued for the URL's host.
     *
     * Redirects are not followed. Network errors, TLS verification failures
     * and expired deadlines surface as boost::system::system_error.
     *
     * @param url The full URL
     * @param method HTTP method (GET, POST, etc.)
     * @param headers Headers sent verbatim; Host is always set from the URL
     * @param body Request body, sent as-is
     * @param timeouts Connect and read deadlines
     */
    boost::asio::awaitable<FetchResponse> fetch(
        std::string url,
        std::string method = "GET",
        std::map<std::string, std::string> headers = {},
        std::string body = {},
        FetchTimeouts timeouts = {}
    );

} // namespace meridian

#endif // MERIDIAN_HTTP_H
