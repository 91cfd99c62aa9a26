#ifndef MERIDIAN_SIGV4_H
#define MERIDIAN_SIGV4_H

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace meridian {

struct AwsCredentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    /**
     * @brief AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY / AWS_SESSION_TOKEN.
     * @return std::nullopt unless both keys are set.
     */
    static std::optional<AwsCredentials> from_env();
};

/**
 * @brief The parts of an HTTP request covered by a Signature Version 4 signature.
 */
struct SignableRequest {
    std::string method = "POST";
    std::string host;
    std::string path = "/";       // as sent on the wire, already percent-encoded
    std::string query;            // canonical query string, may be empty
    std::map<std::string, std::string> headers;   // extra headers to sign (content-type, accept, ...)
    std::string body;
};

/**
 * @brief RFC 3986 percent-encoding of everything outside the unreserved set.
 * @param encode_slash false keeps '/' so whole paths can be encoded.
 */
std::string uri_encode(std::string_view input, bool encode_slash = true);

/**
 * @brief "YYYYMMDDTHHMMSSZ" in UTC.
 */
std::string amz_date(std::chrono::system_clock::time_point when);

/**
 * @brief HMAC chain "AWS4"+secret -> date -> region -> service -> "aws4_request" (raw bytes).
 */
std::string derive_signing_key(std::string_view secret, std::string_view date,
                               std::string_view region, std::string_view service);

std::string canonical_request(const SignableRequest& request, const std::string& timestamp,
                              const std::string& session_token, bool double_encode_path);

/**
 * @brief Signs @p request for @p region and @p service at @p timestamp.
 * @return Headers to add: X-Amz-Date, Authorization and X-Amz-Security-Token when a session token is set.
 */
std::map<std::string, std::string> sign_v4(const SignableRequest& request,
                                           const AwsCredentials& credentials,
                                           std::string_view region,
                                           std::string_view service,
                                           const std::string& timestamp);

} // namespace meridian

#endif // MERIDIAN_SIGV4_H
