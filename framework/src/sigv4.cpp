#include <meridian/sigv4.h>
#include <meridian/crypto.h>
#include <meridian/environment.h>
#include <cctype>
#include <ctime>
#include <vector>

namespace meridian {

namespace {

    constexpr std::string_view kAlgorithm = "AWS4-HMAC-SHA256";

    std::string lower(std::string_view s) {
        std::string out(s);
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    // Trims and collapses runs of spaces, as the canonical form requires
    std::string canonical_value(std::string_view v) {
        std::string out;
        bool in_space = false;
        for (char c : v) {
            if (c == ' ' || c == '\t') {
                in_space = true;
                continue;
            }
            if (in_space && !out.empty()) out.push_back(' ');
            in_space = false;
            out.push_back(c);
        }
        return out;
    }

    std::map<std::string, std::string> headers_to_sign(const SignableRequest& request,
                                                       const std::string& timestamp,
                                                       const std::string& session_token) {
        std::map<std::string, std::string> out;
        for (const auto& [k, v] : request.headers) {
            out[lower(k)] = canonical_value(v);
        }
        out["host"] = request.host;
        out["x-amz-date"] = timestamp;
        if (!session_token.empty()) {
            out["x-amz-security-token"] = session_token;
        }
        return out;
    }

    std::string signed_header_list(const std::map<std::string, std::string>& headers) {
        std::string out;
        for (const auto& [k, v] : headers) {
            if (!out.empty()) out += ';';
            out += k;
        }
        return out;
    }

} // namespace

std::optional<AwsCredentials> AwsCredentials::from_env() {
    AwsCredentials creds;
    creds.access_key_id = env<std::string>("AWS_ACCESS_KEY_ID", std::string{});
    creds.secret_access_key = env<std::string>("AWS_SECRET_ACCESS_KEY", std::string{});
    creds.session_token = env<std::string>("AWS_SESSION_TOKEN", std::string{});

    if (creds.access_key_id.empty() || creds.secret_access_key.empty()) {
        return std::nullopt;
    }
    return creds;
}

std::string uri_encode(std::string_view input, bool encode_slash) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size() * 3);

    for (unsigned char c : input) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string amz_date(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

std::string derive_signing_key(std::string_view secret, std::string_view date,
                               std::string_view region, std::string_view service) {
    std::string k_secret = "AWS4" + std::string(secret);
    std::string k_date = crypto::hmac_sha256(k_secret, date);
    std::string k_region = crypto::hmac_sha256(k_date, region);
    std::string k_service = crypto::hmac_sha256(k_region, service);
    return crypto::hmac_sha256(k_service, "aws4_request");
}

std::string canonical_request(const SignableRequest& request, const std::string& timestamp,
                              const std::string& session_token, bool double_encode_path) {
    std::string path = request.path.empty() ? "/" : request.path;
    if (double_encode_path) {
        path = uri_encode(path, false);
    }

    auto headers = headers_to_sign(request, timestamp, session_token);

    std::string out;
    out += request.method + "\n";
    out += path + "\n";
    out += request.query + "\n";
    for (const auto& [k, v] : headers) {
        out += k + ":" + v + "\n";
    }
    out += "\n";
    out += signed_header_list(headers) + "\n";
    out += crypto::sha256_hex(request.body);
    return out;
}

std::map<std::string, std::string> sign_v4(const SignableRequest& request,
                                           const AwsCredentials& credentials,
                                           std::string_view region,
                                           std::string_view service,
                                           const std::string& timestamp) {
    const std::string date = timestamp.substr(0, 8);
    const std::string scope = date + "/" + std::string(region) + "/" + std::string(service) + "/aws4_request";

    // S3 is the only service that signs the path as sent
    const bool double_encode = service != "s3";
    const std::string creq = canonical_request(request, timestamp, credentials.session_token, double_encode);

    std::string string_to_sign;
    string_to_sign += std::string(kAlgorithm) + "\n";
    string_to_sign += timestamp + "\n";
    string_to_sign += scope + "\n";
    string_to_sign += crypto::sha256_hex(creq);

    const std::string key = derive_signing_key(credentials.secret_access_key, date, region, service);
    const std::string signature = crypto::hex_encode(crypto::hmac_sha256(key, string_to_sign));

    std::map<std::string, std::string> out;
    out["X-Amz-Date"] = timestamp;
    out["Authorization"] = std::string(kAlgorithm) +
                           " Credential=" + credentials.access_key_id + "/" + scope +
                           ", SignedHeaders=" + signed_header_list(headers_to_sign(request, timestamp, credentials.session_token)) +
                           ", Signature=" + signature;
    if (!credentials.session_token.empty()) {
        out["X-Amz-Security-Token"] = credentials.session_token;
    }
    return out;
}

} // namespace meridian
