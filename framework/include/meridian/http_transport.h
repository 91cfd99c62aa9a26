#ifndef MERIDIAN_HTTP_TRANSPORT_H
#define MERIDIAN_HTTP_TRANSPORT_H

#include <meridian/config.h>
#include <meridian/http.h>
#include <meridian/sigv4.h>
#include <meridian/transport.h>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace meridian {

/**
 * @brief Connection and authentication settings shared by every region client.
 */
struct BedrockHttpOptions {
    // "{region}" is replaced by the region name
    std::string endpoint_template = "https://bedrock-runtime.{region}.amazonaws.com";
    FetchTimeouts timeouts;

    // Bearer API key; takes precedence over SigV4 credentials when set
    std::string bearer_token;
    std::optional<AwsCredentials> credentials;
    std::string signing_service = "bedrock";

    /**
     * @brief Timeouts from @p config; AWS_BEARER_TOKEN_BEDROCK, AWS credentials
     *        and MERIDIAN_ENDPOINT_TEMPLATE from the environment.
     */
    static BedrockHttpOptions from_env(const FailoverConfig& config);

    std::string endpoint_for(const std::string& region) const;
};

/**
 * @brief Maps a non-2xx response to the matching InvocationError.
 *
 * HTTP 400 with error type ValidationException becomes ValidationError,
 * everything else TransportFailure carrying the status.
 */
[[noreturn]] void raise_for_status(const FetchResponse& response);

/**
 * @brief Turns a 2xx response into an InvokeResponse (event stream for the streaming APIs).
 */
InvokeResponse to_invoke_response(FetchResponse response, bool streaming);

/**
 * @brief Bedrock runtime REST client bound to one region.
 */
class BedrockHttpClient : public RegionClient {
public:
    BedrockHttpClient(std::string region, BedrockHttpOptions options);

    const std::string& region() const override { return region_; }

    Async<InvokeResponse> converse(const boost::json::object& params, bool streaming) override;
    Async<InvokeResponse> invoke_model(const boost::json::object& params, bool streaming) override;

private:
    Async<FetchResponse> post(const std::string& path,
                              std::map<std::string, std::string> headers,
                              std::string body);

    std::string region_;
    BedrockHttpOptions options_;
    std::string endpoint_;
};

class BedrockHttpClientFactory : public ClientFactory {
public:
    explicit BedrockHttpClientFactory(BedrockHttpOptions options) : options_(std::move(options)) {}

    std::shared_ptr<RegionClient> create(const std::string& region) override {
        return std::make_shared<BedrockHttpClient>(region, options_);
    }

private:
    BedrockHttpOptions options_;
};

} // namespace meridian

#endif // MERIDIAN_HTTP_TRANSPORT_H
