#include <meridian/http_transport.h>
#include <meridian/environment.h>
#include <meridian/exceptions.h>
#include <meridian/logger.h>
#include <boost/system/system_error.hpp>

namespace meridian {

namespace {

    std::string string_field(const boost::json::object& obj, std::string_view key) {
        if (const auto* v = obj.if_contains(key); v && v->is_string()) {
            return std::string(v->as_string());
        }
        return {};
    }

    // "ValidationException:http://internal.amazon.com/..." or "com.amazon#ValidationException"
    std::string normalize_error_type(std::string type) {
        if (auto colon = type.find(':'); colon != std::string::npos) type.erase(colon);
        if (auto hash = type.rfind('#'); hash != std::string::npos) type.erase(0, hash + 1);
        return type;
    }

    std::string model_path(const boost::json::object& params, std::string_view action) {
        std::string model_id = string_field(params, "modelId");
        if (model_id.empty()) {
            throw ValidationError("Missing modelId");
        }
        return "/model/" + uri_encode(model_id) + "/" + std::string(action);
    }

} // namespace

BedrockHttpOptions BedrockHttpOptions::from_env(const FailoverConfig& config) {
    BedrockHttpOptions opts;
    opts.timeouts.connect = config.connect_timeout;
    opts.timeouts.read = config.read_timeout;
    opts.endpoint_template = env<std::string>("MERIDIAN_ENDPOINT_TEMPLATE", opts.endpoint_template);
    opts.bearer_token = env<std::string>("AWS_BEARER_TOKEN_BEDROCK", std::string{});
    opts.credentials = AwsCredentials::from_env();
    return opts;
}

std::string BedrockHttpOptions::endpoint_for(const std::string& region) const {
    std::string url = endpoint_template;
    const std::string placeholder = "{region}";
    for (size_t pos = url.find(placeholder); pos != std::string::npos; pos = url.find(placeholder, pos)) {
        url.replace(pos, placeholder.size(), region);
        pos += region.size();
    }
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

void raise_for_status(const FetchResponse& response) {
    std::string type = normalize_error_type(response.get_header("x-amzn-ErrorType"));
    std::string message;

    boost::json::error_code ec;
    boost::json::value body = boost::json::parse(response.body, ec);
    if (!ec && body.is_object()) {
        const auto& obj = body.as_object();
        if (type.empty()) type = normalize_error_type(string_field(obj, "__type"));
        message = string_field(obj, "message");
        if (message.empty()) message = string_field(obj, "Message");
    }
    if (message.empty()) message = response.body;

    std::string text = "HTTP " + std::to_string(response.status);
    if (!type.empty()) text += " " + type;
    if (!message.empty()) text += ": " + message;

    if (response.status == 400 && type == "ValidationException") {
        throw ValidationError(text, response.status);
    }
    throw TransportFailure(text, response.status);
}

InvokeResponse to_invoke_response(FetchResponse response, bool streaming) {
    if (!response.ok()) {
        raise_for_status(response);
    }

    InvokeResponse out;
    out.status = response.status;

    if (streaming) {
        out.stream = std::make_shared<DecodedEventStream>(std::move(response.body));
        return out;
    }

    boost::json::error_code ec;
    out.body = boost::json::parse(response.body, ec);
    if (ec) {
        // Non-JSON model output is handed back as a string
        out.body = boost::json::string(response.body);
    }
    return out;
}

BedrockHttpClient::BedrockHttpClient(std::string region, BedrockHttpOptions options)
    : region_(std::move(region)), options_(std::move(options)), endpoint_(options_.endpoint_for(region_)) {}

Async<FetchResponse> BedrockHttpClient::post(const std::string& path,
                                             std::map<std::string, std::string> headers,
                                             std::string body) {
    if (!options_.bearer_token.empty()) {
        headers["Authorization"] = "Bearer " + options_.bearer_token;
    } else if (options_.credentials) {
        SignableRequest signable;
        signable.method = "POST";
        signable.host = parse_url(endpoint_).host;
        signable.path = path;
        signable.headers = headers;
        signable.body = body;

        auto auth = sign_v4(signable, *options_.credentials, region_, options_.signing_service,
                            amz_date(std::chrono::system_clock::now()));
        headers.insert(auth.begin(), auth.end());
    } else {
        throw TransportFailure("No credentials: set AWS_BEARER_TOKEN_BEDROCK or AWS access keys");
    }

    Logger::instance().debug("POST " + endpoint_ + path);

    try {
        co_return co_await fetch(endpoint_ + path, "POST", std::move(headers), std::move(body), options_.timeouts);
    } catch (const boost::system::system_error& e) {
        throw TransportFailure(region_ + ": " + e.what());
    }
}

Async<InvokeResponse> BedrockHttpClient::converse(const boost::json::object& params, bool streaming) {
    const std::string path = model_path(params, streaming ? "converse-stream" : "converse");

    boost::json::object body = params;
    body.erase("modelId");

    std::map<std::string, std::string> headers{
        {"Content-Type", "application/json"},
        {"Accept", streaming ? "application/vnd.amazon.eventstream" : "application/json"}
    };

    FetchResponse res = co_await post(path, std::move(headers), boost::json::serialize(body));
    co_return to_invoke_response(std::move(res), streaming);
}

Async<InvokeResponse> BedrockHttpClient::invoke_model(const boost::json::object& params, bool streaming) {
    const std::string path = model_path(params, streaming ? "invoke-with-response-stream" : "invoke");

    std::map<std::string, std::string> headers;
    headers["Content-Type"] = string_field(params, "contentType");
    if (streaming) {
        headers["Accept"] = "application/vnd.amazon.eventstream";
        headers["X-Amzn-Bedrock-Accept"] = string_field(params, "accept");
    } else {
        headers["Accept"] = string_field(params, "accept");
    }
    headers["X-Amzn-Bedrock-Trace"] = string_field(params, "trace");

    std::string guardrail = string_field(params, "guardrailIdentifier");
    if (!guardrail.empty()) {
        headers["X-Amzn-Bedrock-GuardrailIdentifier"] = guardrail;
        headers["X-Amzn-Bedrock-GuardrailVersion"] = string_field(params, "guardrailVersion");
    }

    FetchResponse res = co_await post(path, std::move(headers), string_field(params, "body"));
    co_return to_invoke_response(std::move(res), streaming);
}

} // namespace meridian
