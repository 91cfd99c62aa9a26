#ifndef MERIDIAN_CALL_SHAPE_H
#define MERIDIAN_CALL_SHAPE_H

#include <boost/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian {

enum class ApiMethod {
    Converse,
    ConverseStream,
    InvokeModel,
    InvokeModelWithResponseStream
};

std::string_view to_string(ApiMethod method);
std::optional<ApiMethod> parse_api_method(std::string_view name);
bool is_streaming(ApiMethod method);

/**
 * @brief Header-style options of the raw-body invoke APIs.
 */
struct RawInvokeOptions {
    std::string content_type = "application/json";
    std::string accept = "application/json";
    bool trace = false;
    std::optional<std::string> guardrail_identifier;
    std::optional<std::string> guardrail_version;
};

/**
 * @brief Everything needed to build one request, independent of the region it goes to.
 * Empty optional objects are left out of the request.
 */
struct CallRequest {
    ApiMethod method = ApiMethod::Converse;
    std::string model_id;

    // Structured-message shape
    boost::json::array messages;
    boost::json::array system;
    boost::json::object inference_config;
    boost::json::object tool_config;
    boost::json::object guardrail_config;
    boost::json::value additional_model_request_fields;
    std::vector<std::string> additional_model_response_field_paths;

    // Raw-body shape
    std::string body;
    RawInvokeOptions raw;
};

/**
 * @brief Request construction and response parsing for one family of APIs.
 *
 * There are exactly two shapes: structured-message (converse, converse-stream)
 * and raw-body (invoke-model, invoke-model-with-response-stream).
 */
class CallShape {
public:
    virtual ~CallShape() = default;

    /**
     * @brief false when the payload the shape requires is empty.
     */
    virtual bool has_payload(const CallRequest& request) const = 0;

    /**
     * @brief Builds the API parameters; @p model_id is the per-region runtime id.
     */
    virtual boost::json::object build_params(const CallRequest& request, std::string_view model_id) const = 0;

    /**
     * @brief The first text block of a non-streaming response.
     */
    virtual std::optional<boost::json::value> extract_content(const boost::json::value& response) const = 0;

    /**
     * @brief Maps one stream event to a chunk; std::nullopt skips the event.
     * @throws StreamError when the event payload cannot be decoded.
     */
    virtual std::optional<boost::json::value> filter_chunk(const boost::json::value& event, bool content_only) const = 0;
};

const CallShape& call_shape_for(ApiMethod method);

/**
 * @brief Token usage block of a converse response, if present.
 */
std::optional<boost::json::value> extract_usage(const boost::json::value& response);

} // namespace meridian

#endif // MERIDIAN_CALL_SHAPE_H
