#include <meridian/call_shape.h>
#include <meridian/crypto.h>
#include <meridian/exceptions.h>

namespace meridian {

namespace {

    const boost::json::value* child(const boost::json::value* v, std::string_view key) {
        if (!v) return nullptr;
        const auto* obj = v->if_object();
        return obj ? obj->if_contains(key) : nullptr;
    }

    const boost::json::value* first_element(const boost::json::value* v) {
        if (!v) return nullptr;
        const auto* arr = v->if_array();
        return (arr && !arr->empty()) ? &arr->front() : nullptr;
    }

    std::optional<boost::json::value> first_text(const boost::json::value* content) {
        const auto* text = child(first_element(content), "text");
        if (!text) return std::nullopt;
        return *text;
    }

    class StructuredMessageShape : public CallShape {
    public:
        bool has_payload(const CallRequest& request) const override {
            return !request.messages.empty();
        }

        boost::json::object build_params(const CallRequest& request, std::string_view model_id) const override {
            boost::json::object params;
            params["modelId"] = model_id;
            params["messages"] = request.messages;
            params["system"] = request.system;

            if (!request.inference_config.empty()) params["inferenceConfig"] = request.inference_config;
            if (!request.tool_config.empty()) params["toolConfig"] = request.tool_config;
            if (!request.guardrail_config.empty()) params["guardrailConfig"] = request.guardrail_config;
            if (!request.additional_model_request_fields.is_null()) {
                params["additionalModelRequestFields"] = request.additional_model_request_fields;
            }
            if (!request.additional_model_response_field_paths.empty()) {
                params["additionalModelResponseFieldPaths"] =
                    boost::json::value_from(request.additional_model_response_field_paths);
            }
            return params;
        }

        std::optional<boost::json::value> extract_content(const boost::json::value& response) const override {
            return first_text(child(child(child(&response, "output"), "message"), "content"));
        }

        std::optional<boost::json::value> filter_chunk(const boost::json::value& event, bool content_only) const override {
            if (!content_only) return event;

            if (const auto* delta = child(child(&event, "contentBlockDelta"), "delta")) {
                return *delta;
            }
            return std::nullopt;
        }
    };

    class RawBodyShape : public CallShape {
    public:
        bool has_payload(const CallRequest& request) const override {
            return !request.body.empty();
        }

        boost::json::object build_params(const CallRequest& request, std::string_view model_id) const override {
            boost::json::object params;
            params["modelId"] = model_id;
            params["body"] = request.body;
            params["contentType"] = request.raw.content_type;
            params["accept"] = request.raw.accept;
            params["trace"] = request.raw.trace ? "ENABLED" : "DISABLED";

            if (request.raw.guardrail_identifier) params["guardrailIdentifier"] = *request.raw.guardrail_identifier;
            if (request.raw.guardrail_version) params["guardrailVersion"] = *request.raw.guardrail_version;
            return params;
        }

        std::optional<boost::json::value> extract_content(const boost::json::value& response) const override {
            return first_text(child(&response, "content"));
        }

        std::optional<boost::json::value> filter_chunk(const boost::json::value& event, bool content_only) const override {
            const auto* bytes = child(child(&event, "chunk"), "bytes");
            if (!bytes || !bytes->is_string()) return std::nullopt;

            std::string decoded = crypto::base64_decode(bytes->as_string());
            boost::json::error_code ec;
            boost::json::value chunk = boost::json::parse(decoded, ec);
            if (ec) {
                throw StreamError("Undecodable stream chunk: " + ec.message());
            }

            if (!content_only) return chunk;

            const auto* delta = child(&chunk, "delta");
            if (delta && child(delta, "text")) {
                return *delta;
            }
            return std::nullopt;
        }
    };

} // namespace

std::string_view to_string(ApiMethod method) {
    switch (method) {
        case ApiMethod::Converse: return "converse";
        case ApiMethod::ConverseStream: return "converse_stream";
        case ApiMethod::InvokeModel: return "invoke_model";
        case ApiMethod::InvokeModelWithResponseStream: return "invoke_model_with_response_stream";
    }
    return "converse";
}

std::optional<ApiMethod> parse_api_method(std::string_view name) {
    if (name == "converse") return ApiMethod::Converse;
    if (name == "converse_stream") return ApiMethod::ConverseStream;
    if (name == "invoke_model") return ApiMethod::InvokeModel;
    if (name == "invoke_model_with_response_stream") return ApiMethod::InvokeModelWithResponseStream;
    return std::nullopt;
}

bool is_streaming(ApiMethod method) {
    return method == ApiMethod::ConverseStream || method == ApiMethod::InvokeModelWithResponseStream;
}

const CallShape& call_shape_for(ApiMethod method) {
    static const StructuredMessageShape structured{};
    static const RawBodyShape raw{};

    switch (method) {
        case ApiMethod::Converse:
        case ApiMethod::ConverseStream:
            return structured;
        case ApiMethod::InvokeModel:
        case ApiMethod::InvokeModelWithResponseStream:
            return raw;
    }
    return structured;
}

std::optional<boost::json::value> extract_usage(const boost::json::value& response) {
    if (const auto* usage = child(&response, "usage")) {
        return *usage;
    }
    return std::nullopt;
}

} // namespace meridian
