#include <meridian/failover_client.h>
#include <meridian/exceptions.h>
#include <meridian/logger.h>
#include <chrono>

namespace meridian {

namespace {

    int64_t unix_now() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    bool is_structured(ApiMethod method) {
        return method == ApiMethod::Converse || method == ApiMethod::ConverseStream;
    }

} // namespace

FailoverClient::FailoverClient(FailoverConfig config, std::shared_ptr<ClientFactory> factory, bool auto_load)
    : config_(std::move(config)),
      store_(config_.endpoints_path),
      clients_(std::move(factory), config_.client_lifetime),
      engine_(config_, clients_),
      selector_(config_.primary_region_random_distribution),
      clock_(unix_now),
      cross_region_inference_(config_.cross_region_inference) {
    if (auto_load) {
        Logger::instance().debug("Endpoint file: " + store_.path().string());
        reload();
    }
}

FailoverClient::~FailoverClient() {
    if (!tracker_.empty()) {
        Logger::instance().warn(std::to_string(tracker_.size()) +
                                " failed region(s) were never persisted to " + store_.path().string());
    }
}

void FailoverClient::log_error(const std::string& message) {
    error_logs_.push_back(message);
    Logger::instance().log_error(message);
}

bool FailoverClient::reload() {
    try {
        snapshot_ = store_.load();
        Logger::instance().debug("Loaded " + std::to_string(snapshot_.size()) + " endpoint(s)");
        return true;
    } catch (const ConfigLoadFailed& e) {
        log_error(std::string("Error: Load configuration file failed! ") + e.what());
        return false;
    }
}

bool FailoverClient::reload(const std::filesystem::path& path) {
    EndpointStore candidate(path);
    try {
        snapshot_ = candidate.load();
        store_ = std::move(candidate);
        Logger::instance().debug("Loaded " + std::to_string(snapshot_.size()) + " endpoint(s) from " + path.string());
        return true;
    } catch (const ConfigLoadFailed& e) {
        log_error(std::string("Error: Load configuration file failed! ") + e.what());
        return false;
    }
}

FailoverClient& FailoverClient::set_cross_region_inference(bool enabled) {
    cross_region_inference_ = enabled;
    return *this;
}

FailoverClient& FailoverClient::set_model_id(std::string model_id) {
    if (!model_id.empty()) {
        model_id_ = std::move(model_id);
    }
    return *this;
}

FailoverClient& FailoverClient::set_inference_config(boost::json::object config, boost::json::value additional_fields) {
    if (!config.empty()) {
        inference_config_ = std::move(config);
    }
    if (!additional_fields.is_null()) {
        additional_model_request_fields_ = std::move(additional_fields);
    }
    return *this;
}

FailoverClient& FailoverClient::set_tool_config(boost::json::object config) {
    if (!config.empty()) {
        tool_config_ = std::move(config);
    }
    return *this;
}

FailoverClient& FailoverClient::set_guardrail_config(boost::json::object config) {
    if (!config.empty()) {
        guardrail_config_ = std::move(config);
    }
    return *this;
}

FailoverClient& FailoverClient::set_additional_response_field_paths(std::vector<std::string> paths) {
    additional_response_field_paths_ = std::move(paths);
    return *this;
}

FailoverClient& FailoverClient::set_clock(Clock clock) {
    if (clock) {
        clock_ = std::move(clock);
    }
    return *this;
}

FailoverClient& FailoverClient::seed_selector(uint32_t seed) {
    selector_ = RegionSelector(config_.primary_region_random_distribution, seed);
    return *this;
}

std::vector<std::string> FailoverClient::candidate_regions() {
    return selector_.select(snapshot_, clock_());
}

std::string FailoverClient::resolve_model_id(const std::string& region, std::string_view base_model) const {
    std::string base = base_model.empty() ? model_id_ : std::string(base_model);
    if (!cross_region_inference_) {
        return base;
    }

    const EndpointRecord* rec = find_endpoint(snapshot_, region);
    if (rec && rec->region_profile_prefix && !rec->region_profile_prefix->empty()) {
        return *rec->region_profile_prefix + "." + base;
    }

    Logger::instance().debug("Failed to construct regional cross-region inference profile ID for " + region);
    return base;
}

Async<InvokeOutcome> FailoverClient::invoke_with_failover(CallRequest request, InvokeOptions options) {
    if (request.model_id.empty()) {
        request.model_id = model_id_;
    }

    if (is_structured(request.method)) {
        if (request.inference_config.empty()) request.inference_config = inference_config_;
        if (request.additional_model_request_fields.is_null()) {
            request.additional_model_request_fields = additional_model_request_fields_;
        }
        if (request.tool_config.empty()) request.tool_config = tool_config_;
        if (request.guardrail_config.empty()) request.guardrail_config = guardrail_config_;
        if (request.additional_model_response_field_paths.empty()) {
            request.additional_model_response_field_paths = additional_response_field_paths_;
        }
    }

    std::vector<std::string> candidates = selector_.select(snapshot_, clock_());

    const std::string base_model = request.model_id;
    RetryEngine::ModelResolver resolver = [this, base_model](const std::string& region) {
        return resolve_model_id(region, base_model);
    };

    InvokeOutcome outcome = co_await engine_.run(request, candidates, tracker_, resolver, options);

    error_logs_.insert(error_logs_.end(), outcome.errors.begin(), outcome.errors.end());
    co_return outcome;
}

Async<InvokeOutcome> FailoverClient::converse(boost::json::array messages, boost::json::array system,
                                              InvokeOptions options) {
    CallRequest request;
    request.method = ApiMethod::Converse;
    request.messages = std::move(messages);
    request.system = std::move(system);
    co_return co_await invoke_with_failover(std::move(request), options);
}

Async<InvokeOutcome> FailoverClient::converse_stream(boost::json::array messages, boost::json::array system) {
    CallRequest request;
    request.method = ApiMethod::ConverseStream;
    request.messages = std::move(messages);
    request.system = std::move(system);
    co_return co_await invoke_with_failover(std::move(request));
}

Async<InvokeOutcome> FailoverClient::invoke_model(std::string body, RawInvokeOptions raw, InvokeOptions options) {
    CallRequest request;
    request.method = ApiMethod::InvokeModel;
    request.body = std::move(body);
    request.raw = std::move(raw);
    co_return co_await invoke_with_failover(std::move(request), options);
}

Async<InvokeOutcome> FailoverClient::invoke_model_with_response_stream(std::string body, RawInvokeOptions raw) {
    CallRequest request;
    request.method = ApiMethod::InvokeModelWithResponseStream;
    request.body = std::move(body);
    request.raw = std::move(raw);
    co_return co_await invoke_with_failover(std::move(request));
}

ChunkSequence FailoverClient::chunks(const InvokeOutcome& outcome, bool content_only) const {
    std::shared_ptr<EventStream> stream = outcome.response.stream;
    if (!outcome.ok() || !stream) {
        stream = std::make_shared<BufferedEventStream>(std::vector<boost::json::value>{});
    }
    return ChunkSequence(std::move(stream), call_shape_for(outcome.method), content_only);
}

std::optional<EndpointSnapshot> FailoverClient::disable_updates() const {
    return FailureTracker::compute_disable_updates(snapshot_, tracker_.failed_regions(), clock_(),
                                                   config_.cooldown_window);
}

bool FailoverClient::record_and_persist_failures() {
    if (tracker_.empty()) {
        Logger::instance().debug("No need to update the endpoint file");
        return false;
    }

    const int64_t now = clock_();
    const std::vector<std::string> failed = tracker_.failed_regions();
    const auto cooldown = config_.cooldown_window;

    Logger::instance().debug("Next available time: " + std::to_string(now + cooldown.count()));

    bool written = store_.update(
        [&failed, now, cooldown](const EndpointSnapshot& current) {
            return FailureTracker::compute_disable_updates(current, failed, now, cooldown);
        },
        snapshot_);

    if (!written) {
        log_error("Error: Persisting endpoint cooldowns to " + store_.path().string() + " failed");
        return false;
    }

    if (auto updated = FailureTracker::compute_disable_updates(snapshot_, failed, now, cooldown)) {
        snapshot_ = std::move(*updated);
    }
    tracker_.reset();
    Logger::instance().info("Disabled " + std::to_string(failed.size()) + " region(s) until " +
                            std::to_string(now + cooldown.count()));
    return true;
}

} // namespace meridian
