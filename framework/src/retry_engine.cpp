#include <meridian/retry_engine.h>
#include <meridian/exceptions.h>
#include <meridian/logger.h>
#include <algorithm>
#include <chrono>

namespace meridian {

namespace {

    // Per-call state; discarded when run() returns
    struct RetrySession {
        int budget_remaining;
        int per_region_limit;
        int attempts = 0;
        std::vector<std::string> failed_regions;

        bool mark_failed(const std::string& region) {
            if (std::find(failed_regions.begin(), failed_regions.end(), region) != failed_regions.end()) {
                return false;
            }
            failed_regions.push_back(region);
            return true;
        }
    };

    long long elapsed_ms(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    }

    InvokeOutcome invalid_request(ApiMethod method, std::string reason) {
        Logger::instance().debug(reason);
        InvokeOutcome out;
        out.status = InvokeStatus::InvalidRequest;
        out.method = method;
        out.errors.push_back(reason);
        out.error = std::move(reason);
        return out;
    }

} // namespace

std::string_view to_string(InvokeStatus status) {
    switch (status) {
        case InvokeStatus::Success: return "success";
        case InvokeStatus::InvalidRequest: return "invalid_request";
        case InvokeStatus::Exhausted: return "exhausted";
    }
    return "exhausted";
}

RetryEngine::RetryEngine(const FailoverConfig& config, ClientProvider& clients)
    : max_retry_time_(config.max_retry_time),
      max_retries_per_region_(config.max_retries_per_region),
      multi_region_retry_(config.multi_region_retry),
      clients_(clients) {
    config.validate();
}

Async<InvokeOutcome> RetryEngine::run(const CallRequest& request,
                                      const std::vector<std::string>& candidates,
                                      FailureTracker& tracker,
                                      const ModelResolver& resolve_model,
                                      InvokeOptions options) {
    const CallShape& shape = call_shape_for(request.method);
    auto& log = Logger::instance();

    if (!shape.has_payload(request)) {
        const bool raw_body = request.method == ApiMethod::InvokeModel ||
                              request.method == ApiMethod::InvokeModelWithResponseStream;
        co_return invalid_request(request.method,
                                  std::string("Argument \"") + (raw_body ? "body" : "messages") + "\" is invalid!");
    }
    if (candidates.empty()) {
        co_return invalid_request(request.method, "No available endpoint!");
    }

    RetrySession session{max_retry_time_, max_retries_per_region_};
    InvokeOutcome out;
    out.method = request.method;

    const size_t region_count = multi_region_retry_ ? candidates.size() : 1;

    for (size_t r = 0; r < region_count && session.budget_remaining > 0; ++r) {
        const std::string& region = candidates[r];
        const std::string model_id = resolve_model ? resolve_model(region) : request.model_id;
        log.debug("Use region: " + region + " via API " + std::string(to_string(request.method)));

        for (int sub = 0; sub < session.per_region_limit && session.budget_remaining > 0; ++sub) {
            const int attempt = ++session.attempts;
            const auto start = std::chrono::steady_clock::now();

            AttemptRecord record{region, model_id, attempt, AttemptResult::Success, {}};
            bool blame_region = false;

            try {
                auto client = clients_.acquire(region);
                boost::json::object params = shape.build_params(request, model_id);
                InvokeResponse response = co_await dispatch(*client, request.method, params);

                if (response.empty()) {
                    throw TransportFailure("Empty response from " + region);
                }

                log.log_attempt(region, model_id, attempt, "ok", elapsed_ms(start));
                out.attempt_log.push_back(std::move(record));

                out.status = InvokeStatus::Success;
                out.region = region;
                out.model_id = model_id;
                if (options.extract_content && !response.stream) {
                    out.content = shape.extract_content(response.body);
                }
                out.response = std::move(response);
                out.attempts = session.attempts;
                out.failed_regions = session.failed_regions;
                co_return out;

            } catch (const ValidationError& e) {
                record.result = AttemptResult::ValidationError;
                record.message = "ERROR: Invoke '" + model_id + "' error. Reason: " + e.what();
            } catch (const std::exception& e) {
                record.result = AttemptResult::TransportFailure;
                record.message = "ERROR: Can't invoke '" + model_id + "'. Reason: " + e.what();
                blame_region = true;
            }

            // Evaluating: every failure costs one unit of the global budget
            --session.budget_remaining;

            // Only a failure on the region's first sub-attempt marks it
            if (blame_region && sub == 0 && session.mark_failed(region)) {
                tracker.record_failure(region);
            }

            log.log_attempt(region, model_id, attempt,
                            record.result == AttemptResult::ValidationError ? "validation_error" : "transport_failure",
                            elapsed_ms(start));
            log.debug(record.message);
            out.errors.push_back(record.message);
            out.attempt_log.push_back(std::move(record));
        }
    }

    out.status = InvokeStatus::Exhausted;
    out.attempts = session.attempts;
    out.failed_regions = session.failed_regions;
    out.error = session.budget_remaining == 0
        ? "Retry budget of " + std::to_string(max_retry_time_) + " attempts exhausted"
        : "All candidate regions failed";
    log.warn(out.error);
    co_return out;
}

} // namespace meridian
