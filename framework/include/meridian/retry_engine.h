#ifndef MERIDIAN_RETRY_ENGINE_H
#define MERIDIAN_RETRY_ENGINE_H

#include <meridian/call_shape.h>
#include <meridian/config.h>
#include <meridian/failure_tracker.h>
#include <meridian/transport.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace meridian {

enum class InvokeStatus {
    Success,
    InvalidRequest,   // empty payload or no eligible endpoint; nothing was attempted
    Exhausted         // every attempt allowed by the budget failed
};

std::string_view to_string(InvokeStatus status);

enum class AttemptResult {
    Success,
    ValidationError,
    TransportFailure
};

struct AttemptRecord {
    std::string region;
    std::string model_id;
    int attempt = 0;          // 1-based, across the whole session
    AttemptResult result = AttemptResult::Success;
    std::string message;
};

/**
 * @brief Terminal value of one retry session. Failures are values, not exceptions.
 */
struct InvokeOutcome {
    InvokeStatus status = InvokeStatus::Exhausted;
    ApiMethod method = ApiMethod::Converse;
    InvokeResponse response;
    std::optional<boost::json::value> content;   // set when extraction was requested and found
    std::string region;                          // region that answered
    std::string model_id;                        // runtime model id that answered
    int attempts = 0;                            // transport invocations made
    std::vector<std::string> failed_regions;     // blamed during this session, first-seen order
    std::vector<AttemptRecord> attempt_log;
    std::vector<std::string> errors;             // human-readable, one per failure
    std::string error;                           // terminal reason when not successful

    bool ok() const { return status == InvokeStatus::Success; }
    explicit operator bool() const { return ok(); }
};

struct InvokeOptions {
    bool extract_content = false;
};

/**
 * @brief Walks a region candidate list until a call succeeds or the budget runs out.
 *
 * Every failed invocation costs one unit of the global budget. Each region gets
 * at most max_retries_per_region attempts. Validation errors are the caller's
 * fault and never mark a region as failed; every other failure marks the
 * region once per session and is also recorded in the lifetime FailureTracker.
 */
class RetryEngine {
public:
    /**
     * @brief Maps a region to the model id used there (cross-region inference profiles).
     */
    using ModelResolver = std::function<std::string(const std::string& region)>;

    RetryEngine(const FailoverConfig& config, ClientProvider& clients);

    Async<InvokeOutcome> run(const CallRequest& request,
                             const std::vector<std::string>& candidates,
                             FailureTracker& tracker,
                             const ModelResolver& resolve_model,
                             InvokeOptions options = {});

    int max_retry_time() const { return max_retry_time_; }
    int max_retries_per_region() const { return max_retries_per_region_; }

private:
    int max_retry_time_;
    int max_retries_per_region_;
    bool multi_region_retry_;
    ClientProvider& clients_;
};

} // namespace meridian

#endif // MERIDIAN_RETRY_ENGINE_H
