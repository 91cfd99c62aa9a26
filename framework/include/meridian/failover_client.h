#ifndef MERIDIAN_FAILOVER_CLIENT_H
#define MERIDIAN_FAILOVER_CLIENT_H

#include <meridian/config.h>
#include <meridian/endpoint_store.h>
#include <meridian/event_stream.h>
#include <meridian/failure_tracker.h>
#include <meridian/region_selector.h>
#include <meridian/retry_engine.h>
#include <meridian/transport.h>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian {

/**
 * @brief Caller-facing entry point: multi-region calls with failover and shared cooldowns.
 *
 * Typical use:
 * @code
 *   FailoverClient client(FailoverConfig::from_env(), std::make_shared<BedrockHttpClientFactory>(opts));
 *   client.set_model_id("anthropic.claude-3-haiku-20240307-v1:0");
 *   auto outcome = co_await client.converse(messages);
 *   client.record_and_persist_failures();
 * @endcode
 *
 * Failed regions accumulate over the lifetime of the object (not per call)
 * until record_and_persist_failures() succeeds or reset_failures() is called.
 * Nothing is written on destruction.
 */
class FailoverClient {
public:
    using Clock = std::function<int64_t()>;

    FailoverClient(FailoverConfig config, std::shared_ptr<ClientFactory> factory, bool auto_load = true);
    ~FailoverClient();

    FailoverClient(const FailoverClient&) = delete;
    FailoverClient& operator=(const FailoverClient&) = delete;

    /**
     * @brief Re-reads the endpoint file; on failure the previous snapshot is kept.
     * @return false if the file could not be loaded (the reason is in error_logs()).
     */
    bool reload();
    bool reload(const std::filesystem::path& path);

    FailoverClient& set_cross_region_inference(bool enabled);
    bool cross_region_inference() const { return cross_region_inference_; }

    FailoverClient& set_model_id(std::string model_id);
    FailoverClient& set_inference_config(boost::json::object config, boost::json::value additional_fields = nullptr);
    FailoverClient& set_tool_config(boost::json::object config);
    FailoverClient& set_guardrail_config(boost::json::object config);
    FailoverClient& set_additional_response_field_paths(std::vector<std::string> paths);

    /** @brief Replaces the wall clock (unix seconds); used for selection and cooldowns. */
    FailoverClient& set_clock(Clock clock);

    /** @brief Makes primary-region randomization reproducible. */
    FailoverClient& seed_selector(uint32_t seed);

    /**
     * @brief Runs one retry session for a fully described request.
     * Unset model ids and optional configs are filled from the client's defaults.
     */
    Async<InvokeOutcome> invoke_with_failover(CallRequest request, InvokeOptions options = {});

    Async<InvokeOutcome> converse(boost::json::array messages, boost::json::array system = {},
                                  InvokeOptions options = {});
    Async<InvokeOutcome> converse_stream(boost::json::array messages, boost::json::array system = {});
    Async<InvokeOutcome> invoke_model(std::string body, RawInvokeOptions raw = {}, InvokeOptions options = {});
    Async<InvokeOutcome> invoke_model_with_response_stream(std::string body, RawInvokeOptions raw = {});

    /**
     * @brief Chunks of a successful streaming outcome; an empty sequence otherwise.
     */
    ChunkSequence chunks(const InvokeOutcome& outcome, bool content_only = true) const;

    /** @brief Regions a call made now would try, in order. */
    std::vector<std::string> candidate_regions();

    /**
     * @brief The runtime model id for @p region, honoring cross-region inference.
     * @param base_model Defaults to the id set with set_model_id().
     */
    std::string resolve_model_id(const std::string& region, std::string_view base_model = {}) const;

    const EndpointSnapshot& snapshot() const { return snapshot_; }
    const std::filesystem::path& endpoints_path() const { return store_.path(); }
    const FailoverConfig& config() const { return config_; }

    const std::vector<std::string>& failed_regions() const { return tracker_.failed_regions(); }
    void reset_failures() { tracker_.reset(); }

    const std::vector<std::string>& error_logs() const { return error_logs_; }
    void clear_error_logs() { error_logs_.clear(); }

    /**
     * @brief The snapshot with cooldowns applied to failed regions, std::nullopt if none failed.
     */
    std::optional<EndpointSnapshot> disable_updates() const;

    /**
     * @brief Merges the failed regions' cooldowns into the endpoint file under its lock.
     * @return false when nothing failed or the write failed; the file is untouched in both cases.
     */
    bool record_and_persist_failures();

private:
    void log_error(const std::string& message);

    FailoverConfig config_;
    EndpointStore store_;
    ClientProvider clients_;
    RetryEngine engine_;
    RegionSelector selector_;
    FailureTracker tracker_;
    EndpointSnapshot snapshot_;
    Clock clock_;

    bool cross_region_inference_;
    std::string model_id_;
    boost::json::object inference_config_;
    boost::json::value additional_model_request_fields_;
    boost::json::object tool_config_;
    boost::json::object guardrail_config_;
    std::vector<std::string> additional_response_field_paths_;

    std::vector<std::string> error_logs_;
};

} // namespace meridian

#endif // MERIDIAN_FAILOVER_CLIENT_H
