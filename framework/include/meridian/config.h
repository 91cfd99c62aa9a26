#ifndef MERIDIAN_CONFIG_H
#define MERIDIAN_CONFIG_H

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace meridian {

/**
 * @brief How long a region client lives.
 * PerCall builds a fresh client for every invocation; PooledPerRegion keeps one per region.
 */
enum class ClientLifetime {
    PerCall,
    PooledPerRegion
};

std::string_view to_string(ClientLifetime lifetime);
std::optional<ClientLifetime> parse_client_lifetime(std::string_view name);

/**
 * @brief Immutable failover policy, fixed at FailoverClient construction.
 */
struct FailoverConfig {
    int max_retry_time = 5;                                  // Total attempts per call, all regions combined
    int max_retries_per_region = 1;                          // Attempts against one region before moving on
    bool multi_region_retry = true;                          // false: only the first candidate is tried
    bool primary_region_random_distribution = true;          // Randomize among primaries and try them first
    std::chrono::seconds cooldown_window{3600};              // Added to "now" for failed regions
    bool cross_region_inference = false;                     // Prefix model ids with the region profile
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds read_timeout{5};
    ClientLifetime client_lifetime = ClientLifetime::PerCall;
    std::string endpoints_path = "bedrock_endpoints.json";

    /**
     * @brief Throws ConfigError when the limits are inconsistent.
     */
    void validate() const;

    /**
     * @brief Reads MERIDIAN_* environment variables over the defaults and validates the result.
     */
    static FailoverConfig from_env();
};

} // namespace meridian

#endif // MERIDIAN_CONFIG_H
