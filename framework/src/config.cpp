#include <meridian/config.h>
#include <meridian/environment.h>
#include <meridian/exceptions.h>

namespace meridian {

std::string_view to_string(ClientLifetime lifetime) {
    switch (lifetime) {
        case ClientLifetime::PerCall: return "per_call";
        case ClientLifetime::PooledPerRegion: return "pooled";
    }
    return "per_call";
}

std::optional<ClientLifetime> parse_client_lifetime(std::string_view name) {
    if (name == "per_call") return ClientLifetime::PerCall;
    if (name == "pooled" || name == "pooled_per_region") return ClientLifetime::PooledPerRegion;
    return std::nullopt;
}

void FailoverConfig::validate() const {
    if (max_retry_time < 1) {
        throw ConfigError("max_retry_time must be at least 1");
    }
    if (max_retries_per_region < 1) {
        throw ConfigError("max_retries_per_region must be at least 1");
    }
    if (max_retries_per_region > max_retry_time) {
        throw ConfigError("max_retries_per_region cannot exceed max_retry_time");
    }
    if (cooldown_window.count() < 0) {
        throw ConfigError("cooldown_window cannot be negative");
    }
    if (connect_timeout.count() <= 0 || read_timeout.count() <= 0) {
        throw ConfigError("timeouts must be positive");
    }
    if (endpoints_path.empty()) {
        throw ConfigError("endpoints_path is empty");
    }
}

FailoverConfig FailoverConfig::from_env() {
    FailoverConfig cfg;

    cfg.max_retry_time = env<int>("MERIDIAN_MAX_RETRY_TIME", cfg.max_retry_time);
    cfg.max_retries_per_region = env<int>("MERIDIAN_MAX_RETRIES_PER_REGION", cfg.max_retries_per_region);
    cfg.multi_region_retry = env<bool>("MERIDIAN_MULTI_REGION_RETRY", cfg.multi_region_retry);
    cfg.primary_region_random_distribution =
        env<bool>("MERIDIAN_PRIMARY_RANDOM", cfg.primary_region_random_distribution);
    cfg.cooldown_window = std::chrono::seconds(
        env<int64_t>("MERIDIAN_COOLDOWN_SECONDS", static_cast<int64_t>(cfg.cooldown_window.count())));
    cfg.cross_region_inference = env<bool>("MERIDIAN_CROSS_REGION_INFERENCE", cfg.cross_region_inference);
    cfg.connect_timeout = std::chrono::seconds(
        env<int>("MERIDIAN_CONNECT_TIMEOUT", static_cast<int>(cfg.connect_timeout.count())));
    cfg.read_timeout = std::chrono::seconds(
        env<int>("MERIDIAN_READ_TIMEOUT", static_cast<int>(cfg.read_timeout.count())));
    cfg.endpoints_path = env<std::string>("MERIDIAN_ENDPOINTS_FILE", cfg.endpoints_path);

    std::string lifetime = env<std::string>("MERIDIAN_CLIENT_LIFETIME", std::string(to_string(cfg.client_lifetime)));
    auto parsed = parse_client_lifetime(lifetime);
    if (!parsed) {
        throw ConfigError("Invalid MERIDIAN_CLIENT_LIFETIME: " + lifetime);
    }
    cfg.client_lifetime = *parsed;

    cfg.validate();
    return cfg;
}

} // namespace meridian
