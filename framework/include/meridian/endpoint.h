#ifndef MERIDIAN_ENDPOINT_H
#define MERIDIAN_ENDPOINT_H

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian {

/**
 * @brief One regional endpoint and the time from which it may be used again.
 */
struct EndpointRecord {
    std::string region;
    bool primary = false;
    int64_t next_available_time = 0;                   // Unix seconds
    std::optional<std::string> region_profile_prefix;  // e.g. "us" for cross-region inference

    bool available_at(int64_t now) const { return next_available_time <= now; }

    bool operator==(const EndpointRecord&) const = default;
};

using EndpointSnapshot = std::vector<EndpointRecord>;

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const EndpointRecord& rec);
EndpointRecord tag_invoke(boost::json::value_to_tag<EndpointRecord>, const boost::json::value& jv);

/**
 * @brief Parses a JSON array of endpoint objects.
 * @throws ConfigLoadFailed on malformed JSON, a missing/mistyped field or a duplicate region.
 */
EndpointSnapshot parse_endpoints(std::string_view text);

std::string serialize_endpoints(const EndpointSnapshot& records);

/**
 * @brief Finds the record for @p region, nullptr when absent.
 */
const EndpointRecord* find_endpoint(const EndpointSnapshot& records, std::string_view region);

} // namespace meridian

#endif // MERIDIAN_ENDPOINT_H
