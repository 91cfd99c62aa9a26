#ifndef MERIDIAN_FAILURE_TRACKER_H
#define MERIDIAN_FAILURE_TRACKER_H

#include <meridian/endpoint.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian {

/**
 * @brief Regions blamed for endpoint-side failures, in first-seen order.
 *
 * The set lives as long as its owner; it is only cleared by reset().
 */
class FailureTracker {
public:
    /**
     * @brief Adds @p region unless already present.
     * @return true if the region was newly added.
     */
    bool record_failure(std::string_view region);

    bool contains(std::string_view region) const;
    bool empty() const { return failed_.empty(); }
    size_t size() const { return failed_.size(); }
    const std::vector<std::string>& failed_regions() const { return failed_; }

    void reset() { failed_.clear(); }

    /**
     * @brief Pushes every failed region's next_available_time to now + cooldown.
     *
     * A region's time never moves backwards. Records not in @p failed pass
     * through unchanged.
     * @return std::nullopt when @p failed is empty.
     */
    static std::optional<EndpointSnapshot> compute_disable_updates(
        const EndpointSnapshot& snapshot,
        const std::vector<std::string>& failed,
        int64_t now,
        std::chrono::seconds cooldown);

private:
    std::vector<std::string> failed_;
};

} // namespace meridian

#endif // MERIDIAN_FAILURE_TRACKER_H
