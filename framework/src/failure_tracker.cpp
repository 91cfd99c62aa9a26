#include <meridian/failure_tracker.h>
#include <algorithm>

namespace meridian {

bool FailureTracker::record_failure(std::string_view region) {
    if (contains(region)) return false;
    failed_.emplace_back(region);
    return true;
}

bool FailureTracker::contains(std::string_view region) const {
    return std::find(failed_.begin(), failed_.end(), region) != failed_.end();
}

std::optional<EndpointSnapshot> FailureTracker::compute_disable_updates(
    const EndpointSnapshot& snapshot,
    const std::vector<std::string>& failed,
    int64_t now,
    std::chrono::seconds cooldown) {

    if (failed.empty()) {
        return std::nullopt;
    }

    const int64_t next_available = now + static_cast<int64_t>(cooldown.count());

    EndpointSnapshot updated = snapshot;
    for (auto& rec : updated) {
        if (std::find(failed.begin(), failed.end(), rec.region) != failed.end()) {
            rec.next_available_time = std::max(rec.next_available_time, next_available);
        }
    }
    return updated;
}

} // namespace meridian
