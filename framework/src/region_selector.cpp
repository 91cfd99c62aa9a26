#include <meridian/region_selector.h>
#include <algorithm>
#include <iterator>

namespace meridian {

RegionSelector::RegionSelector(bool primary_preference)
    : primary_preference_(primary_preference), rng_(std::random_device{}()) {}

RegionSelector::RegionSelector(bool primary_preference, uint32_t seed)
    : primary_preference_(primary_preference), rng_(seed) {}

std::vector<std::string> RegionSelector::select(const EndpointSnapshot& records, int64_t now) {
    std::vector<std::string> primary;
    std::vector<std::string> other;

    for (const auto& rec : records) {
        if (!rec.available_at(now)) continue;

        if (primary_preference_ && rec.primary) {
            primary.push_back(rec.region);
        } else {
            other.push_back(rec.region);
        }
    }

    if (primary.size() > 1) {
        std::uniform_int_distribution<size_t> pick(0, primary.size() - 1);
        size_t lead = pick(rng_);
        // Rotate the chosen primary to the front, the rest keep their order
        std::rotate(primary.begin(), primary.begin() + static_cast<std::ptrdiff_t>(lead),
                    primary.begin() + static_cast<std::ptrdiff_t>(lead) + 1);
    }

    primary.insert(primary.end(), std::make_move_iterator(other.begin()), std::make_move_iterator(other.end()));
    return primary;
}

} // namespace meridian
