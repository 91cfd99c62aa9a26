#ifndef MERIDIAN_REGION_SELECTOR_H
#define MERIDIAN_REGION_SELECTOR_H

#include <meridian/endpoint.h>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace meridian {

/**
 * @brief Orders the currently usable regions of a snapshot.
 *
 * Regions still cooling down (next_available_time > now) are dropped. With
 * primary preference on, eligible primaries come first and one of them,
 * chosen uniformly at random, leads; everything else keeps snapshot order.
 */
class RegionSelector {
public:
    explicit RegionSelector(bool primary_preference = true);
    RegionSelector(bool primary_preference, uint32_t seed);

    std::vector<std::string> select(const EndpointSnapshot& records, int64_t now);

    bool primary_preference() const { return primary_preference_; }

private:
    bool primary_preference_;
    std::mt19937 rng_;
};

} // namespace meridian

#endif // MERIDIAN_REGION_SELECTOR_H
