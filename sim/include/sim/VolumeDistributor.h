#pragma once

#include "sim/FootprintResolver.h"
#include "sim/Profile.h"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace sim
{

struct DistributionResult
{
    double requested_m3{0.0};
    double placed_m3{0.0};
    double discarded_m3{0.0};
    std::size_t binsTouched{0};

    [[nodiscard]] bool applied() const noexcept { return binsTouched > 0; }
};

// Remaining room of a bin in m³.
using CapacityFn = std::function<double(std::uint32_t binIndex)>;
// Applies a volume to a bin and returns the volume it actually absorbed.
using ApplyFn = std::function<double(std::uint32_t binIndex, double volume_m3)>;

class VolumeDistributor
{
public:
    struct ProfileWeighting
    {
        double referenceDepth_m{0.1};
        double minWeight{0.1};
    };

    // Every cell gets volume / n, limited to its capacity.
    [[nodiscard]] static DistributionResult uniform(const Footprint& footprint,
                                                    double volume_m3,
                                                    const CapacityFn& capacity,
                                                    const ApplyFn& apply);

    // Shares proportional to capacity; no cell can receive more than its capacity.
    [[nodiscard]] static DistributionResult proportional(const Footprint& footprint,
                                                         double volume_m3,
                                                         const CapacityFn& capacity,
                                                         const ApplyFn& apply);

    // Capacity scaled by the profile depth at each cell's along-distance before
    // the proportional split; shares above a cell's real capacity are dropped.
    [[nodiscard]] static DistributionResult profileWeighted(const Footprint& footprint,
                                                            double volume_m3,
                                                            const Profile& profile,
                                                            const ProfileWeighting& weighting,
                                                            const CapacityFn& capacity,
                                                            const ApplyFn& apply);
};

} // namespace sim
