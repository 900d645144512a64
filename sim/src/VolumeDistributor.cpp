#include "sim/VolumeDistributor.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace sim
{

namespace
{

struct Candidate
{
    std::uint32_t binIndex{0};
    double capacity{0.0};
    double weight{0.0};
};

double finiteNonNegative(double value)
{
    return std::isfinite(value) ? std::max(0.0, value) : 0.0;
}

// Splits min(volume, total weight) over the candidates by weight, each share
// limited to the candidate's real capacity.
DistributionResult allocate(const std::vector<Candidate>& candidates,
                            double volume_m3,
                            const ApplyFn& apply)
{
    DistributionResult result;
    result.requested_m3 = finiteNonNegative(volume_m3);

    double totalWeight = 0.0;
    for (const Candidate& c : candidates)
    {
        totalWeight += c.weight;
    }

    if (totalWeight <= 0.0 || result.requested_m3 <= 0.0)
    {
        result.discarded_m3 = result.requested_m3;
        return result;
    }

    const double remaining = std::min(result.requested_m3, totalWeight);
    for (const Candidate& c : candidates)
    {
        if (c.weight <= 0.0 || c.capacity <= 0.0)
        {
            continue;
        }
        const double take = std::min(remaining * (c.weight / totalWeight), c.capacity);
        if (take <= 0.0)
        {
            continue;
        }
        result.placed_m3 += apply(c.binIndex, take);
        ++result.binsTouched;
    }

    result.discarded_m3 = std::max(0.0, result.requested_m3 - result.placed_m3);
    return result;
}

std::vector<Candidate> collect(const Footprint& footprint, const CapacityFn& capacity)
{
    std::vector<Candidate> candidates;
    candidates.reserve(footprint.cells.size());
    for (const FootprintCell& cell : footprint.cells)
    {
        const double cap = finiteNonNegative(capacity(cell.binIndex));
        candidates.push_back({cell.binIndex, cap, cap});
    }
    return candidates;
}

} // namespace

DistributionResult VolumeDistributor::uniform(const Footprint& footprint,
                                              double volume_m3,
                                              const CapacityFn& capacity,
                                              const ApplyFn& apply)
{
    DistributionResult result;
    result.requested_m3 = finiteNonNegative(volume_m3);
    if (footprint.empty() || result.requested_m3 <= 0.0)
    {
        result.discarded_m3 = result.requested_m3;
        return result;
    }

    const double share = result.requested_m3 / static_cast<double>(footprint.cells.size());
    for (const FootprintCell& cell : footprint.cells)
    {
        const double take = std::min(share, finiteNonNegative(capacity(cell.binIndex)));
        if (take <= 0.0)
        {
            continue;
        }
        result.placed_m3 += apply(cell.binIndex, take);
        ++result.binsTouched;
    }

    result.discarded_m3 = std::max(0.0, result.requested_m3 - result.placed_m3);
    return result;
}

DistributionResult VolumeDistributor::proportional(const Footprint& footprint,
                                                   double volume_m3,
                                                   const CapacityFn& capacity,
                                                   const ApplyFn& apply)
{
    return allocate(collect(footprint, capacity), volume_m3, apply);
}

DistributionResult VolumeDistributor::profileWeighted(const Footprint& footprint,
                                                      double volume_m3,
                                                      const Profile& profile,
                                                      const ProfileWeighting& weighting,
                                                      const CapacityFn& capacity,
                                                      const ApplyFn& apply)
{
    std::vector<Candidate> candidates = collect(footprint, capacity);
    const double reference = weighting.referenceDepth_m > 0.0 ? weighting.referenceDepth_m : 0.1;

    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        const double depth = profile.depthAt(footprint.cells[i].along_m);
        const double factor = std::max(weighting.minWeight, depth / reference);
        candidates[i].weight = candidates[i].capacity * finiteNonNegative(factor);
    }

    return allocate(candidates, volume_m3, apply);
}

} // namespace sim
