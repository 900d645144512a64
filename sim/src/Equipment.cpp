#include "sim/Equipment.h"

#include <algorithm>
#include <cmath>

namespace sim
{

namespace
{
constexpr double kMinBinSize = 0.01;
constexpr double kMinWidth = 0.01;
constexpr double kMinReferenceDepth = 1e-6;
}

void EquipmentParams::ensureValid()
{
    binSize_m = std::max(binSize_m, kMinBinSize);
    width_m = std::max(width_m, kMinWidth);
    maxCutDepth_m = std::max(maxCutDepth_m, 0.0);
    swell = std::max(swell, 0.0);
    shrink = std::max(shrink, 0.0);
    dumpTravel_m = std::max(dumpTravel_m, 0.0);
    if (!(cubicYardsPerCubicMeter > 0.0))
    {
        cubicYardsPerCubicMeter = 1.30795061931439;
    }
    fallbackCutDepth_m = std::max(fallbackCutDepth_m, kMinReferenceDepth);
    profileReferenceDepth_m = std::max(profileReferenceDepth_m, kMinReferenceDepth);
    minProfileWeight = std::max(minProfileWeight, 0.0);
    degenerateLength_m = std::max(degenerateLength_m, 0.0);
    if (!std::isfinite(stripAngleDeg))
    {
        stripAngleDeg = 0.0;
    }
}

int EquipmentParams::widthInBins() const noexcept
{
    return std::max(1, static_cast<int>(std::ceil(width_m / binSize_m)));
}

EquipmentParams makeDefaultEquipment()
{
    EquipmentParams params;
    params.name = "Pull scraper 15 ft";
    params.ensureValid();
    return params;
}

const char* modeName(EvolutionMode mode)
{
    switch (mode)
    {
    case EvolutionMode::Strip: return "strip";
    case EvolutionMode::Blade: return "blade";
    }
    return "blade";
}

void RunOptions::ensureValid()
{
    notifyEvery = std::max<std::size_t>(1, notifyEvery);
}

} // namespace sim
