#pragma once

#include <cstddef>
#include <string>

namespace sim
{

struct EquipmentParams
{
    std::string name;
    double binSize_m{0.6096};
    double width_m{4.572};
    double maxCutDepth_m{0.06096};
    double swell{1.30};
    double shrink{0.64};
    double dumpTravel_m{5.0};
    double cubicYardsPerCubicMeter{1.30795061931439};
    // Fixed depth used when a cut length has to be estimated from volume alone.
    double fallbackCutDepth_m{0.06096};
    // Profile depths are weighted relative to this depth, never below minProfileWeight.
    double profileReferenceDepth_m{0.1};
    double minProfileWeight{0.1};
    double degenerateLength_m{1e-6};
    // Strip direction angle; cells are laid along (-sin, cos) of it, so 0 gives a north-south strip.
    double stripAngleDeg{0.0};

    void ensureValid();

    [[nodiscard]] double binArea() const noexcept { return binSize_m * binSize_m; }
    [[nodiscard]] double netFactor() const noexcept { return swell * shrink; }
    [[nodiscard]] int widthInBins() const noexcept;
};

EquipmentParams makeDefaultEquipment();

enum class EvolutionMode
{
    Strip,
    Blade
};

const char* modeName(EvolutionMode mode);

struct RunOptions
{
    // 0 replays every trip.
    std::size_t maxTrips{0};
    // Observers see every Nth trip in replay order; skipped trips are not reported.
    std::size_t notifyEvery{1};

    void ensureValid();
};

} // namespace sim
