#pragma once

#include "geo/Projector.h"
#include "sim/Profile.h"

#include <optional>
#include <vector>

namespace sim
{

struct GeoSegment
{
    geo::GeoPoint start{};
    geo::GeoPoint stop{};
};

struct TripRecord
{
    int tripIndex{0};
    double bankCubicYards{0.0};
    geo::GeoPoint start{};
    geo::GeoPoint end{};

    std::optional<GeoSegment> cutSegment;
    std::optional<GeoSegment> fillSegment;
    std::optional<double> cutLength_m;
    std::optional<double> headingDeg;
    std::optional<Profile> cutProfile;
    std::optional<Profile> fillProfile;

    [[nodiscard]] bool hasDetailedGeometry() const noexcept
    {
        return cutSegment.has_value() && fillSegment.has_value();
    }

    // Great-circle distance from start to end.
    [[nodiscard]] double haulDistance_m() const noexcept;
};

// Stable ascending sort by trip index; replay order depends on it.
void sortByTripIndex(std::vector<TripRecord>& trips);

} // namespace sim
