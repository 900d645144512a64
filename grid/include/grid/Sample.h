#pragma once

#include "geo/Projector.h"

#include <optional>
#include <vector>

namespace grid
{

struct Sample
{
    geo::GeoPoint position{};
    std::optional<double> zExist;
    std::optional<double> zProp;
};

// Projection anchor for a run: the mean of all sample coordinates.
[[nodiscard]] std::optional<geo::GeoPoint> sampleCentroid(const std::vector<Sample>& samples);

} // namespace grid
