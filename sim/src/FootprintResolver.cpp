#include "sim/FootprintResolver.h"

#include "common/Enforce.h"

#include <glm/common.hpp>
#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace sim
{

namespace
{

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

// Compass heading (0 = north, clockwise) to a planar east/north unit vector.
glm::dvec2 headingToUnit(double headingDeg)
{
    const double rad = headingDeg * kDegToRad;
    return {std::sin(rad), std::cos(rad)};
}

} // namespace

double PlanarSegment::length() const noexcept
{
    return glm::length(stop - start);
}

FootprintResolver::FootprintResolver(const grid::Lattice& lattice, const EquipmentParams& params)
    : m_lattice(lattice)
    , m_params(params)
{
    ENFORCE(lattice.isValid(), "footprints need a built lattice");
}

std::optional<glm::dvec2> FootprintResolver::travelDirection(const TripRecord& trip) const
{
    const geo::LocalFrame& frame = m_lattice.frame();
    const glm::dvec2 delta = frame.toLocal(trip.end) - frame.toLocal(trip.start);
    const double length = glm::length(delta);
    if (length > m_params.degenerateLength_m)
    {
        return delta / length;
    }
    if (trip.headingDeg && std::isfinite(*trip.headingDeg))
    {
        return headingToUnit(*trip.headingDeg);
    }
    return std::nullopt;
}

double FootprintResolver::estimatedCutLength(const TripRecord& trip) const
{
    if (trip.cutLength_m && std::isfinite(*trip.cutLength_m))
    {
        return std::max(0.0, *trip.cutLength_m);
    }

    const double bankM3 = trip.bankCubicYards / m_params.cubicYardsPerCubicMeter;
    const double depth = std::min(m_params.maxCutDepth_m, m_params.fallbackCutDepth_m);
    const double denom = m_params.width_m * depth;
    if (denom <= 0.0)
    {
        return 0.0;
    }
    return std::max(0.0, bankM3 / denom);
}

PlanarSegment FootprintResolver::cutSegment(const TripRecord& trip) const
{
    const geo::LocalFrame& frame = m_lattice.frame();
    if (trip.cutSegment)
    {
        return {frame.toLocal(trip.cutSegment->start), frame.toLocal(trip.cutSegment->stop)};
    }

    // The cut ends where the haul starts and reaches back along the haul direction.
    const glm::dvec2 stop = frame.toLocal(trip.start);
    const auto direction = travelDirection(trip);
    if (!direction)
    {
        return {stop, stop};
    }
    return {stop - *direction * estimatedCutLength(trip), stop};
}

PlanarSegment FootprintResolver::fillSegment(const TripRecord& trip) const
{
    const geo::LocalFrame& frame = m_lattice.frame();
    if (trip.fillSegment)
    {
        return {frame.toLocal(trip.fillSegment->start), frame.toLocal(trip.fillSegment->stop)};
    }

    const glm::dvec2 stop = frame.toLocal(trip.end);
    const auto direction = travelDirection(trip);
    if (!direction)
    {
        return {stop, stop};
    }
    return {stop - *direction * m_params.dumpTravel_m, stop};
}

Footprint FootprintResolver::rectangle(const PlanarSegment& segment, double width_m) const
{
    ENFORCE_POSITIVE(width_m, "footprint width must be positive");

    Footprint footprint;
    footprint.segment = segment;

    const glm::dvec2 axis = segment.stop - segment.start;
    const double length = glm::length(axis);
    if (length < m_params.degenerateLength_m)
    {
        footprint.degenerate = true;
        if (const auto idx = m_lattice.nearestIndex(segment.start))
        {
            const glm::dvec2 offset = m_lattice.bin(*idx).position - segment.start;
            footprint.cells.push_back({*idx, 0.0, glm::length(offset)});
        }
        return footprint;
    }

    const glm::dvec2 along = axis / length;
    const glm::dvec2 normal{-along.y, along.x};
    const double halfWidth = width_m * 0.5;

    const glm::dvec2 boxMin = glm::min(segment.start, segment.stop) - glm::dvec2(halfWidth);
    const glm::dvec2 boxMax = glm::max(segment.start, segment.stop) + glm::dvec2(halfWidth);
    const grid::BinKey keyMin = m_lattice.keyFor(boxMin);
    const grid::BinKey keyMax = m_lattice.keyFor(boxMax);
    const grid::LatticeBounds& bounds = m_lattice.bounds();

    const int bxMin = std::max(keyMin.bx, bounds.minBx);
    const int bxMax = std::min(keyMax.bx, bounds.maxBx);
    const int byMin = std::max(keyMin.by, bounds.minBy);
    const int byMax = std::min(keyMax.by, bounds.maxBy);

    for (int bx = bxMin; bx <= bxMax; ++bx)
    {
        for (int by = byMin; by <= byMax; ++by)
        {
            const auto idx = m_lattice.indexOf({bx, by});
            if (!idx)
            {
                continue;
            }

            const glm::dvec2 rel = m_lattice.bin(*idx).position - segment.start;
            const double s = glm::dot(rel, along);
            const double t = glm::dot(rel, normal);
            if (s >= 0.0 && s <= length && std::abs(t) <= halfWidth)
            {
                footprint.cells.push_back({*idx, s, t});
            }
        }
    }

    return footprint;
}

Footprint FootprintResolver::strip(const geo::GeoPoint& location) const
{
    Footprint footprint;
    const glm::dvec2 xy = m_lattice.frame().toLocal(location);
    footprint.segment = {xy, xy};

    const auto centerIdx = m_lattice.locate(xy);
    if (!centerIdx)
    {
        return footprint;
    }

    // TODO: lay the strip across the haul direction once strip mode is agreed to follow it;
    // it still uses the configured static angle.
    const double angle = m_params.stripAngleDeg * kDegToRad;
    const glm::dvec2 across{-std::sin(angle), std::cos(angle)};

    const glm::dvec2 center = m_lattice.bin(*centerIdx).position;
    const double binSize = m_lattice.binSize();
    const int half = m_params.widthInBins() / 2;

    std::unordered_set<std::uint32_t> seen;
    for (int w = -half; w <= half; ++w)
    {
        const double offset = static_cast<double>(w) * binSize;
        const auto idx = m_lattice.locate(center + across * offset);
        if (!idx || !seen.insert(*idx).second)
        {
            continue;
        }
        footprint.cells.push_back({*idx, 0.0, offset});
    }

    return footprint;
}

Footprint FootprintResolver::cutFootprint(const TripRecord& trip, EvolutionMode mode) const
{
    if (mode == EvolutionMode::Strip)
    {
        return strip(trip.start);
    }
    return rectangle(cutSegment(trip), m_params.width_m);
}

Footprint FootprintResolver::fillFootprint(const TripRecord& trip, EvolutionMode mode) const
{
    if (mode == EvolutionMode::Strip)
    {
        return strip(trip.end);
    }
    return rectangle(fillSegment(trip), m_params.width_m);
}

} // namespace sim
