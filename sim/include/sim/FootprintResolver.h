#pragma once

#include "grid/Lattice.h"
#include "sim/Equipment.h"
#include "sim/TripRecord.h"

#include <glm/vec2.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace sim
{

struct PlanarSegment
{
    glm::dvec2 start{0.0};
    glm::dvec2 stop{0.0};

    [[nodiscard]] double length() const noexcept;
};

struct FootprintCell
{
    std::uint32_t binIndex{0};
    double along_m{0.0};   // s: distance from the segment start along its axis
    double lateral_m{0.0}; // t: signed offset from the axis
};

struct Footprint
{
    PlanarSegment segment{};
    std::vector<FootprintCell> cells;
    bool degenerate{false};

    [[nodiscard]] bool empty() const noexcept { return cells.empty(); }
};

// Maps a trip's cut and fill locations onto lattice bins. Read-only with
// respect to the lattice, so resolving twice yields the same cells.
class FootprintResolver
{
public:
    FootprintResolver(const grid::Lattice& lattice, const EquipmentParams& params);

    [[nodiscard]] PlanarSegment cutSegment(const TripRecord& trip) const;
    [[nodiscard]] PlanarSegment fillSegment(const TripRecord& trip) const;

    // Bins whose positions fall inside the width_m rectangle centred on the segment axis.
    [[nodiscard]] Footprint rectangle(const PlanarSegment& segment, double width_m) const;

    // Equipment-wide strip of bins centred on the bin under location.
    [[nodiscard]] Footprint strip(const geo::GeoPoint& location) const;

    [[nodiscard]] Footprint cutFootprint(const TripRecord& trip, EvolutionMode mode) const;
    [[nodiscard]] Footprint fillFootprint(const TripRecord& trip, EvolutionMode mode) const;

private:
    [[nodiscard]] std::optional<glm::dvec2> travelDirection(const TripRecord& trip) const;
    [[nodiscard]] double estimatedCutLength(const TripRecord& trip) const;

    const grid::Lattice& m_lattice;
    EquipmentParams m_params;
};

} // namespace sim
