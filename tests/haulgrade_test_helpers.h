#pragma once

#include "common/Units.h"
#include "geo/Projector.h"
#include "grid/Binner.h"
#include "grid/Lattice.h"
#include "grid/Sample.h"
#include "sim/Equipment.h"
#include "sim/TripRecord.h"

#include <glm/vec2.hpp>

#include <optional>
#include <vector>

namespace test_support
{

constexpr double kPi = 3.14159265358979323846;

// Local frames in the tests are anchored at (0, 0).
inline geo::LocalFrame originFrame()
{
    return geo::LocalFrame(geo::GeoPoint{0.0, 0.0});
}

// Inverse of the equirectangular projection around (0, 0).
inline geo::GeoPoint pointAt(double x, double y)
{
    const double radToDeg = 180.0 / kPi;
    return {y / geo::kEarthRadiusM * radToDeg, x / geo::kEarthRadiusM * radToDeg};
}

inline geo::GeoPoint binCenter(int bx, int by, double binSize = 1.0)
{
    return pointAt((static_cast<double>(bx) + 0.5) * binSize, (static_cast<double>(by) + 0.5) * binSize);
}

struct CellSpec
{
    int bx{0};
    int by{0};
    std::optional<double> zExist;
    std::optional<double> zProp;
};

inline std::vector<grid::Sample> samplesFor(const std::vector<CellSpec>& cells, double binSize)
{
    std::vector<grid::Sample> samples;
    samples.reserve(cells.size());
    for (const CellSpec& cell : cells)
    {
        grid::Sample sample;
        sample.position = binCenter(cell.bx, cell.by, binSize);
        sample.zExist = cell.zExist;
        sample.zProp = cell.zProp;
        samples.push_back(sample);
    }
    return samples;
}

// One sample per cell, placed at the cell centre.
inline grid::Lattice makeLattice(const std::vector<CellSpec>& cells, double binSize = 1.0)
{
    const geo::LocalFrame frame = originFrame();
    const grid::Binner binner(binSize);
    grid::Lattice lattice;
    lattice.build(binner.bin(samplesFor(cells, binSize), frame), frame, binSize);
    return lattice;
}

inline grid::Lattice makeUniformLattice(int nx, int ny, double zExist, double zProp, double binSize = 1.0)
{
    std::vector<CellSpec> cells;
    for (int by = 0; by < ny; ++by)
    {
        for (int bx = 0; bx < nx; ++bx)
        {
            cells.push_back({bx, by, zExist, zProp});
        }
    }
    return makeLattice(cells, binSize);
}

// 1 m bins, 1 m blade, no bulking, so cut and fill move the same volume.
inline sim::EquipmentParams unitEquipment()
{
    sim::EquipmentParams params = sim::makeDefaultEquipment();
    params.binSize_m = 1.0;
    params.width_m = 1.0;
    params.swell = 1.0;
    params.shrink = 1.0;
    params.ensureValid();
    return params;
}

inline double bcyFor(double cubicMeters)
{
    return cubicMeters * common::kCubicYardsPerCubicMeter;
}

inline sim::TripRecord tripAt(int index, const geo::GeoPoint& start, const geo::GeoPoint& end, double bank_m3)
{
    sim::TripRecord trip;
    trip.tripIndex = index;
    trip.start = start;
    trip.end = end;
    trip.bankCubicYards = bcyFor(bank_m3);
    return trip;
}

inline sim::GeoSegment segmentAt(double x0, double y0, double x1, double y1)
{
    return {pointAt(x0, y0), pointAt(x1, y1)};
}

} // namespace test_support
