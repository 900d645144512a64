#include "haulgrade_test_helpers.h"

#include "sim/FootprintResolver.h"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <set>
#include <vector>

namespace
{

using test_support::pointAt;

std::set<grid::BinKey> keysOf(const grid::Lattice& lattice, const sim::Footprint& footprint)
{
    std::set<grid::BinKey> keys;
    for (const sim::FootprintCell& cell : footprint.cells)
    {
        keys.insert(lattice.bin(cell.binIndex).key);
    }
    return keys;
}

bool near(double a, double b, double tol = 1e-6)
{
    return std::abs(a - b) <= tol;
}

void checkRectangle(const grid::Lattice& lattice, const sim::FootprintResolver& resolver)
{
    const sim::PlanarSegment segment{{0.2, 2.5}, {3.8, 2.5}};
    const sim::Footprint footprint = resolver.rectangle(segment, 3.0);
    assert(!footprint.degenerate);
    assert(footprint.cells.size() == 12);

    const std::set<grid::BinKey> keys = keysOf(lattice, footprint);
    for (int bx = 0; bx <= 3; ++bx)
    {
        for (int by = 1; by <= 3; ++by)
        {
            assert((keys.count({bx, by}) == 1));
        }
    }
    assert((keys.count({4, 2}) == 0));
    assert((keys.count({0, 0}) == 0));

    for (const sim::FootprintCell& cell : footprint.cells)
    {
        assert(cell.along_m >= 0.0 && cell.along_m <= segment.length());
        assert(std::abs(cell.lateral_m) <= 1.5);
    }

    // Resolution does not touch the lattice, so a second pass is identical.
    const sim::Footprint again = resolver.rectangle(segment, 3.0);
    assert(again.cells.size() == footprint.cells.size());
    for (std::size_t i = 0; i < again.cells.size(); ++i)
    {
        assert(again.cells[i].binIndex == footprint.cells[i].binIndex);
        assert(again.cells[i].along_m == footprint.cells[i].along_m);
        assert(again.cells[i].lateral_m == footprint.cells[i].lateral_m);
    }
}

void checkDegenerate(const grid::Lattice& lattice, const sim::FootprintResolver& resolver)
{
    const sim::PlanarSegment point{{7.0, 1.3}, {7.0, 1.3}};
    const sim::Footprint footprint = resolver.rectangle(point, 3.0);
    assert(footprint.degenerate);
    assert(footprint.cells.size() == 1);
    assert((lattice.bin(footprint.cells.front().binIndex).key == grid::BinKey{4, 1}));
}

void checkStrip(const grid::Lattice& lattice, double angleDeg, const std::set<grid::BinKey>& expected)
{
    sim::EquipmentParams params = test_support::unitEquipment();
    params.width_m = 3.0;
    params.stripAngleDeg = angleDeg;
    const sim::FootprintResolver resolver(lattice, params);

    const sim::Footprint footprint = resolver.strip(test_support::binCenter(2, 2));
    assert(footprint.cells.size() == expected.size());
    assert(keysOf(lattice, footprint) == expected);
}

void checkStripAtTheEdge(const grid::Lattice& lattice)
{
    sim::EquipmentParams params = test_support::unitEquipment();
    params.width_m = 3.0;
    const sim::FootprintResolver resolver(lattice, params);

    // The off-lattice neighbour snaps back onto the corner bin and is not counted twice.
    const sim::Footprint footprint = resolver.strip(test_support::binCenter(0, 0));
    assert(footprint.cells.size() == 2);
    assert((keysOf(lattice, footprint) == std::set<grid::BinKey>{{0, 0}, {0, 1}}));
}

void checkDerivedSegments(const grid::Lattice& lattice)
{
    const sim::EquipmentParams params = test_support::unitEquipment();
    const sim::FootprintResolver resolver(lattice, params);
    const geo::LocalFrame& frame = lattice.frame();

    // Haul due east: the cut trails the start, the fill trails the end by the dump travel.
    sim::TripRecord trip = test_support::tripAt(1, pointAt(3.0, 2.0), pointAt(13.0, 2.0), 1.0);
    trip.cutLength_m = 2.0;
    const sim::PlanarSegment cut = resolver.cutSegment(trip);
    assert(near(cut.start.x, 1.0) && near(cut.start.y, 2.0));
    assert(near(cut.stop.x, 3.0) && near(cut.stop.y, 2.0));

    const sim::PlanarSegment fill = resolver.fillSegment(trip);
    assert(near(fill.stop.x, 13.0));
    assert(near(fill.start.x, 13.0 - params.dumpTravel_m));

    // Without a cut length the run comes from volume, width and the fallback depth.
    trip.cutLength_m.reset();
    const double expectedLength = 1.0 / (params.width_m * params.fallbackCutDepth_m);
    assert(near(resolver.cutSegment(trip).length(), expectedLength, 1e-6));

    // Start and end coincide: the recorded heading gives the direction.
    sim::TripRecord still = test_support::tripAt(2, pointAt(2.0, 2.0), pointAt(2.0, 2.0), 1.0);
    still.cutLength_m = 1.5;
    still.headingDeg = 0.0;
    const sim::PlanarSegment northCut = resolver.cutSegment(still);
    assert(near(northCut.start.x, 2.0) && near(northCut.start.y, 0.5));

    // No heading either: nothing to lay out.
    still.headingDeg.reset();
    assert(resolver.cutSegment(still).length() == 0.0);

    // Explicit geometry wins.
    sim::TripRecord detailed = trip;
    detailed.cutSegment = test_support::segmentAt(0.5, 0.5, 0.5, 4.5);
    const sim::PlanarSegment explicitCut = resolver.cutSegment(detailed);
    const glm::dvec2 expectedStart = frame.toLocal(detailed.cutSegment->start);
    assert(near(explicitCut.start.x, expectedStart.x) && near(explicitCut.stop.y, 4.5));
}

} // namespace

int main()
{
    const grid::Lattice lattice = test_support::makeUniformLattice(5, 5, 10.0, 9.0);
    assert(lattice.isValid());

    sim::EquipmentParams params = test_support::unitEquipment();
    const sim::FootprintResolver resolver(lattice, params);

    checkRectangle(lattice, resolver);
    checkDegenerate(lattice, resolver);
    // The default angle runs the strip north-south through the centre column.
    checkStrip(lattice, 0.0, {{2, 1}, {2, 2}, {2, 3}});
    checkStrip(lattice, 90.0, {{1, 2}, {2, 2}, {3, 2}});
    checkStripAtTheEdge(lattice);
    checkDerivedSegments(lattice);
    return 0;
}
