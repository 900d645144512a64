#include "haulgrade_test_helpers.h"

#include "sim/GradeCheck.h"

#include <cassert>
#include <cmath>
#include <cstdint>

namespace
{

bool near(double a, double b, double tol = 1e-9)
{
    return std::abs(a - b) <= tol;
}

} // namespace

int main()
{
    // One bin high by 0.5 m, one low by 0.2 m, one within 0.01 m, and one
    // on grade whose existing elevation is exactly zero.
    grid::Lattice lattice = test_support::makeLattice({
        {0, 0, 10.5, 10.0},
        {1, 0, 9.8, 10.0},
        {2, 0, 10.01, 10.0},
        {3, 0, 0.0, 0.0},
    });
    assert(lattice.isValid());

    sim::GradeReport report = sim::assessGrade(lattice);
    assert(report.binCount == 4);
    assert(near(report.tolerance_m, 0.03048));
    assert(report.aboveTolerance == 1);
    assert(report.belowTolerance == 1);
    assert(report.withinTolerance == 2);
    assert(near(report.withinFraction(), 0.5));
    assert(near(report.remainingCut_m3, 0.51));
    assert(near(report.remainingFill_m3, 0.2));
    assert(near(report.maxAbsDeviation_m, 0.5));
    assert(near(report.meanAbsDeviation_m, (0.5 + 0.2 + 0.01) / 4.0));

    // Zero elevations are treated as missing survey data for the range.
    assert(report.minExisting_m && near(*report.minExisting_m, 9.8));
    assert(report.maxExisting_m && near(*report.maxExisting_m, 10.5));

    // Widening the tolerance pulls the low bin into the band.
    report = sim::assessGrade(lattice, 0.25);
    assert(report.belowTolerance == 0);
    assert(report.withinTolerance == 3);

    // Finishing the work puts everything on grade.
    for (std::uint32_t i = 0; i < lattice.size(); ++i)
    {
        lattice.bin(i).zCur = lattice.bin(i).zProp;
    }
    report = sim::assessGrade(lattice);
    assert(report.withinTolerance == 4);
    assert(near(report.remainingCut_m3, 0.0));
    assert(near(report.remainingFill_m3, 0.0));
    assert(near(report.maxAbsDeviation_m, 0.0));

    const sim::GradeReport empty = sim::assessGrade(grid::Lattice{});
    assert(empty.binCount == 0);
    assert(empty.withinFraction() == 0.0);
    assert(!empty.minExisting_m);
    return 0;
}
