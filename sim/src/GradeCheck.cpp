#include "sim/GradeCheck.h"

#include <algorithm>
#include <cmath>

namespace sim
{

GradeReport assessGrade(const grid::Lattice& lattice, double tolerance_m)
{
    GradeReport report;
    report.tolerance_m = std::isfinite(tolerance_m) ? std::abs(tolerance_m) : kDefaultGradeTolerance_m;
    report.binCount = lattice.size();

    const double area = lattice.binArea();
    double sumAbs = 0.0;

    for (const grid::Bin& bin : lattice.bins())
    {
        const double deviation = bin.zCur - bin.zProp;
        const double absDeviation = std::abs(deviation);

        if (deviation > report.tolerance_m)
        {
            ++report.aboveTolerance;
        }
        else if (deviation < -report.tolerance_m)
        {
            ++report.belowTolerance;
        }
        else
        {
            ++report.withinTolerance;
        }

        if (deviation > 0.0)
        {
            report.remainingCut_m3 += deviation * area;
        }
        else
        {
            report.remainingFill_m3 += -deviation * area;
        }

        sumAbs += absDeviation;
        report.maxAbsDeviation_m = std::max(report.maxAbsDeviation_m, absDeviation);

        if (bin.zExistMean && *bin.zExistMean != 0.0)
        {
            const double z = *bin.zExistMean;
            report.minExisting_m = report.minExisting_m ? std::min(*report.minExisting_m, z) : z;
            report.maxExisting_m = report.maxExisting_m ? std::max(*report.maxExisting_m, z) : z;
        }
    }

    if (report.binCount > 0)
    {
        report.meanAbsDeviation_m = sumAbs / static_cast<double>(report.binCount);
    }
    return report;
}

} // namespace sim
