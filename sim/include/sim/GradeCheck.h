#pragma once

#include "grid/Lattice.h"

#include <cstddef>
#include <optional>

namespace sim
{

// 0.1 ft.
constexpr double kDefaultGradeTolerance_m = 0.03048;

struct GradeReport
{
    double tolerance_m{kDefaultGradeTolerance_m};
    std::size_t binCount{0};
    std::size_t aboveTolerance{0};
    std::size_t belowTolerance{0};
    std::size_t withinTolerance{0};
    // Volume still to move before every bin sits on its proposed elevation.
    double remainingCut_m3{0.0};
    double remainingFill_m3{0.0};
    double maxAbsDeviation_m{0.0};
    double meanAbsDeviation_m{0.0};
    // Existing-elevation range, zero elevations excluded.
    std::optional<double> minExisting_m;
    std::optional<double> maxExisting_m;

    [[nodiscard]] double withinFraction() const noexcept
    {
        return binCount == 0 ? 0.0 : static_cast<double>(withinTolerance) / static_cast<double>(binCount);
    }
};

[[nodiscard]] GradeReport assessGrade(const grid::Lattice& lattice, double tolerance_m = kDefaultGradeTolerance_m);

} // namespace sim
