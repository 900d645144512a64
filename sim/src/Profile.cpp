#include "sim/Profile.h"

#include <algorithm>
#include <utility>

namespace sim
{

Profile::Profile(std::vector<ProfilePoint> points)
    : m_points(std::move(points))
{
    std::stable_sort(m_points.begin(), m_points.end(), [](const ProfilePoint& lhs, const ProfilePoint& rhs) {
        return lhs.distance_m < rhs.distance_m;
    });
}

std::optional<Profile> Profile::fromPoints(std::vector<ProfilePoint> points)
{
    if (points.empty())
    {
        return std::nullopt;
    }
    return Profile(std::move(points));
}

double Profile::depthAt(double distance_m) const noexcept
{
    if (m_points.empty())
    {
        return 0.0;
    }
    if (distance_m <= m_points.front().distance_m)
    {
        return m_points.front().depth_m;
    }
    if (distance_m >= m_points.back().distance_m)
    {
        return m_points.back().depth_m;
    }

    const auto upper = std::upper_bound(m_points.begin(), m_points.end(), distance_m,
                                        [](double d, const ProfilePoint& p) { return d < p.distance_m; });
    const ProfilePoint& hi = *upper;
    const ProfilePoint& lo = *(upper - 1);

    const double span = hi.distance_m - lo.distance_m;
    if (span <= 0.0)
    {
        return lo.depth_m;
    }
    const double t = (distance_m - lo.distance_m) / span;
    return lo.depth_m + t * (hi.depth_m - lo.depth_m);
}

} // namespace sim
