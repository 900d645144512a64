#pragma once

#include <optional>
#include <vector>

namespace sim
{

struct ProfilePoint
{
    double distance_m{0.0};
    double depth_m{0.0};
};

// Measured cut/fill cross-section along a segment, sorted by distance.
class Profile
{
public:
    // Nothing when no points are given; an empty profile is not a profile.
    [[nodiscard]] static std::optional<Profile> fromPoints(std::vector<ProfilePoint> points);

    [[nodiscard]] const std::vector<ProfilePoint>& points() const noexcept { return m_points; }
    [[nodiscard]] std::size_t size() const noexcept { return m_points.size(); }

    // Linear interpolation; clamps to the end depths outside the measured range.
    [[nodiscard]] double depthAt(double distance_m) const noexcept;

private:
    explicit Profile(std::vector<ProfilePoint> points);

    std::vector<ProfilePoint> m_points;
};

} // namespace sim
