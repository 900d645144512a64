#pragma once

#include <glm/vec2.hpp>

#include <optional>
#include <vector>

namespace geo
{

constexpr double kEarthRadiusM = 6'371'000.0;

struct GeoPoint
{
    double lat{0.0};
    double lon{0.0};
};

// Equirectangular east/north offsets in meters from (lat0Deg, lon0Deg).
[[nodiscard]] glm::dvec2 toLocalXY(double latDeg, double lonDeg, double lat0Deg, double lon0Deg) noexcept;

// Great-circle distance in meters. Trip lengths are reported from geographic
// inputs with this; footprint geometry stays planar.
[[nodiscard]] double haversineDistance(double lat1Deg, double lon1Deg, double lat2Deg, double lon2Deg) noexcept;
[[nodiscard]] double haversineDistance(const GeoPoint& a, const GeoPoint& b) noexcept;

// Arithmetic mean of the points, or nothing for an empty range.
[[nodiscard]] std::optional<GeoPoint> centroidOf(const std::vector<GeoPoint>& points);

class LocalFrame
{
public:
    LocalFrame() = default;
    explicit LocalFrame(const GeoPoint& anchor) noexcept
        : m_anchor(anchor)
    {
    }

    [[nodiscard]] const GeoPoint& anchor() const noexcept { return m_anchor; }
    [[nodiscard]] double lat0() const noexcept { return m_anchor.lat; }
    [[nodiscard]] double lon0() const noexcept { return m_anchor.lon; }

    [[nodiscard]] glm::dvec2 toLocal(double latDeg, double lonDeg) const noexcept
    {
        return toLocalXY(latDeg, lonDeg, m_anchor.lat, m_anchor.lon);
    }

    [[nodiscard]] glm::dvec2 toLocal(const GeoPoint& point) const noexcept
    {
        return toLocal(point.lat, point.lon);
    }

private:
    GeoPoint m_anchor{};
};

} // namespace geo
