#include "geo/Projector.h"

#include <cmath>

namespace geo
{

namespace
{
constexpr double kDegToRad = 3.14159265358979323846 / 180.0;
}

glm::dvec2 toLocalXY(double latDeg, double lonDeg, double lat0Deg, double lon0Deg) noexcept
{
    const double lat = latDeg * kDegToRad;
    const double lon = lonDeg * kDegToRad;
    const double lat0 = lat0Deg * kDegToRad;
    const double lon0 = lon0Deg * kDegToRad;

    const double x = kEarthRadiusM * std::cos(lat0) * (lon - lon0);
    const double y = kEarthRadiusM * (lat - lat0);
    return {x, y};
}

double haversineDistance(double lat1Deg, double lon1Deg, double lat2Deg, double lon2Deg) noexcept
{
    const double lat1 = lat1Deg * kDegToRad;
    const double lat2 = lat2Deg * kDegToRad;
    const double dLat = lat2 - lat1;
    const double dLon = (lon2Deg - lon1Deg) * kDegToRad;

    const double sinLat = std::sin(dLat * 0.5);
    const double sinLon = std::sin(dLon * 0.5);
    const double a = sinLat * sinLat + std::cos(lat1) * std::cos(lat2) * sinLon * sinLon;
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return kEarthRadiusM * c;
}

double haversineDistance(const GeoPoint& a, const GeoPoint& b) noexcept
{
    return haversineDistance(a.lat, a.lon, b.lat, b.lon);
}

std::optional<GeoPoint> centroidOf(const std::vector<GeoPoint>& points)
{
    if (points.empty())
    {
        return std::nullopt;
    }

    double sumLat = 0.0;
    double sumLon = 0.0;
    for (const GeoPoint& p : points)
    {
        sumLat += p.lat;
        sumLon += p.lon;
    }

    const double count = static_cast<double>(points.size());
    return GeoPoint{sumLat / count, sumLon / count};
}

} // namespace geo
