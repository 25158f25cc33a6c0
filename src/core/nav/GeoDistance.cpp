#include "GeoDistance.hpp"
#include <algorithm>
#include <cmath>

namespace fnav {
namespace nav {

namespace {

constexpr double kDegToRad = M_PI / 180.0;

} // namespace

double distanceMeters(const GeoPoint& a, const GeoPoint& b)
{
    const double dLat = (b.lat - a.lat) * kDegToRad;
    const double dLon = (b.lon - a.lon) * kDegToRad;
    const double lat1 = a.lat * kDegToRad;
    const double lat2 = b.lat * kDegToRad;

    // Rounding can push h marginally above 1 for antipodal points
    const double h = std::min(1.0, std::sin(dLat / 2) * std::sin(dLat / 2)
                   + std::cos(lat1) * std::cos(lat2) * std::sin(dLon / 2) * std::sin(dLon / 2));
    const double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));

    return kEarthRadiusMeters * c;
}

} // namespace nav
} // namespace fnav
