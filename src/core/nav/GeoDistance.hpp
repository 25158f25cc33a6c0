#pragma once

#include "RouteTypes.hpp"

namespace fnav {
namespace nav {

constexpr double kEarthRadiusMeters = 6371000.0;

/// Great-circle distance in meters (haversine).
double distanceMeters(const GeoPoint& a, const GeoPoint& b);

} // namespace nav
} // namespace fnav
