/**
 * @file geo_utils.cpp
 * @brief Geodesic helpers implementation.
 */

#include "geo_utils.hpp"

#include <cmath>
#include <limits>

namespace ch_routing::geo_utils {

double haversine_distance(const GeoPoint& a, const GeoPoint& b) {
    return bg::distance(a, b, bg::strategy::distance::haversine<double>(kEarthRadiusMeters));
}

double initial_bearing(const GeoPoint& a, const GeoPoint& b) {
    const double lat1 = lat_of(a) * M_PI / 180.0;
    const double lat2 = lat_of(b) * M_PI / 180.0;
    const double dlon = (lon_of(b) - lon_of(a)) * M_PI / 180.0;

    double y = std::sin(dlon) * std::cos(lat2);
    double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
    double deg = std::atan2(y, x) * 180.0 / M_PI;
    return std::fmod(deg + 360.0, 360.0);
}

double bearing_difference(double from_bearing, double to_bearing) {
    double diff = std::fabs(from_bearing - to_bearing);
    diff = std::fmod(diff, 360.0);
    return diff > 180.0 ? 360.0 - diff : diff;
}

static int32_t cell_index(double coord, double cell_size) {
    constexpr double lo = std::numeric_limits<int32_t>::min();
    constexpr double hi = std::numeric_limits<int32_t>::max();
    double idx = std::floor(coord / cell_size);
    if (!(idx >= lo)) return std::numeric_limits<int32_t>::min();
    if (idx > hi) return std::numeric_limits<int32_t>::max();
    return static_cast<int32_t>(idx);
}

std::pair<int32_t, int32_t> grid_cell(const GeoPoint& p, double cell_size) {
    return {cell_index(lon_of(p), cell_size), cell_index(lat_of(p), cell_size)};
}

}  // namespace ch_routing::geo_utils
