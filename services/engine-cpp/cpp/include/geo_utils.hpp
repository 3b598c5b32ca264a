/**
 * @file geo_utils.hpp
 * @brief Geodesic helpers for snapping, edge lengths and turn angles.
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <utility>

#include "routing_types.hpp"

namespace ch_routing::geo_utils {

constexpr double kEarthRadiusMeters = 6371000.0;

/// Length of one degree of latitude on the haversine sphere.
constexpr double kMetersPerDegree = kEarthRadiusMeters * M_PI / 180.0;

/**
 * @brief Great-circle distance in meters.
 */
double haversine_distance(const GeoPoint& a, const GeoPoint& b);

/**
 * @brief Initial bearing from a to b, degrees clockwise from north in [0, 360).
 */
double initial_bearing(const GeoPoint& a, const GeoPoint& b);

/**
 * @brief Absolute difference of two bearings folded into [0, 180].
 */
double bearing_difference(double from_bearing, double to_bearing);

/**
 * @brief Grid cell coordinates of a point for a square cell of `cell_size` degrees.
 *
 * Indices saturate at the int32 range; non-finite coordinates map to the lowest cell.
 */
std::pair<int32_t, int32_t> grid_cell(const GeoPoint& p, double cell_size);

/**
 * @brief Pack a grid cell into a single hash key.
 */
inline uint64_t cell_key(int32_t cx, int32_t cy) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(cx)) << 32) | static_cast<uint32_t>(cy);
}

}  // namespace ch_routing::geo_utils
