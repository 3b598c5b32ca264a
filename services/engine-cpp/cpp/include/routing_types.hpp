/**
 * @file routing_types.hpp
 * @brief Identifiers, coordinates and error reporting shared by the routing core.
 */

#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>

namespace ch_routing {

namespace bg = boost::geometry;

/// Coordinates are (lon, lat) in degrees.
using GeoPoint = bg::model::point<double, 2, bg::cs::spherical_equatorial<bg::degree>>;

using NodeId = uint32_t;
using EdgeId = uint32_t;

constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();
constexpr EdgeId kInvalidEdge = std::numeric_limits<EdgeId>::max();

inline GeoPoint make_point(double lon, double lat) { return GeoPoint(lon, lat); }
inline double lon_of(const GeoPoint& p) { return bg::get<0>(p); }
inline double lat_of(const GeoPoint& p) { return bg::get<1>(p); }

/**
 * @brief Error taxonomy of the routing core.
 */
enum class ErrorCode {
    Ok,
    InvalidCoordinates,  ///< Origin/destination could not be snapped to a node
    GraphConstruction,   ///< Adjacency/edge inconsistency
    EdgeNotFound,        ///< Adjacency references a missing edge id
    NoRouteFound,        ///< Search exhausted without a meeting node
    NodeNotFound,        ///< Query node id outside the graph
    Io                   ///< Persistence failure
};

const char* to_string(ErrorCode code);

/**
 * @brief Outcome of a structural check.
 */
struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string message;

    bool ok() const { return code == ErrorCode::Ok; }

    static Status success() { return {}; }
    static Status failure(ErrorCode code, std::string message) { return {code, std::move(message)}; }
};

/**
 * @brief Thrown when a graph or hierarchy cannot be built.
 */
class RoutingError : public std::runtime_error {
public:
    RoutingError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    explicit RoutingError(const Status& status)
        : RoutingError(status.code, status.message) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

}  // namespace ch_routing
