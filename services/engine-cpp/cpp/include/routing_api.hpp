/**
 * @file routing_api.hpp
 * @brief Query results, coordinate routing requests and the route algorithm interface.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <boost/geometry/geometries/linestring.hpp>

#include "graph_store.hpp"
#include "routing_config.hpp"
#include "routing_types.hpp"

namespace ch_routing {

/**
 * @brief Node-to-node query result.
 */
struct QueryResult {
    double distance = -1;                ///< Total routing weight, -1 if unreachable
    NodeId meeting_node = kInvalidNode;  ///< Node where forward and backward searches met
    bool reachable = false;              ///< True if a path was found
    ErrorCode error_code = ErrorCode::Ok;
    std::string error;                   ///< Error description if not reachable
    std::vector<EdgeId> path;            ///< Original edges, source to target (path queries only)
    size_t settled_nodes = 0;

    static QueryResult failure(ErrorCode code, std::string message) {
        QueryResult r;
        r.error_code = code;
        r.error = std::move(message);
        return r;
    }
};

/**
 * @brief Options for coordinate routing.
 */
struct RoutingOptions {
    bool include_geometry = true;
    bool include_segments = true;
    bool apply_turn_penalties = false;   ///< Add bearing-based turn penalties to duration
};

struct RoutingRequest {
    GeoPoint origin{0.0, 0.0};
    GeoPoint destination{0.0, 0.0};
    RoutingOptions options;
};

using RouteGeometry = bg::model::linestring<GeoPoint>;

/**
 * @brief One original edge of a route.
 */
struct RouteSegment {
    EdgeId edge = kInvalidEdge;
    NodeId from = kInvalidNode;
    NodeId to = kInvalidNode;
    double distance = 0.0;  ///< meters
    double duration = 0.0;  ///< base_time plus turn penalty into this edge, if enabled
};

/**
 * @brief Requested coordinate and the node it was snapped to.
 */
struct Waypoint {
    GeoPoint requested{0.0, 0.0};
    NodeId node = kInvalidNode;
    GeoPoint snapped{0.0, 0.0};
    double snap_distance = 0.0;  ///< meters
};

struct RoutingResponse {
    bool ok = false;
    ErrorCode error_code = ErrorCode::Ok;
    std::string error;

    double cost = 0.0;      ///< Routing weight of the path
    double distance = 0.0;  ///< meters
    double duration = 0.0;  ///< time units
    RouteGeometry geometry;
    std::vector<RouteSegment> segments;
    std::vector<Waypoint> waypoints;  ///< origin, destination

    static RoutingResponse failure(ErrorCode code, std::string message) {
        RoutingResponse r;
        r.error_code = code;
        r.error = std::move(message);
        return r;
    }
};

/**
 * @brief Coordinate-to-coordinate routing strategy.
 */
class RouteAlgorithm {
public:
    virtual ~RouteAlgorithm() = default;

    virtual RoutingResponse route(const RoutingRequest& request, const GraphStore& graph) const = 0;

    virtual const char* name() const = 0;
};

// ============================================================
// Shared helpers for RouteAlgorithm implementations
// ============================================================

/**
 * @brief Snap a coordinate to its nearest node.
 * @return nullopt if the coordinate is invalid or no node is in range
 */
std::optional<Waypoint> snap_waypoint(const GraphStore& graph, const GeoPoint& point);

/**
 * @brief Assemble a response from an edge path.
 *
 * Geometry starts at the origin node and follows each edge target. Segment
 * durations include the turn penalty into the edge when requested.
 */
RoutingResponse build_route_response(const GraphStore& graph,
                                     const QueryResult& result,
                                     const Waypoint& origin,
                                     const Waypoint& destination,
                                     const RoutingOptions& options,
                                     const TurnPenaltyTable& penalties);

/**
 * @brief Snap both endpoints, run `search` between them and build the response.
 */
RoutingResponse route_between(const RoutingRequest& request,
                              const GraphStore& graph,
                              const TurnPenaltyTable& penalties,
                              const std::function<QueryResult(NodeId, NodeId)>& search);

}  // namespace ch_routing
