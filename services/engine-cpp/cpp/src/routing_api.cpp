/**
 * @file routing_api.cpp
 * @brief Endpoint snapping and route response assembly.
 */

#include "routing_api.hpp"
#include "geo_utils.hpp"

#include <cmath>
#include <sstream>

namespace ch_routing {

namespace {

bool valid_coordinate(const GeoPoint& p) {
    double lon = lon_of(p);
    double lat = lat_of(p);
    return std::isfinite(lon) && std::isfinite(lat) &&
           lon >= -180.0 && lon <= 180.0 && lat >= -90.0 && lat <= 90.0;
}

std::string point_str(const GeoPoint& p) {
    std::ostringstream ss;
    ss << "(" << lon_of(p) << ", " << lat_of(p) << ")";
    return ss.str();
}

}  // namespace

std::optional<Waypoint> snap_waypoint(const GraphStore& graph, const GeoPoint& point) {
    if (!valid_coordinate(point)) return std::nullopt;

    auto node_id = graph.nearest_node(point);
    if (!node_id) return std::nullopt;

    const Node* node = graph.node(*node_id);
    if (!node) return std::nullopt;

    Waypoint wp;
    wp.requested = point;
    wp.node = *node_id;
    wp.snapped = node->location;
    wp.snap_distance = geo_utils::haversine_distance(point, node->location);
    return wp;
}

RoutingResponse build_route_response(const GraphStore& graph,
                                     const QueryResult& result,
                                     const Waypoint& origin,
                                     const Waypoint& destination,
                                     const RoutingOptions& options,
                                     const TurnPenaltyTable& penalties) {
    if (!result.reachable) {
        RoutingResponse failed = RoutingResponse::failure(result.error_code, result.error);
        failed.waypoints = {origin, destination};
        return failed;
    }

    RoutingResponse response;
    response.ok = true;
    response.cost = result.distance;
    response.waypoints = {origin, destination};

    if (options.include_geometry) {
        if (const Node* start = graph.node(origin.node)) {
            response.geometry.push_back(start->location);
        }
    }

    EdgeId prev = kInvalidEdge;
    for (EdgeId edge_id : result.path) {
        const Edge* edge = graph.edge(edge_id);
        if (!edge) {
            return RoutingResponse::failure(ErrorCode::EdgeNotFound,
                                            "Route references missing edge " + std::to_string(edge_id));
        }

        double duration = edge->cost.base_time;
        if (options.apply_turn_penalties && prev != kInvalidEdge) {
            duration += graph.turn_penalty(prev, edge_id, penalties).value_or(0.0);
        }

        response.distance += edge->cost.distance;
        response.duration += duration;

        if (options.include_segments) {
            response.segments.push_back({edge_id, edge->source, edge->target, edge->cost.distance, duration});
        }
        if (options.include_geometry) {
            if (const Node* node = graph.node(edge->target)) {
                response.geometry.push_back(node->location);
            }
        }
        prev = edge_id;
    }

    return response;
}

RoutingResponse route_between(const RoutingRequest& request,
                              const GraphStore& graph,
                              const TurnPenaltyTable& penalties,
                              const std::function<QueryResult(NodeId, NodeId)>& search) {
    auto origin = snap_waypoint(graph, request.origin);
    if (!origin) {
        return RoutingResponse::failure(ErrorCode::InvalidCoordinates,
                                        "Origin " + point_str(request.origin) + " could not be snapped to the graph");
    }
    auto destination = snap_waypoint(graph, request.destination);
    if (!destination) {
        return RoutingResponse::failure(ErrorCode::InvalidCoordinates,
                                        "Destination " + point_str(request.destination) +
                                            " could not be snapped to the graph");
    }

    QueryResult result = search(origin->node, destination->node);
    return build_route_response(graph, result, *origin, *destination, request.options, penalties);
}

}  // namespace ch_routing
