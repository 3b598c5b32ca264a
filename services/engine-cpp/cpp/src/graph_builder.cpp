/**
 * @file graph_builder.cpp
 * @brief GraphBuilder implementation.
 */

#include "graph_builder.hpp"
#include "geo_utils.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ch_routing {

static std::string utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

GraphBuilder::GraphBuilder(double cell_size) : cell_size_(cell_size) {}

NodeId GraphBuilder::add_node(double lon, double lat, std::optional<double> elevation) {
    Node node;
    node.id = static_cast<NodeId>(nodes_.size());
    node.location = make_point(lon, lat);
    node.elevation = elevation;
    nodes_.push_back(node);
    adjacency_.emplace_back();
    return node.id;
}

EdgeId GraphBuilder::add_edge(NodeId source, NodeId target, double base_time, std::optional<double> distance) {
    if (source >= nodes_.size() || target >= nodes_.size()) {
        throw RoutingError(ErrorCode::GraphConstruction,
                           "Edge " + std::to_string(source) + "->" + std::to_string(target) +
                           " references a missing node");
    }

    const GeoPoint& from = nodes_[source].location;
    const GeoPoint& to = nodes_[target].location;

    Edge edge;
    edge.id = static_cast<EdgeId>(edges_.size());
    edge.source = source;
    edge.target = target;
    edge.cost.base_time = base_time;
    edge.cost.distance = distance ? *distance : geo_utils::haversine_distance(from, to);
    edge.bearing = geo_utils::initial_bearing(from, to);

    edges_.push_back(edge);
    adjacency_[source].push_back(edge.id);
    return edge.id;
}

std::pair<EdgeId, EdgeId> GraphBuilder::add_bidirectional_edge(NodeId a, NodeId b, double base_time,
                                                               std::optional<double> distance) {
    EdgeId fwd = add_edge(a, b, base_time, distance);
    EdgeId bwd = add_edge(b, a, base_time, distance);
    return {fwd, bwd};
}

void GraphBuilder::add_turn_restriction(EdgeId from_edge, NodeId via_node, EdgeId to_edge) {
    turn_restrictions_.push_back({from_edge, via_node, to_edge});
}

GraphStore GraphBuilder::build() {
    GraphMetadata metadata;
    metadata.source = source_;
    metadata.created_at = utc_timestamp();

    if (!nodes_.empty()) {
        GeoBounds b{lon_of(nodes_[0].location), lat_of(nodes_[0].location),
                    lon_of(nodes_[0].location), lat_of(nodes_[0].location)};
        for (const auto& n : nodes_) {
            b.min_lon = std::min(b.min_lon, lon_of(n.location));
            b.min_lat = std::min(b.min_lat, lat_of(n.location));
            b.max_lon = std::max(b.max_lon, lon_of(n.location));
            b.max_lat = std::max(b.max_lat, lat_of(n.location));
        }
        metadata.bounds = b;
    }

    GraphStore store(std::move(nodes_), std::move(edges_), std::move(adjacency_),
                     std::move(turn_restrictions_), std::move(metadata), cell_size_);

    nodes_.clear();
    edges_.clear();
    adjacency_.clear();
    turn_restrictions_.clear();
    return store;
}

GraphStore GraphBuilder::create_grid(size_t rows, size_t cols, double spacing, double cell_size) {
    GraphBuilder builder(cell_size);
    builder.set_source("grid " + std::to_string(rows) + "x" + std::to_string(cols));

    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            builder.add_node(static_cast<double>(c) * spacing, static_cast<double>(r) * spacing);
        }
    }

    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            NodeId id = static_cast<NodeId>(r * cols + c);
            if (c + 1 < cols) builder.add_bidirectional_edge(id, id + 1, spacing);
            if (r + 1 < rows) builder.add_bidirectional_edge(id, static_cast<NodeId>(id + cols), spacing);
        }
    }

    return builder.build();
}

}  // namespace ch_routing
