/**
 * @file graph_store.hpp
 * @brief Validated node/edge storage with grid spatial index and turn restrictions.
 *
 * A GraphStore is built once (GraphBuilder or load()) and is read-only
 * afterwards. Preprocessing and queries only ever see a validated store.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "routing_config.hpp"
#include "routing_types.hpp"

namespace ch_routing {

/**
 * @brief Graph node.
 */
struct Node {
    NodeId id = kInvalidNode;
    GeoPoint location{0.0, 0.0};
    std::optional<double> elevation;  ///< meters, if known
};

/**
 * @brief Traversal cost of an edge.
 */
struct EdgeCost {
    double base_time = 0.0;  ///< Routing weight (time units)
    double distance = 0.0;   ///< Length in meters
};

/**
 * @brief Directed edge. Two-way streets are two edges.
 */
struct Edge {
    EdgeId id = kInvalidEdge;
    NodeId source = kInvalidNode;
    NodeId target = kInvalidNode;
    EdgeCost cost;
    double bearing = 0.0;  ///< Degrees clockwise from north
};

/**
 * @brief Forbidden transition from_edge -> to_edge at via_node.
 */
struct TurnRestriction {
    EdgeId from_edge = kInvalidEdge;
    NodeId via_node = kInvalidNode;
    EdgeId to_edge = kInvalidEdge;
};

/**
 * @brief Turn restriction lookup keyed by via node.
 */
class TurnRestrictionIndex {
public:
    TurnRestrictionIndex() = default;
    explicit TurnRestrictionIndex(const std::vector<TurnRestriction>& restrictions);

    bool is_restricted(EdgeId from_edge, NodeId via_node, EdgeId to_edge) const;

    bool empty() const { return count_ == 0; }
    size_t size() const { return count_; }

private:
    std::unordered_map<NodeId, std::vector<std::pair<EdgeId, EdgeId>>> by_via_;
    size_t count_ = 0;
};

/**
 * @brief Geographic bounds.
 */
struct GeoBounds {
    double min_lon = 0.0;
    double min_lat = 0.0;
    double max_lon = 0.0;
    double max_lat = 0.0;
};

/**
 * @brief Descriptive graph metadata, persisted alongside the graph.
 */
struct GraphMetadata {
    std::string source;                ///< Free-form origin label
    std::string created_at;            ///< ISO-8601 UTC, empty if unknown
    std::optional<GeoBounds> bounds;
};

/**
 * @brief Square-cell grid index over node locations.
 *
 * nearest() only inspects the containing cell and its 8 neighbours. A point
 * whose nearest node lies further than one cell away is not snapped; choose a
 * cell size above the expected node spacing when that matters.
 */
class NodeSpatialIndex {
public:
    explicit NodeSpatialIndex(double cell_size = kDefaultGridCellSize);

    void clear();
    void insert(const GeoPoint& point, NodeId node_id);

    std::optional<NodeId> nearest(const GeoPoint& point, const std::vector<Node>& nodes) const;

    /**
     * @brief Nodes within radius_meters, sorted by distance.
     */
    std::vector<NodeId> within_radius(const GeoPoint& point, double radius_meters,
                                      const std::vector<Node>& nodes) const;

    double cell_size() const { return cell_size_; }
    size_t cell_count() const { return grid_.size(); }

private:
    std::unordered_map<uint64_t, std::vector<NodeId>> grid_;
    double cell_size_;
};

/**
 * @brief Immutable routing graph.
 */
class GraphStore {
public:
    explicit GraphStore(double cell_size = kDefaultGridCellSize);

    /**
     * @brief Assemble a store from raw parts.
     *
     * Reverse adjacency, spatial index and restriction index are derived from
     * the given parts. No checks are made here; call validate().
     */
    GraphStore(std::vector<Node> nodes,
               std::vector<Edge> edges,
               std::vector<std::vector<EdgeId>> adjacency,
               std::vector<TurnRestriction> turn_restrictions,
               GraphMetadata metadata = {},
               double cell_size = kDefaultGridCellSize);

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

    /// nullptr if out of range
    const Node* node(NodeId id) const;
    const Edge* edge(EdgeId id) const;

    /// Empty for isolated or unknown nodes
    const std::vector<EdgeId>& outgoing_edges(NodeId node) const;
    const std::vector<EdgeId>& incoming_edges(NodeId node) const;

    /**
     * @brief Snap a coordinate to the closest node (3x3 cell window).
     */
    std::optional<NodeId> nearest_node(const GeoPoint& point) const;

    std::vector<NodeId> nodes_within_radius(const GeoPoint& point, double radius_meters) const;

    bool is_turn_restricted(EdgeId from_edge, NodeId via_node, EdgeId to_edge) const;

    /**
     * @brief Bearing-based penalty for turning from one edge onto another.
     * @return nullopt if either edge is unknown
     */
    std::optional<double> turn_penalty(EdgeId from_edge, EdgeId to_edge,
                                       const TurnPenaltyTable& table = TurnPenaltyTable()) const;

    const std::vector<TurnRestriction>& turn_restrictions() const { return turn_restrictions_; }
    const TurnRestrictionIndex& restriction_index() const { return restriction_index_; }
    const GraphMetadata& metadata() const { return metadata_; }
    double cell_size() const { return spatial_index_.cell_size(); }

    /**
     * @brief Check adjacency/edge consistency.
     *
     * Must pass before preprocessing. Reports EdgeNotFound for dangling
     * adjacency entries and GraphConstruction for every other inconsistency.
     */
    Status validate() const;

    /**
     * @brief Save graph as Parquet tables plus metadata.json into a directory.
     */
    bool save(const std::string& dir) const;

    /**
     * @brief Load a graph saved with save(). Validates before replacing contents.
     * @return false on I/O, format or validation failure (store unchanged)
     */
    bool load(const std::string& dir);

    size_t memory_usage() const;

private:
    void rebuild_indexes();

    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::vector<std::vector<EdgeId>> adjacency_;
    std::vector<std::vector<EdgeId>> reverse_adjacency_;
    NodeSpatialIndex spatial_index_;
    std::vector<TurnRestriction> turn_restrictions_;
    TurnRestrictionIndex restriction_index_;
    GraphMetadata metadata_;
};

}  // namespace ch_routing
