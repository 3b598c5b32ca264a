/**
 * @file graph_builder.hpp
 * @brief Incremental construction of a GraphStore from raw nodes and edges.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "graph_store.hpp"

namespace ch_routing {

/**
 * @brief Collects nodes, edges and turn restrictions, then produces a GraphStore.
 *
 * Node and edge ids are assigned densely in insertion order.
 */
class GraphBuilder {
public:
    explicit GraphBuilder(double cell_size = kDefaultGridCellSize);

    NodeId add_node(double lon, double lat, std::optional<double> elevation = std::nullopt);

    /**
     * @brief Add a directed edge.
     * @param distance Length in meters; defaults to the haversine length
     * @throws RoutingError (GraphConstruction) if an endpoint does not exist
     */
    EdgeId add_edge(NodeId source, NodeId target, double base_time,
                    std::optional<double> distance = std::nullopt);

    /**
     * @brief Add source->target and target->source with the same cost.
     * @return (forward edge, backward edge)
     */
    std::pair<EdgeId, EdgeId> add_bidirectional_edge(NodeId a, NodeId b, double base_time,
                                                     std::optional<double> distance = std::nullopt);

    void add_turn_restriction(EdgeId from_edge, NodeId via_node, EdgeId to_edge);

    void set_source(const std::string& source) { source_ = source; }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

    /**
     * @brief Produce the store. The builder is left empty.
     */
    GraphStore build();

    /**
     * @brief rows x cols grid of 4-neighbour two-way edges, each costing `spacing`.
     *
     * Node (r, c) has id r * cols + c and sits at lon = c * spacing, lat = r * spacing.
     */
    static GraphStore create_grid(size_t rows, size_t cols, double spacing,
                                  double cell_size = kDefaultGridCellSize);

private:
    double cell_size_;
    std::string source_;
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::vector<std::vector<EdgeId>> adjacency_;
    std::vector<TurnRestriction> turn_restrictions_;
};

}  // namespace ch_routing
