/**
 * @file dijkstra_router.hpp
 * @brief Plain Dijkstra on the original graph, used as baseline and correctness oracle.
 */

#pragma once

#include <vector>

#include "graph_store.hpp"
#include "routing_api.hpp"
#include "routing_config.hpp"

namespace ch_routing {

/**
 * @brief Unidirectional Dijkstra over original edges. Ignores turn restrictions.
 */
class DijkstraRouter : public RouteAlgorithm {
public:
    explicit DijkstraRouter(RoutingConfig config = RoutingConfig());

    /**
     * @brief Shortest distances from `source` to every node (infinity if unreachable).
     */
    std::vector<double> distances_from(const GraphStore& graph, NodeId source) const;

    /**
     * @brief Shortest path source -> target with its original edges.
     */
    QueryResult shortest_path(const GraphStore& graph, NodeId source, NodeId target) const;

    RoutingResponse route(const RoutingRequest& request, const GraphStore& graph) const override;

    const char* name() const override { return "Dijkstra"; }

private:
    RoutingConfig config_;
};

}  // namespace ch_routing
