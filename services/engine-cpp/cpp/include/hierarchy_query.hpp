/**
 * @file hierarchy_query.hpp
 * @brief Bidirectional upward search over a ContractionHierarchies artifact.
 */

#pragma once

#include <memory>

#include "contraction_hierarchies.hpp"
#include "routing_api.hpp"
#include "routing_config.hpp"

namespace ch_routing {

using CHQueryResult = QueryResult;

/**
 * @brief Query engine over a shared, immutable hierarchy.
 *
 * Every query owns its heaps and maps, so one engine may be used from any
 * number of threads at once.
 *
 * Turn restrictions are honoured at the nodes the search passes and at the
 * meeting node. Labels are per node, so a restriction can hide a route that
 * would need to reach the same node twice with different incoming edges; such
 * queries report a longer route or NoRouteFound.
 */
class HierarchyQueryEngine : public RouteAlgorithm {
public:
    /**
     * @throws std::invalid_argument if hierarchy is null
     */
    explicit HierarchyQueryEngine(std::shared_ptr<const ContractionHierarchies> hierarchy,
                                  RoutingConfig config = RoutingConfig());

    /**
     * @brief Shortest distance source -> target (path left empty).
     */
    CHQueryResult query(NodeId source, NodeId target) const;

    /**
     * @brief Shortest distance plus the unpacked original edge path.
     */
    CHQueryResult query_path(NodeId source, NodeId target) const;

    /**
     * @brief Snap coordinates and route. `graph` must be the graph the hierarchy was built from.
     */
    RoutingResponse route(const RoutingRequest& request, const GraphStore& graph) const override;

    const char* name() const override { return "ContractionHierarchies"; }

    const ContractionHierarchies& hierarchy() const { return *hierarchy_; }

private:
    CHQueryResult search(NodeId source, NodeId target, bool with_path) const;

    std::shared_ptr<const ContractionHierarchies> hierarchy_;
    RoutingConfig config_;
};

}  // namespace ch_routing
