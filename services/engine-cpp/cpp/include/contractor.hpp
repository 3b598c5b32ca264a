/**
 * @file contractor.hpp
 * @brief Offline node contraction producing a ContractionHierarchies artifact.
 */

#pragma once

#include <future>
#include <memory>

#include "contraction_hierarchies.hpp"
#include "graph_store.hpp"
#include "node_orderer.hpp"
#include "routing_config.hpp"

namespace ch_routing {

/**
 * @brief Contracts nodes in rank order, inserting shortcuts where no witness path exists.
 *
 * The witness search is bounded by cost, hop count and settled nodes. A
 * search that ends without finding a witness always inserts the shortcut, so
 * tighter bounds only grow the shortcut set and never change query distances.
 */
class Contractor {
public:
    /**
     * @brief Contractor using the orderer named by config.node_ordering.
     * @throws std::invalid_argument for an unknown ordering name
     */
    explicit Contractor(RoutingConfig config = RoutingConfig());

    Contractor(RoutingConfig config, std::shared_ptr<const NodeOrderer> orderer);

    /**
     * @brief Validate the graph and build its hierarchy.
     * @throws RoutingError if validation fails or the orderer returns a non-total order
     */
    std::shared_ptr<const ContractionHierarchies> preprocess(const GraphStore& graph) const;

    /**
     * @brief Run preprocess() on a worker thread.
     *
     * The hierarchy becomes visible only once complete; errors are rethrown
     * from future::get().
     */
    std::future<std::shared_ptr<const ContractionHierarchies>>
    preprocess_async(std::shared_ptr<const GraphStore> graph) const;

    const RoutingConfig& config() const { return config_; }
    const NodeOrderer& orderer() const { return *orderer_; }

private:
    RoutingConfig config_;
    std::shared_ptr<const NodeOrderer> orderer_;
};

}  // namespace ch_routing
