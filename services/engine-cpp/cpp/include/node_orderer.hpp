/**
 * @file node_orderer.hpp
 * @brief Contraction order and pluggable ordering heuristics.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "graph_store.hpp"

namespace ch_routing {

/**
 * @brief Bijection NodeId -> rank in [0, n). Lower rank is contracted first.
 */
class NodeOrder {
public:
    NodeOrder() = default;

    /**
     * @brief Build from the contraction sequence (sequence[rank] = node).
     */
    explicit NodeOrder(std::vector<NodeId> sequence);

    /**
     * @brief Build from per-node ranks (ranks[node] = rank).
     */
    static NodeOrder from_ranks(const std::vector<uint32_t>& ranks);

    size_t size() const { return sequence_.size(); }
    bool empty() const { return sequence_.empty(); }

    uint32_t rank(NodeId node) const { return ranks_[node]; }
    NodeId node_at(uint32_t rank) const { return sequence_[rank]; }

    const std::vector<NodeId>& sequence() const { return sequence_; }
    const std::vector<uint32_t>& ranks() const { return ranks_; }

    /**
     * @brief True if every node has exactly one rank and every rank one node.
     */
    bool is_total() const;

    bool operator==(const NodeOrder& other) const { return sequence_ == other.sequence_; }

private:
    std::vector<NodeId> sequence_;
    std::vector<uint32_t> ranks_;
};

/**
 * @brief Ordering strategy. Only totality matters for correctness; the
 * heuristic drives shortcut count and query speed.
 */
class NodeOrderer {
public:
    virtual ~NodeOrderer() = default;

    virtual NodeOrder order(const GraphStore& graph) const = 0;

    virtual const char* name() const = 0;
};

/**
 * @brief Ascending total degree (in + out), ties by NodeId.
 */
class DegreeNodeOrderer : public NodeOrderer {
public:
    NodeOrder order(const GraphStore& graph) const override;
    const char* name() const override { return "degree"; }
};

/**
 * @brief Ascending static edge difference in*out - (in+out), ties by degree then NodeId.
 *
 * Estimates how many shortcuts contracting a node would add relative to the
 * edges it removes, on the original graph.
 */
class EdgeDifferenceNodeOrderer : public NodeOrderer {
public:
    NodeOrder order(const GraphStore& graph) const override;
    const char* name() const override { return "edge_difference"; }
};

/**
 * @brief Orderer by configuration name ("degree", "edge_difference").
 * @return nullptr for unknown names
 */
std::unique_ptr<NodeOrderer> make_node_orderer(const std::string& name);

}  // namespace ch_routing
