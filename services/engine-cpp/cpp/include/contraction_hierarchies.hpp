/**
 * @file contraction_hierarchies.hpp
 * @brief Immutable CH artifact: node order, shortcut table and augmented adjacency.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "graph_store.hpp"
#include "node_orderer.hpp"

namespace ch_routing {

/**
 * @brief Reference to an arc: an original edge or an entry of the shortcut table.
 */
struct ArcRef {
    uint32_t id = kInvalidEdge;
    bool is_shortcut = false;

    static ArcRef edge(EdgeId id) { return {id, false}; }
    static ArcRef shortcut(uint32_t index) { return {index, true}; }

    bool operator==(const ArcRef& o) const { return id == o.id && is_shortcut == o.is_shortcut; }
    bool operator!=(const ArcRef& o) const { return !(*this == o); }
};

/**
 * @brief Entry of the augmented forward/backward adjacency.
 *
 * In forward_graph[u] `target` is the head of u->target. In
 * backward_graph[v] it is the tail of target->v.
 */
struct CHArc {
    NodeId target = kInvalidNode;
    double cost = 0.0;
    ArcRef ref;
    EdgeId first_edge = kInvalidEdge;  ///< First original edge of the unpacked path
    EdgeId last_edge = kInvalidEdge;   ///< Last original edge of the unpacked path
};

/**
 * @brief Shortcut source -> via -> target replacing two lower arcs.
 */
struct Shortcut {
    NodeId source = kInvalidNode;
    NodeId target = kInvalidNode;
    double cost = 0.0;
    NodeId via = kInvalidNode;
    ArcRef first;   ///< source -> via
    ArcRef second;  ///< via -> target
    EdgeId first_edge = kInvalidEdge;
    EdgeId last_edge = kInvalidEdge;
};

/**
 * @brief Preprocessing counters.
 */
struct ContractionStats {
    size_t nodes_contracted = 0;
    size_t pairs_examined = 0;
    size_t witness_searches = 0;
    size_t witnesses_found = 0;
    size_t restricted_pairs = 0;   ///< (in, out) pairs forbidden by a turn restriction
    double elapsed_ms = 0.0;
};

/**
 * @brief Result of preprocessing. Never mutated after construction; share it
 * as std::shared_ptr<const ContractionHierarchies> across query threads.
 *
 * Any change to the underlying graph requires building a new hierarchy.
 */
class ContractionHierarchies {
public:
    ContractionHierarchies(NodeOrder node_order,
                           std::vector<Shortcut> shortcuts,
                           std::vector<std::vector<CHArc>> forward_graph,
                           std::vector<std::vector<CHArc>> backward_graph,
                           TurnRestrictionIndex restrictions,
                           size_t original_edge_count,
                           ContractionStats stats = {});

    /**
     * @brief Seed augmented adjacency with the original edges of a graph.
     *
     * Arcs are appended in (node, outgoing-bucket) order, which fixes the
     * adjacency layout for a given graph.
     */
    static void seed_arcs(const GraphStore& graph,
                          std::vector<std::vector<CHArc>>& forward_graph,
                          std::vector<std::vector<CHArc>>& backward_graph);

    /**
     * @brief Append a shortcut's arcs to forward_graph[source] and backward_graph[target].
     */
    static void append_shortcut_arcs(const Shortcut& shortcut, uint32_t index,
                                     std::vector<std::vector<CHArc>>& forward_graph,
                                     std::vector<std::vector<CHArc>>& backward_graph);

    size_t node_count() const { return forward_graph_.size(); }
    size_t original_edge_count() const { return original_edge_count_; }
    size_t shortcut_count() const { return shortcuts_.size(); }

    const NodeOrder& node_order() const { return node_order_; }
    uint32_t rank(NodeId node) const { return node_order_.rank(node); }

    const std::vector<Shortcut>& shortcuts() const { return shortcuts_; }
    const std::vector<CHArc>& forward_arcs(NodeId node) const { return forward_graph_[node]; }
    const std::vector<CHArc>& backward_arcs(NodeId node) const { return backward_graph_[node]; }

    const TurnRestrictionIndex& restrictions() const { return restrictions_; }
    const ContractionStats& stats() const { return stats_; }

    /**
     * @brief Expand one arc into original edges, appended to `out`.
     *
     * Iterative over an explicit stack; shortcut chains of any depth are safe.
     */
    void unpack(ArcRef arc, std::vector<EdgeId>& out) const;

    /**
     * @brief Expand a chain of arcs into original edges.
     */
    std::vector<EdgeId> unpack_path(const std::vector<ArcRef>& arcs) const;

    size_t memory_usage() const;

    /**
     * @brief Save ranks and shortcuts as Parquet tables into a directory.
     */
    bool save(const std::string& dir) const;

    /**
     * @brief Load a hierarchy saved with save() for the graph it was built from.
     *
     * The augmented adjacency is rebuilt against `graph` in the same order as
     * preprocessing produced it.
     * @return nullptr on I/O failure or if the artifact does not match `graph`
     */
    static std::shared_ptr<const ContractionHierarchies> load(const std::string& dir, const GraphStore& graph);

private:
    NodeOrder node_order_;
    std::vector<Shortcut> shortcuts_;
    std::vector<std::vector<CHArc>> forward_graph_;
    std::vector<std::vector<CHArc>> backward_graph_;
    TurnRestrictionIndex restrictions_;
    size_t original_edge_count_ = 0;
    ContractionStats stats_;
};

}  // namespace ch_routing
