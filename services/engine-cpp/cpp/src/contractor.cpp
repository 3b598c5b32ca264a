/**
 * @file contractor.cpp
 * @brief Node contraction with bounded witness search.
 */

#include "contractor.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <queue>
#include <stdexcept>
#include <unordered_map>

namespace ch_routing {

namespace {

struct PQEntry {
    double dist;
    NodeId node;
    bool operator>(const PQEntry& o) const { return dist > o.dist; }
};

using MinHeap = std::priority_queue<PQEntry, std::vector<PQEntry>, std::greater<PQEntry>>;

/**
 * One-to-many local Dijkstra over not-yet-contracted nodes, skipping the node
 * being contracted. Every label it leaves behind is the cost of a real path,
 * so a label at or below a candidate cost is a valid witness.
 */
class WitnessSearch {
public:
    WitnessSearch(const std::vector<std::vector<CHArc>>& forward_graph,
                  const std::vector<uint8_t>& contracted,
                  const TurnRestrictionIndex& restrictions,
                  int max_hops,
                  size_t max_settled)
        : forward_graph_(forward_graph),
          contracted_(contracted),
          restrictions_(restrictions),
          max_hops_(max_hops),
          max_settled_(max_settled) {}

    void run(NodeId source, NodeId excluded, double max_cost, size_t target_count,
             const std::vector<uint8_t>& is_target) {
        labels_.clear();
        MinHeap pq;

        labels_[source] = {0.0, 0, kInvalidEdge};
        pq.push({0.0, source});

        size_t settled = 0;
        size_t targets_found = 0;

        while (!pq.empty()) {
            auto [d, u] = pq.top();
            pq.pop();

            const Label label = labels_[u];
            if (d > label.dist) continue;
            if (d > max_cost) break;
            if (++settled > max_settled_) break;

            if (is_target[u] && ++targets_found >= target_count) break;
            if (label.hops >= max_hops_) continue;

            for (const CHArc& arc : forward_graph_[u]) {
                NodeId v = arc.target;
                if (v == excluded || contracted_[v]) continue;
                if (restrictions_.is_restricted(label.last_edge, u, arc.first_edge)) continue;

                double nd = d + arc.cost;
                if (nd > max_cost) continue;

                auto it = labels_.find(v);
                if (it == labels_.end() || nd < it->second.dist) {
                    labels_[v] = {nd, label.hops + 1, arc.last_edge};
                    pq.push({nd, v});
                }
            }
        }
    }

    bool has_witness(NodeId target, double candidate_cost) const {
        auto it = labels_.find(target);
        return it != labels_.end() && it->second.dist <= candidate_cost;
    }

private:
    struct Label {
        double dist;
        int hops;
        EdgeId last_edge;
    };

    const std::vector<std::vector<CHArc>>& forward_graph_;
    const std::vector<uint8_t>& contracted_;
    const TurnRestrictionIndex& restrictions_;
    int max_hops_;
    size_t max_settled_;
    std::unordered_map<NodeId, Label> labels_;
};

/**
 * Append `arc` unless a parallel arc to the same neighbour is at least as
 * cheap. With turn restrictions present, arcs whose boundary edges differ are
 * kept apart since a restriction may allow one and forbid the other.
 */
void add_cheapest(std::vector<CHArc>& arcs, const CHArc& arc, bool split_by_edges) {
    for (CHArc& kept : arcs) {
        if (kept.target != arc.target) continue;
        if (split_by_edges && (kept.first_edge != arc.first_edge || kept.last_edge != arc.last_edge)) continue;
        if (arc.cost < kept.cost) kept = arc;
        return;
    }
    arcs.push_back(arc);
}

}  // namespace

Contractor::Contractor(RoutingConfig config)
    : Contractor(std::move(config), nullptr) {}

Contractor::Contractor(RoutingConfig config, std::shared_ptr<const NodeOrderer> orderer)
    : config_(std::move(config)), orderer_(std::move(orderer)) {
    if (!orderer_) {
        orderer_ = make_node_orderer(config_.node_ordering);
        if (!orderer_) {
            throw std::invalid_argument("Unknown node ordering: " + config_.node_ordering);
        }
    }
}

std::shared_ptr<const ContractionHierarchies> Contractor::preprocess(const GraphStore& graph) const {
    Status status = graph.validate();
    if (!status.ok()) {
        throw RoutingError(status);
    }

    auto t0 = std::chrono::steady_clock::now();
    const size_t n = graph.node_count();

    if (config_.verbose) {
        std::cout << "Starting CH preprocessing for " << n << " nodes (ordering: "
                  << orderer_->name() << ")\n";
    }

    NodeOrder order = orderer_->order(graph);
    if (order.size() != n || !order.is_total()) {
        throw RoutingError(ErrorCode::GraphConstruction,
                           std::string("Node ordering '") + orderer_->name() + "' is not a total order");
    }

    std::vector<std::vector<CHArc>> forward_graph, backward_graph;
    ContractionHierarchies::seed_arcs(graph, forward_graph, backward_graph);

    const TurnRestrictionIndex& restrictions = graph.restriction_index();
    const bool split_by_edges = !restrictions.empty();
    std::vector<Shortcut> shortcuts;
    std::vector<uint8_t> contracted(n, 0);
    std::vector<uint8_t> is_target(n, 0);
    ContractionStats stats;

    WitnessSearch witness(forward_graph, contracted, restrictions,
                          config_.witness_max_hops, config_.witness_max_settled);

    std::vector<CHArc> incoming, outgoing;

    for (uint32_t rank = 0; rank < n; ++rank) {
        const NodeId node = order.node_at(rank);

        if (config_.verbose && config_.progress_interval > 0 && rank % config_.progress_interval == 0) {
            std::cout << "Contracted " << rank << "/" << n << " nodes, "
                      << shortcuts.size() << " shortcuts\n";
        }

        // Snapshot arcs to still-active neighbours, shortcuts included
        incoming.clear();
        outgoing.clear();
        for (const CHArc& arc : backward_graph[node]) {
            if (arc.target != node && !contracted[arc.target]) add_cheapest(incoming, arc, split_by_edges);
        }
        for (const CHArc& arc : forward_graph[node]) {
            if (arc.target != node && !contracted[arc.target]) add_cheapest(outgoing, arc, split_by_edges);
        }

        for (const CHArc& in_arc : incoming) {
            const NodeId u = in_arc.target;

            double max_candidate = -1.0;
            size_t target_count = 0;
            for (const CHArc& out_arc : outgoing) {
                if (out_arc.target == u) continue;
                if (restrictions.is_restricted(in_arc.last_edge, node, out_arc.first_edge)) continue;
                max_candidate = std::max(max_candidate, in_arc.cost + out_arc.cost);
                if (!is_target[out_arc.target]) {
                    is_target[out_arc.target] = 1;
                    ++target_count;
                }
            }

            if (target_count > 0) {
                witness.run(u, node, max_candidate, target_count, is_target);
                ++stats.witness_searches;
            }

            for (const CHArc& out_arc : outgoing) {
                const NodeId w = out_arc.target;
                if (w == u) continue;
                is_target[w] = 0;
                ++stats.pairs_examined;

                // The turn at `node` is illegal: no path may use this pair
                if (restrictions.is_restricted(in_arc.last_edge, node, out_arc.first_edge)) {
                    ++stats.restricted_pairs;
                    continue;
                }

                const double candidate = in_arc.cost + out_arc.cost;
                if (witness.has_witness(w, candidate)) {
                    ++stats.witnesses_found;
                    continue;
                }

                // No witness within bounds: keep the distance through a shortcut
                Shortcut sc;
                sc.source = u;
                sc.target = w;
                sc.cost = candidate;
                sc.via = node;
                sc.first = in_arc.ref;
                sc.second = out_arc.ref;
                sc.first_edge = in_arc.first_edge;
                sc.last_edge = out_arc.last_edge;

                auto index = static_cast<uint32_t>(shortcuts.size());
                shortcuts.push_back(sc);
                ContractionHierarchies::append_shortcut_arcs(sc, index, forward_graph, backward_graph);
            }
        }

        contracted[node] = 1;
        ++stats.nodes_contracted;
    }

    auto t1 = std::chrono::steady_clock::now();
    stats.elapsed_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    if (config_.verbose) {
        std::cout << "CH preprocessing complete: " << shortcuts.size() << " shortcuts added in "
                  << stats.elapsed_ms << " ms\n";
    }

    return std::make_shared<ContractionHierarchies>(
        std::move(order), std::move(shortcuts), std::move(forward_graph), std::move(backward_graph),
        restrictions, graph.edge_count(), stats);
}

std::future<std::shared_ptr<const ContractionHierarchies>>
Contractor::preprocess_async(std::shared_ptr<const GraphStore> graph) const {
    Contractor self = *this;
    return std::async(std::launch::async, [self, graph]() {
        if (!graph) {
            throw RoutingError(ErrorCode::GraphConstruction, "No graph to preprocess");
        }
        return self.preprocess(*graph);
    });
}

}  // namespace ch_routing
