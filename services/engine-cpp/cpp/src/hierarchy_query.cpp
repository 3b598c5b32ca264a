/**
 * @file hierarchy_query.cpp
 * @brief Bidirectional CH query with path unpacking.
 */

#include "hierarchy_query.hpp"

#include <algorithm>
#include <functional>
#include <limits>
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
 * Search label. `edge_at_node` is the original edge touching this node on the
 * labelled path: the last edge in forward direction, the first edge in
 * backward direction.
 */
struct Label {
    double dist = 0.0;
    NodeId parent = kInvalidNode;
    ArcRef via;
    EdgeId edge_at_node = kInvalidEdge;
};

}  // namespace

HierarchyQueryEngine::HierarchyQueryEngine(std::shared_ptr<const ContractionHierarchies> hierarchy,
                                           RoutingConfig config)
    : hierarchy_(std::move(hierarchy)), config_(std::move(config)) {
    if (!hierarchy_) {
        throw std::invalid_argument("HierarchyQueryEngine requires a hierarchy");
    }
}

CHQueryResult HierarchyQueryEngine::query(NodeId source, NodeId target) const {
    return search(source, target, false);
}

CHQueryResult HierarchyQueryEngine::query_path(NodeId source, NodeId target) const {
    return search(source, target, true);
}

CHQueryResult HierarchyQueryEngine::search(NodeId source, NodeId target, bool with_path) const {
    constexpr double INF = std::numeric_limits<double>::infinity();
    const ContractionHierarchies& ch = *hierarchy_;
    const TurnRestrictionIndex& restrictions = ch.restrictions();

    if (source >= ch.node_count()) {
        return CHQueryResult::failure(ErrorCode::NodeNotFound, "Source node " + std::to_string(source) + " not found in graph");
    }
    if (target >= ch.node_count()) {
        return CHQueryResult::failure(ErrorCode::NodeNotFound, "Target node " + std::to_string(target) + " not found in graph");
    }

    if (source == target) {
        CHQueryResult r;
        r.distance = 0.0;
        r.meeting_node = source;
        r.reachable = true;
        return r;
    }

    std::unordered_map<NodeId, Label> fwd, bwd;
    MinHeap pq_fwd, pq_bwd;

    fwd[source] = Label{};
    pq_fwd.push({0.0, source});
    bwd[target] = Label{};
    pq_bwd.push({0.0, target});

    double best = INF;
    NodeId meeting = kInvalidNode;
    Label meet_fwd, meet_bwd;  // labels at the meeting node when best was set
    bool fwd_done = false;
    bool bwd_done = false;
    size_t settled = 0;

    while (!fwd_done || !bwd_done) {
        // Forward step
        if (!fwd_done) {
            if (pq_fwd.empty()) {
                fwd_done = true;
            } else {
                auto [d, u] = pq_fwd.top(); pq_fwd.pop();
                const Label label = fwd[u];

                if (d > label.dist) {
                    // stale
                } else if (d > best) {
                    fwd_done = true;
                } else {
                    ++settled;

                    auto other = bwd.find(u);
                    if (other != bwd.end() &&
                        !restrictions.is_restricted(label.edge_at_node, u, other->second.edge_at_node)) {
                        double total = d + other->second.dist;
                        if (total < best) {
                            best = total;
                            meeting = u;
                            meet_fwd = label;
                            meet_bwd = other->second;
                        }
                    }

                    const uint32_t rank_u = ch.rank(u);
                    for (const CHArc& arc : ch.forward_arcs(u)) {
                        if (ch.rank(arc.target) <= rank_u) continue;
                        if (restrictions.is_restricted(label.edge_at_node, u, arc.first_edge)) continue;

                        double nd = d + arc.cost;
                        auto it = fwd.find(arc.target);
                        if (it == fwd.end() || nd < it->second.dist) {
                            fwd[arc.target] = Label{nd, u, arc.ref, arc.last_edge};
                            pq_fwd.push({nd, arc.target});
                        }
                    }
                }
            }
        }

        // Backward step
        if (!bwd_done) {
            if (pq_bwd.empty()) {
                bwd_done = true;
            } else {
                auto [d, u] = pq_bwd.top(); pq_bwd.pop();
                const Label label = bwd[u];

                if (d > label.dist) {
                    // stale
                } else if (d > best) {
                    bwd_done = true;
                } else {
                    ++settled;

                    auto other = fwd.find(u);
                    if (other != fwd.end() &&
                        !restrictions.is_restricted(other->second.edge_at_node, u, label.edge_at_node)) {
                        double total = other->second.dist + d;
                        if (total < best) {
                            best = total;
                            meeting = u;
                            meet_fwd = other->second;
                            meet_bwd = label;
                        }
                    }

                    const uint32_t rank_u = ch.rank(u);
                    for (const CHArc& arc : ch.backward_arcs(u)) {
                        // arc.target is the tail of arc.target -> u
                        if (ch.rank(arc.target) <= rank_u) continue;
                        if (restrictions.is_restricted(arc.last_edge, u, label.edge_at_node)) continue;

                        double nd = d + arc.cost;
                        auto it = bwd.find(arc.target);
                        if (it == bwd.end() || nd < it->second.dist) {
                            bwd[arc.target] = Label{nd, u, arc.ref, arc.first_edge};
                            pq_bwd.push({nd, arc.target});
                        }
                    }
                }
            }
        }
    }

    if (meeting == kInvalidNode) {
        CHQueryResult r = CHQueryResult::failure(ErrorCode::NoRouteFound, "No path found between source and target");
        r.settled_nodes = settled;
        return r;
    }

    CHQueryResult r;
    r.distance = best;
    r.meeting_node = meeting;
    r.reachable = true;
    r.settled_nodes = settled;

    if (with_path) {
        // source -> meeting, collected backwards
        std::vector<ArcRef> arcs;
        for (Label label = meet_fwd; label.parent != kInvalidNode; label = fwd.at(label.parent)) {
            arcs.push_back(label.via);
        }
        std::reverse(arcs.begin(), arcs.end());

        // meeting -> target
        for (Label label = meet_bwd; label.parent != kInvalidNode; label = bwd.at(label.parent)) {
            arcs.push_back(label.via);
        }

        r.path = ch.unpack_path(arcs);
    }
    return r;
}

RoutingResponse HierarchyQueryEngine::route(const RoutingRequest& request, const GraphStore& graph) const {
    if (graph.node_count() != hierarchy_->node_count() ||
        graph.edge_count() != hierarchy_->original_edge_count()) {
        return RoutingResponse::failure(ErrorCode::GraphConstruction,
                                        "Graph does not match the hierarchy it is routed with");
    }
    return route_between(request, graph, config_.turn_penalties,
                         [this](NodeId s, NodeId t) { return query_path(s, t); });
}

}  // namespace ch_routing
