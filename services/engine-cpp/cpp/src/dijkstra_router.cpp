/**
 * @file dijkstra_router.cpp
 * @brief Baseline Dijkstra queries.
 */

#include "dijkstra_router.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <unordered_map>

namespace ch_routing {

namespace {

struct PQEntry {
    double dist;
    NodeId node;
    bool operator>(const PQEntry& o) const { return dist > o.dist; }
};

using MinHeap = std::priority_queue<PQEntry, std::vector<PQEntry>, std::greater<PQEntry>>;

}  // namespace

DijkstraRouter::DijkstraRouter(RoutingConfig config) : config_(std::move(config)) {}

std::vector<double> DijkstraRouter::distances_from(const GraphStore& graph, NodeId source) const {
    constexpr double INF = std::numeric_limits<double>::infinity();
    std::vector<double> dist(graph.node_count(), INF);
    if (source >= graph.node_count()) return dist;

    MinHeap pq;
    dist[source] = 0.0;
    pq.push({0.0, source});

    while (!pq.empty()) {
        auto [d, u] = pq.top(); pq.pop();
        if (d > dist[u]) continue;

        for (EdgeId edge_id : graph.outgoing_edges(u)) {
            const Edge* edge = graph.edge(edge_id);
            if (!edge) continue;

            double nd = d + edge->cost.base_time;
            if (nd < dist[edge->target]) {
                dist[edge->target] = nd;
                pq.push({nd, edge->target});
            }
        }
    }
    return dist;
}

QueryResult DijkstraRouter::shortest_path(const GraphStore& graph, NodeId source, NodeId target) const {
    if (source >= graph.node_count()) {
        return QueryResult::failure(ErrorCode::NodeNotFound, "Source node " + std::to_string(source) + " not found in graph");
    }
    if (target >= graph.node_count()) {
        return QueryResult::failure(ErrorCode::NodeNotFound, "Target node " + std::to_string(target) + " not found in graph");
    }

    std::unordered_map<NodeId, double> dist;
    std::unordered_map<NodeId, EdgeId> parent_edge;
    MinHeap pq;

    dist[source] = 0.0;
    pq.push({0.0, source});

    size_t settled = 0;
    bool found = false;
    double best_dist = -1;

    while (!pq.empty()) {
        auto [d, u] = pq.top(); pq.pop();

        if (d > dist[u]) continue;
        ++settled;

        if (u == target) {
            best_dist = d;
            found = true;
            break;
        }

        for (EdgeId edge_id : graph.outgoing_edges(u)) {
            const Edge* edge = graph.edge(edge_id);
            if (!edge) continue;

            double nd = d + edge->cost.base_time;
            auto it = dist.find(edge->target);
            if (it == dist.end() || nd < it->second) {
                dist[edge->target] = nd;
                parent_edge[edge->target] = edge_id;
                pq.push({nd, edge->target});
            }
        }
    }

    if (!found) {
        QueryResult r = QueryResult::failure(ErrorCode::NoRouteFound, "No path found between source and target");
        r.settled_nodes = settled;
        return r;
    }

    // Reconstruct path
    std::vector<EdgeId> path;
    NodeId curr = target;
    while (curr != source) {
        EdgeId edge_id = parent_edge[curr];
        path.push_back(edge_id);
        curr = graph.edge(edge_id)->source;
    }
    std::reverse(path.begin(), path.end());

    QueryResult r;
    r.distance = best_dist;
    r.reachable = true;
    r.path = std::move(path);
    r.settled_nodes = settled;
    return r;
}

RoutingResponse DijkstraRouter::route(const RoutingRequest& request, const GraphStore& graph) const {
    return route_between(request, graph, config_.turn_penalties,
                         [this, &graph](NodeId s, NodeId t) { return shortest_path(graph, s, t); });
}

}  // namespace ch_routing
