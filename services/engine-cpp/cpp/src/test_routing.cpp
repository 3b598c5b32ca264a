/**
 * @file test_routing.cpp
 * @brief Test suite validating CH queries against plain Dijkstra.
 *
 * Ground truth is computed in-process with DijkstraRouter on the same graph,
 * so every case is self-contained.
 */

#include "contractor.hpp"
#include "dijkstra_router.hpp"
#include "graph_builder.hpp"
#include "hierarchy_query.hpp"
#include "test_support.hpp"

#include <atomic>
#include <limits>
#include <random>
#include <thread>

using namespace ch_routing;
using namespace ch_routing::testing;

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

struct OracleStats {
    size_t queries = 0;
    size_t unreachable = 0;
};

/**
 * Compare every (source, target) pair against Dijkstra. Unreachable pairs must
 * report NoRouteFound; reachable pairs must match within 1e-9 relative.
 */
OracleStats check_all_pairs(const GraphStore& g, const HierarchyQueryEngine& engine) {
    DijkstraRouter dijkstra;
    OracleStats stats;

    for (NodeId s = 0; s < g.node_count(); ++s) {
        std::vector<double> expected = dijkstra.distances_from(g, s);
        for (NodeId t = 0; t < g.node_count(); ++t) {
            CHQueryResult r = engine.query(s, t);
            ++stats.queries;
            if (expected[t] == INF) {
                ++stats.unreachable;
                check(!r.reachable, "!r.reachable");
                check_eq(r.error_code, ErrorCode::NoRouteFound, "r.error_code");
                check_eq(r.distance, -1.0, "r.distance");
            } else {
                check(r.reachable, "r.reachable");
                if (!same_distance(r.distance, expected[t])) {
                    check_eq(r.distance, expected[t], "r.distance");
                }
            }
        }
    }
    return stats;
}

/**
 * Unpacked path must be a connected chain source -> target whose summed cost
 * equals the reported distance.
 */
void check_path(const GraphStore& g, NodeId s, NodeId t, const CHQueryResult& r) {
    check(r.reachable, "r.reachable");
    if (s == t) {
        check(r.path.empty(), "r.path.empty()");
        return;
    }
    check(!r.path.empty(), "!r.path.empty()");
    check_eq(g.edge(r.path.front())->source, s, "g.edge(r.path.front())->source");
    check_eq(g.edge(r.path.back())->target, t, "g.edge(r.path.back())->target");

    double sum = 0;
    for (size_t i = 0; i < r.path.size(); ++i) {
        const Edge* e = g.edge(r.path[i]);
        check(e != nullptr, "e != nullptr");
        sum += e->cost.base_time;
        if (i > 0) {
            const Edge* prev = g.edge(r.path[i - 1]);
            check_eq(prev->target, e->source, "prev->target");
            check(!g.is_turn_restricted(prev->id, e->source, e->id), "!g.is_turn_restricted(prev->id, e->source, e->id)");
        }
    }
    check(same_distance(sum, r.distance), "same_distance(sum, r.distance)");
}

GraphStore random_graph(std::mt19937& rng, size_t n, size_t m) {
    std::uniform_real_distribution<double> coord(0.0, 0.05);
    std::uniform_real_distribution<double> cost(0.1, 10.0);
    std::uniform_int_distribution<NodeId> pick(0, static_cast<NodeId>(n - 1));
    std::uniform_int_distribution<int> kind(0, 19);

    GraphBuilder b;
    for (size_t i = 0; i < n; ++i) b.add_node(coord(rng), coord(rng));

    for (size_t i = 0; i < m; ++i) {
        NodeId u = pick(rng);
        NodeId v = pick(rng);
        switch (kind(rng)) {
            case 0:
                b.add_edge(u, v, 0.0);  // free edge
                break;
            case 1:
                b.add_bidirectional_edge(u, v, cost(rng));
                break;
            case 2:
                // Parallel edge with a different cost
                b.add_edge(u, v, cost(rng));
                b.add_edge(u, v, cost(rng));
                break;
            default:
                b.add_edge(u, v, std::round(cost(rng)));  // integer costs create ties
                break;
        }
    }
    return b.build();
}

// 0 -> 1 -> 2 costs 1 + 1 with the turn at 1 forbidden; detour 0 -> 3 -> 2 costs 2 + 2
GraphStore restricted_diamond() {
    GraphBuilder b;
    b.add_node(0.0, 0.0);
    b.add_node(0.001, 0.0);
    b.add_node(0.002, 0.0);
    b.add_node(0.001, 0.001);
    EdgeId e01 = b.add_edge(0, 1, 1.0);
    EdgeId e12 = b.add_edge(1, 2, 1.0);
    b.add_edge(0, 3, 2.0);
    b.add_edge(3, 2, 2.0);
    b.add_turn_restriction(e01, 1, e12);
    return b.build();
}

// ============================================================
// CORRECTNESS
// ============================================================

void test_grid_oracle() {
    for (const char* ordering : {"degree", "edge_difference"}) {
        RoutingConfig config;
        config.node_ordering = ordering;
        GraphStore g = GraphBuilder::create_grid(6, 7, 0.01);
        HierarchyQueryEngine engine(Contractor(config).preprocess(g), config);
        OracleStats stats = check_all_pairs(g, engine);
        check_eq(stats.unreachable, 0u, "stats.unreachable");
    }
}

void test_random_graphs() {
    std::mt19937 rng(20240601);
    std::uniform_int_distribution<size_t> size(2, 50);
    const int hops[] = {0, 1, 5};
    const size_t settled[] = {1, 1000};

    size_t unreachable = 0;
    for (int i = 0; i < 120; ++i) {
        size_t n = size(rng);
        std::uniform_int_distribution<size_t> edges(0, 3 * n);
        GraphStore g = random_graph(rng, n, edges(rng));
        check(g.validate().ok(), "g.validate().ok()");

        RoutingConfig config;
        config.node_ordering = (i % 2 == 0) ? "degree" : "edge_difference";
        config.witness_max_hops = hops[i % 3];
        config.witness_max_settled = settled[(i / 3) % 2];

        HierarchyQueryEngine engine(Contractor(config).preprocess(g), config);
        unreachable += check_all_pairs(g, engine).unreachable;

        // Paths on a sample of pairs
        for (NodeId s = 0; s < n; s += 5) {
            for (NodeId t = 0; t < n; t += 3) {
                CHQueryResult r = engine.query_path(s, t);
                if (r.reachable) check_path(g, s, t, r);
            }
        }
    }
    // Sparse graphs leave some pairs disconnected; both branches must be covered
    check(unreachable > 0, "unreachable > 0");
}

void test_unreachable() {
    GraphBuilder b;
    for (int i = 0; i < 4; ++i) b.add_node(0.001 * i, 0.0);
    b.add_bidirectional_edge(0, 1, 1.0);
    b.add_bidirectional_edge(2, 3, 1.0);
    b.add_edge(1, 2, 5.0);  // one way into the second component
    GraphStore g = b.build();

    HierarchyQueryEngine engine(Contractor().preprocess(g));
    CHQueryResult r = engine.query(3, 0);
    check(!r.reachable, "!r.reachable");
    check_eq(r.error_code, ErrorCode::NoRouteFound, "r.error_code");
    check(!r.error.empty(), "!r.error.empty()");
    check_eq(r.distance, -1.0, "r.distance");

    r = engine.query(0, 3);
    check(r.reachable, "r.reachable");
    check_near(r.distance, 7.0, 1e-12, "r.distance");
}

void test_invalid_node_ids() {
    GraphStore g = GraphBuilder::create_grid(2, 2, 0.01);
    HierarchyQueryEngine engine(Contractor().preprocess(g));

    CHQueryResult r = engine.query(0, 99);
    check(!r.reachable, "!r.reachable");
    check_eq(r.error_code, ErrorCode::NodeNotFound, "r.error_code");
    check_eq(engine.query_path(kInvalidNode, 0).error_code, ErrorCode::NodeNotFound, "engine.query_path(kInvalidNode, 0).error_code");

    QueryResult d = DijkstraRouter().shortest_path(g, 7, 0);
    check_eq(d.error_code, ErrorCode::NodeNotFound, "d.error_code");

    bool thrown = false;
    try {
        HierarchyQueryEngine none(nullptr);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    check(thrown, "thrown");
}

void test_same_node() {
    GraphStore g = GraphBuilder::create_grid(3, 3, 0.01);
    HierarchyQueryEngine engine(Contractor().preprocess(g));
    CHQueryResult r = engine.query_path(4, 4);
    check(r.reachable, "r.reachable");
    check_eq(r.distance, 0.0, "r.distance");
    check(r.path.empty(), "r.path.empty()");
    check_eq(r.meeting_node, 4u, "r.meeting_node");
}

void test_paths_match_dijkstra_cost() {
    GraphStore g = GraphBuilder::create_grid(5, 5, 0.01);
    HierarchyQueryEngine engine(Contractor().preprocess(g));
    DijkstraRouter dijkstra;

    for (NodeId s = 0; s < g.node_count(); ++s) {
        for (NodeId t = 0; t < g.node_count(); ++t) {
            CHQueryResult r = engine.query_path(s, t);
            check_path(g, s, t, r);

            QueryResult expected = dijkstra.shortest_path(g, s, t);
            check(expected.reachable, "expected.reachable");
            check(same_distance(r.distance, expected.distance), "same_distance(r.distance, expected.distance)");
        }
    }

    CHQueryResult corner = engine.query_path(0, 24);
    check_eq(corner.path.size(), 8u, "corner.path.size()");
    check(corner.settled_nodes > 0, "corner.settled_nodes > 0");
}

// ============================================================
// CONCURRENCY
// ============================================================

void test_concurrent_queries() {
    GraphStore g = GraphBuilder::create_grid(10, 10, 0.01);
    auto engine = std::make_shared<const HierarchyQueryEngine>(Contractor().preprocess(g));

    std::mt19937 rng(17);
    std::uniform_int_distribution<NodeId> pick(0, static_cast<NodeId>(g.node_count() - 1));
    std::vector<std::pair<NodeId, NodeId>> batch;
    for (int i = 0; i < 500; ++i) batch.emplace_back(pick(rng), pick(rng));

    // Sequential run of the batch is the reference for every worker
    DijkstraRouter dijkstra;
    std::vector<CHQueryResult> sequential;
    for (const auto& [s, t] : batch) {
        sequential.push_back(engine->query_path(s, t));
        check(sequential.back().reachable, "sequential.back().reachable");
        check(same_distance(sequential.back().distance, dijkstra.distances_from(g, s)[t]),
              "sequential distance matches Dijkstra");
    }

    std::atomic<size_t> mismatches{0};
    std::atomic<size_t> done{0};
    std::vector<std::thread> workers;
    const unsigned num_threads = 8;

    for (unsigned w = 0; w < num_threads; ++w) {
        workers.emplace_back([&, w]() {
            // Each worker walks the batch from a different offset
            for (size_t i = 0; i < batch.size(); ++i) {
                size_t k = (i + w * 61) % batch.size();
                CHQueryResult r = engine->query_path(batch[k].first, batch[k].second);
                const CHQueryResult& ref = sequential[k];
                if (r.reachable != ref.reachable || r.error_code != ref.error_code ||
                    r.distance != ref.distance || r.meeting_node != ref.meeting_node ||
                    r.path != ref.path) {
                    ++mismatches;
                }
                ++done;
            }
        });
    }
    for (auto& t : workers) t.join();

    check_eq(done.load(), static_cast<size_t>(num_threads) * batch.size(), "done.load()");
    check_eq(mismatches.load(), size_t{0}, "mismatches.load()");
}

// ============================================================
// COORDINATE ROUTING
// ============================================================

void test_route_coordinates() {
    GraphStore g = GraphBuilder::create_grid(5, 5, 0.01);
    RoutingConfig config;
    HierarchyQueryEngine engine(Contractor(config).preprocess(g), config);
    DijkstraRouter dijkstra(config);

    RoutingRequest request;
    request.origin = make_point(0.0001, 0.0002);
    request.destination = make_point(0.0399, 0.0401);

    for (const RouteAlgorithm* algo : {static_cast<const RouteAlgorithm*>(&engine),
                                       static_cast<const RouteAlgorithm*>(&dijkstra)}) {
        RoutingResponse resp = algo->route(request, g);
        check(resp.ok, "resp.ok");
        check_eq(resp.error_code, ErrorCode::Ok, "resp.error_code");
        check_near(resp.cost, 0.08, 1e-9, "resp.cost");
        check_near(resp.duration, 0.08, 1e-9, "resp.duration");
        // 8 edges of 0.01 degree, about 1112 m each
        check_near(resp.distance, 8 * 1111.95, 1.0, "resp.distance");

        check_eq(resp.segments.size(), 8u, "resp.segments.size()");
        check_eq(resp.geometry.size(), 9u, "resp.geometry.size()");
        check_eq(resp.waypoints.size(), 2u, "resp.waypoints.size()");
        check_eq(resp.waypoints[0].node, 0u, "resp.waypoints[0].node");
        check_eq(resp.waypoints[1].node, 24u, "resp.waypoints[1].node");
        check(resp.waypoints[0].snap_distance > 0.0, "resp.waypoints[0].snap_distance > 0.0");
        check(resp.waypoints[0].snap_distance < 50.0, "resp.waypoints[0].snap_distance < 50.0");

        check_eq(resp.segments.front().from, 0u, "resp.segments.front().from");
        check_eq(resp.segments.back().to, 24u, "resp.segments.back().to");
        check_near(lon_of(resp.geometry.back()), 0.04, 1e-12, "lon_of(resp.geometry.back())");
    }

    // Every one of the 7 turns costs at least the slight-turn penalty
    request.options.apply_turn_penalties = true;
    RoutingResponse resp = engine.route(request, g);
    check(resp.ok, "resp.ok");
    check(resp.duration >= 0.08 + 7 * config.turn_penalties.slight - 1e-9, "resp.duration >= 0.08 + 7 * config.turn_penalties.slight - 1e-9");
    check(resp.duration <= 0.08 + 7 * config.turn_penalties.u_turn + 1e-9, "resp.duration <= 0.08 + 7 * config.turn_penalties.u_turn + 1e-9");
    check_near(resp.cost, 0.08, 1e-9, "resp.cost");

    // Geometry and segments can be left out
    request.options.include_geometry = false;
    request.options.include_segments = false;
    resp = engine.route(request, g);
    check(resp.ok, "resp.ok");
    check(resp.geometry.empty(), "resp.geometry.empty()");
    check(resp.segments.empty(), "resp.segments.empty()");
}

void test_route_invalid_coordinates() {
    GraphStore g = GraphBuilder::create_grid(3, 3, 0.01);
    HierarchyQueryEngine engine(Contractor().preprocess(g));

    RoutingRequest request;
    request.origin = make_point(200.0, 0.0);
    request.destination = make_point(0.01, 0.01);
    RoutingResponse resp = engine.route(request, g);
    check(!resp.ok, "!resp.ok");
    check_eq(resp.error_code, ErrorCode::InvalidCoordinates, "resp.error_code");

    // Valid coordinate, but no node within one grid cell
    request.origin = make_point(0.0, 0.0);
    request.destination = make_point(45.0, 45.0);
    resp = engine.route(request, g);
    check_eq(resp.error_code, ErrorCode::InvalidCoordinates, "resp.error_code");

    GraphStore empty;
    resp = DijkstraRouter().route(request, empty);
    check_eq(resp.error_code, ErrorCode::InvalidCoordinates, "resp.error_code");
}

void test_route_unreachable_and_mismatch() {
    GraphBuilder b;
    b.add_node(0.0, 0.0);
    b.add_node(0.001, 0.0);
    b.add_edge(0, 1, 1.0);
    GraphStore g = b.build();
    HierarchyQueryEngine engine(Contractor().preprocess(g));

    RoutingRequest request;
    request.origin = make_point(0.001, 0.0);
    request.destination = make_point(0.0, 0.0);
    RoutingResponse resp = engine.route(request, g);
    check(!resp.ok, "!resp.ok");
    check_eq(resp.error_code, ErrorCode::NoRouteFound, "resp.error_code");
    check_eq(resp.waypoints.size(), 2u, "resp.waypoints.size()");

    GraphStore other = GraphBuilder::create_grid(3, 3, 0.01);
    resp = engine.route(request, other);
    check_eq(resp.error_code, ErrorCode::GraphConstruction, "resp.error_code");
}

// ============================================================
// TURN RESTRICTIONS
// ============================================================

void test_restriction_avoided() {
    GraphStore g = restricted_diamond();
    for (const char* ordering : {"degree", "edge_difference"}) {
        RoutingConfig config;
        config.node_ordering = ordering;
        HierarchyQueryEngine engine(Contractor(config).preprocess(g), config);

        CHQueryResult r = engine.query_path(0, 2);
        check(r.reachable, "r.reachable");
        check_near(r.distance, 4.0, 1e-12, "r.distance");
        check(r.path == std::vector<EdgeId>({2, 3}), "r.path == std::vector<EdgeId>({2, 3})");

        // Each half of the forbidden turn is still usable on its own
        check_near(engine.query(0, 1).distance, 1.0, 1e-12, "engine.query(0, 1).distance");
        check_near(engine.query(1, 2).distance, 1.0, 1e-12, "engine.query(1, 2).distance");
    }

    // The baseline ignores restrictions
    check_near(DijkstraRouter().shortest_path(g, 0, 2).distance, 2.0, 1e-12, "DijkstraRouter().shortest_path(g, 0, 2).distance");
}

void test_restricted_grid_paths_are_legal() {
    GraphBuilder b;
    const size_t rows = 4, cols = 4;
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) b.add_node(0.01 * c, 0.01 * r);
    }
    std::vector<std::vector<EdgeId>> into(rows * cols), out_of(rows * cols);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            NodeId id = static_cast<NodeId>(r * cols + c);
            auto link = [&](NodeId other) {
                auto [fwd, bwd] = b.add_bidirectional_edge(id, other, 0.01);
                out_of[id].push_back(fwd);
                into[other].push_back(fwd);
                out_of[other].push_back(bwd);
                into[id].push_back(bwd);
            };
            if (c + 1 < cols) link(id + 1);
            if (r + 1 < rows) link(static_cast<NodeId>(id + cols));
        }
    }
    // Nodes 5 and 10 may start or end a route but never be passed through
    GraphStore plain = GraphBuilder::create_grid(rows, cols, 0.01);
    for (NodeId via : {5u, 10u}) {
        for (EdgeId in : into[via]) {
            for (EdgeId out : out_of[via]) {
                b.add_turn_restriction(in, via, out);
            }
        }
    }
    GraphStore g = b.build();
    check(g.validate().ok(), "g.validate().ok()");

    HierarchyQueryEngine engine(Contractor().preprocess(g));
    DijkstraRouter dijkstra;
    size_t reachable = 0;
    for (NodeId s = 0; s < g.node_count(); ++s) {
        std::vector<double> lower = dijkstra.distances_from(plain, s);
        for (NodeId t = 0; t < g.node_count(); ++t) {
            CHQueryResult r = engine.query_path(s, t);
            if (!r.reachable) continue;
            ++reachable;
            check_path(g, s, t, r);
            check(r.distance >= lower[t] - 1e-9, "r.distance >= lower[t] - 1e-9");
        }
    }
    check(reachable > g.node_count(), "reachable > g.node_count()");
}

}  // namespace

int main() {
    std::vector<TestCase> cases = {
        {"grid_oracle", test_grid_oracle},
        {"random_graphs", test_random_graphs},
        {"unreachable", test_unreachable},
        {"invalid_node_ids", test_invalid_node_ids},
        {"same_node", test_same_node},
        {"paths_match_dijkstra_cost", test_paths_match_dijkstra_cost},
        {"concurrent_queries", test_concurrent_queries},
        {"route_coordinates", test_route_coordinates},
        {"route_invalid_coordinates", test_route_invalid_coordinates},
        {"route_unreachable_and_mismatch", test_route_unreachable_and_mismatch},
        {"restriction_avoided", test_restriction_avoided},
        {"restricted_grid_paths_are_legal", test_restricted_grid_paths_are_legal},
    };
    return run_tests("routing", cases);
}
