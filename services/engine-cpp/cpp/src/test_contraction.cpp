/**
 * @file test_contraction.cpp
 * @brief Node ordering, contraction and hierarchy persistence tests.
 */

#include "contraction_hierarchies.hpp"
#include "contractor.hpp"
#include "dijkstra_router.hpp"
#include "graph_builder.hpp"
#include "hierarchy_query.hpp"
#include "node_orderer.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

using namespace ch_routing;
using namespace ch_routing::testing;

namespace {

/// Orderer returning a fixed sequence, for tests that need a known contraction order.
class FixedOrderer : public NodeOrderer {
public:
    explicit FixedOrderer(std::vector<NodeId> sequence) : sequence_(std::move(sequence)) {}
    NodeOrder order(const GraphStore&) const override { return NodeOrder(sequence_); }
    const char* name() const override { return "fixed"; }

private:
    std::vector<NodeId> sequence_;
};

double arc_cost(const ContractionHierarchies& ch, const GraphStore& g, ArcRef ref) {
    return ref.is_shortcut ? ch.shortcuts()[ref.id].cost : g.edge(ref.id)->cost.base_time;
}

NodeId arc_source(const ContractionHierarchies& ch, const GraphStore& g, ArcRef ref) {
    return ref.is_shortcut ? ch.shortcuts()[ref.id].source : g.edge(ref.id)->source;
}

NodeId arc_target(const ContractionHierarchies& ch, const GraphStore& g, ArcRef ref) {
    return ref.is_shortcut ? ch.shortcuts()[ref.id].target : g.edge(ref.id)->target;
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
// NODE ORDERING
// ============================================================

void test_orders_are_total() {
    GraphStore g = GraphBuilder::create_grid(4, 6, 0.01);
    for (const char* name : {"degree", "edge_difference"}) {
        auto orderer = make_node_orderer(name);
        check(orderer != nullptr, "orderer != nullptr");
        NodeOrder order = orderer->order(g);
        check_eq(order.size(), g.node_count(), "order.size()");
        check(order.is_total(), "order.is_total()");

        std::set<NodeId> seen(order.sequence().begin(), order.sequence().end());
        check_eq(seen.size(), g.node_count(), "seen.size()");
        for (uint32_t r = 0; r < order.size(); ++r) {
            check_eq(order.rank(order.node_at(r)), r, "order.rank(order.node_at(r))");
        }
    }
}

void test_degree_order_on_grid() {
    // Corners (degree 4) first, then border midpoints (6), then the centre (8)
    GraphStore g = GraphBuilder::create_grid(3, 3, 0.01);
    NodeOrder order = DegreeNodeOrderer().order(g);
    std::vector<NodeId> expected = {0, 2, 6, 8, 1, 3, 5, 7, 4};
    check(order.sequence() == expected, "order.sequence() == expected");
}

void test_node_order_from_ranks() {
    NodeOrder order = NodeOrder::from_ranks({2, 0, 1});
    check(order.is_total(), "order.is_total()");
    check_eq(order.node_at(0), 1u, "order.node_at(0)");
    check_eq(order.node_at(2), 0u, "order.node_at(2)");

    check(!NodeOrder({0, 0, 1}).is_total(), "!NodeOrder({0, 0, 1}).is_total()");
    check(!NodeOrder({0, 5}).is_total(), "!NodeOrder({0, 5}).is_total()");
}

void test_unknown_ordering() {
    check(make_node_orderer("random") == nullptr, "make_node_orderer(\"random\") == nullptr");

    RoutingConfig config;
    config.node_ordering = "random";
    bool thrown = false;
    try {
        Contractor contractor(config);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    check(thrown, "thrown");
}

// ============================================================
// CONTRACTION
// ============================================================

void test_grid_5x5() {
    GraphStore g = GraphBuilder::create_grid(5, 5, 0.01);
    auto ch = Contractor().preprocess(g);

    check_eq(ch->node_count(), 25u, "ch->node_count()");
    check_eq(ch->node_order().size(), 25u, "ch->node_order().size()");
    check(ch->node_order().is_total(), "ch->node_order().is_total()");
    check_eq(ch->stats().nodes_contracted, 25u, "ch->stats().nodes_contracted");
    check_eq(ch->original_edge_count(), g.edge_count(), "ch->original_edge_count()");

    HierarchyQueryEngine engine(ch);
    CHQueryResult r = engine.query(0, 24);
    check(r.reachable, "r.reachable");
    check_near(r.distance, 0.08, 1e-9, "r.distance");
}

void test_shortcut_invariants() {
    GraphStore g = GraphBuilder::create_grid(6, 6, 0.01);
    RoutingConfig config;
    config.node_ordering = "edge_difference";
    auto ch = Contractor(config).preprocess(g);
    check(ch->shortcut_count() > 0, "ch->shortcut_count() > 0");

    for (const Shortcut& sc : ch->shortcuts()) {
        // Cost is exactly the sum of its two halves
        check_eq(sc.cost, arc_cost(*ch, g, sc.first) + arc_cost(*ch, g, sc.second), "sc.cost");

        check_eq(arc_source(*ch, g, sc.first), sc.source, "arc_source(*ch, g, sc.first)");
        check_eq(arc_target(*ch, g, sc.first), sc.via, "arc_target(*ch, g, sc.first)");
        check_eq(arc_source(*ch, g, sc.second), sc.via, "arc_source(*ch, g, sc.second)");
        check_eq(arc_target(*ch, g, sc.second), sc.target, "arc_target(*ch, g, sc.second)");

        check(ch->rank(sc.via) < ch->rank(sc.source), "ch->rank(sc.via) < ch->rank(sc.source)");
        check(ch->rank(sc.via) < ch->rank(sc.target), "ch->rank(sc.via) < ch->rank(sc.target)");
        check(sc.source != sc.target, "sc.source != sc.target");

        // Unpacked edges form a connected chain with the same cost
        std::vector<EdgeId> edges;
        ch->unpack(ArcRef::shortcut(static_cast<uint32_t>(&sc - ch->shortcuts().data())), edges);
        check(edges.size() >= 2, "edges.size() >= 2");
        check_eq(g.edge(edges.front())->source, sc.source, "g.edge(edges.front())->source");
        check_eq(g.edge(edges.back())->target, sc.target, "g.edge(edges.back())->target");
        check_eq(edges.front(), sc.first_edge, "edges.front()");
        check_eq(edges.back(), sc.last_edge, "edges.back()");
        double sum = 0;
        for (size_t i = 0; i < edges.size(); ++i) {
            sum += g.edge(edges[i])->cost.base_time;
            if (i > 0) check_eq(g.edge(edges[i - 1])->target, g.edge(edges[i])->source, "g.edge(edges[i - 1])->target");
        }
        check_near(sum, sc.cost, 1e-9, "sum");
    }
}

void test_deterministic() {
    GraphStore g = GraphBuilder::create_grid(5, 7, 0.01);
    auto a = Contractor().preprocess(g);
    auto b = Contractor().preprocess(g);

    check(a->node_order() == b->node_order(), "a->node_order() == b->node_order()");
    check_eq(a->shortcut_count(), b->shortcut_count(), "a->shortcut_count()");
    for (size_t i = 0; i < a->shortcut_count(); ++i) {
        const Shortcut& x = a->shortcuts()[i];
        const Shortcut& y = b->shortcuts()[i];
        check_eq(x.source, y.source, "x.source");
        check_eq(x.target, y.target, "x.target");
        check_eq(x.via, y.via, "x.via");
        check_eq(x.cost, y.cost, "x.cost");
        check(x.first == y.first, "x.first == y.first");
        check(x.second == y.second, "x.second == y.second");
    }
}

void test_witness_bounds_keep_distances() {
    GraphStore g = GraphBuilder::create_grid(5, 5, 0.01);
    auto full = Contractor().preprocess(g);

    RoutingConfig tight;
    tight.witness_max_hops = 0;
    tight.witness_max_settled = 1;
    auto bounded = Contractor(tight).preprocess(g);

    // Weaker witness searches can only add shortcuts
    check(bounded->shortcut_count() >= full->shortcut_count(), "bounded->shortcut_count() >= full->shortcut_count()");
    check_eq(bounded->stats().witnesses_found, 0u, "bounded->stats().witnesses_found");

    HierarchyQueryEngine a(full);
    HierarchyQueryEngine b(bounded);
    DijkstraRouter dijkstra;
    for (NodeId s = 0; s < g.node_count(); ++s) {
        std::vector<double> expected = dijkstra.distances_from(g, s);
        for (NodeId t = 0; t < g.node_count(); ++t) {
            check(same_distance(a.query(s, t).distance, expected[t]), "same_distance(a.query(s, t).distance, expected[t])");
            check(same_distance(b.query(s, t).distance, expected[t]), "same_distance(b.query(s, t).distance, expected[t])");
        }
    }
}

void test_restricted_pair_skipped() {
    GraphStore g = restricted_diamond();
    auto orderer = std::make_shared<FixedOrderer>(std::vector<NodeId>{1, 3, 0, 2});
    auto ch = Contractor(RoutingConfig(), orderer).preprocess(g);

    check_eq(ch->stats().restricted_pairs, 1u, "ch->stats().restricted_pairs");
    // Only the detour through 3 is shortcut; 0 -> 1 -> 2 would cross the forbidden turn
    check_eq(ch->shortcut_count(), 1u, "ch->shortcut_count()");
    check_eq(ch->shortcuts()[0].via, 3u, "ch->shortcuts()[0].via");
    check_near(ch->shortcuts()[0].cost, 4.0, 0.0, "ch->shortcuts()[0].cost");
}

void test_invalid_graph_rejected() {
    std::vector<Node> nodes(2);
    nodes[0].id = 0;
    nodes[1].id = 1;
    Edge e;
    e.id = 0;
    e.source = 0;
    e.target = 1;
    GraphStore g(nodes, {e}, {{0, 3}, {}}, {});

    bool thrown = false;
    try {
        Contractor().preprocess(g);
    } catch (const RoutingError& err) {
        thrown = true;
        check_eq(err.code(), ErrorCode::EdgeNotFound, "err.code()");
    }
    check(thrown, "thrown");
}

void test_non_total_order_rejected() {
    GraphStore g = GraphBuilder::create_grid(2, 2, 0.01);
    auto orderer = std::make_shared<FixedOrderer>(std::vector<NodeId>{0, 1, 1, 3});
    bool thrown = false;
    try {
        Contractor(RoutingConfig(), orderer).preprocess(g);
    } catch (const RoutingError& err) {
        thrown = true;
        check_eq(err.code(), ErrorCode::GraphConstruction, "err.code()");
    }
    check(thrown, "thrown");
}

void test_trivial_graphs() {
    GraphStore empty;
    auto ch = Contractor().preprocess(empty);
    check_eq(ch->node_count(), 0u, "ch->node_count()");
    check_eq(ch->shortcut_count(), 0u, "ch->shortcut_count()");

    GraphBuilder b;
    b.add_node(0.0, 0.0);
    GraphStore single = b.build();
    ch = Contractor().preprocess(single);
    check_eq(ch->node_count(), 1u, "ch->node_count()");
    HierarchyQueryEngine engine(ch);
    CHQueryResult r = engine.query(0, 0);
    check(r.reachable, "r.reachable");
    check_near(r.distance, 0.0, 0.0, "r.distance");
}

void test_preprocess_async() {
    auto g = std::make_shared<const GraphStore>(GraphBuilder::create_grid(6, 6, 0.01));
    Contractor contractor;

    auto future = contractor.preprocess_async(g);
    auto ch = future.get();
    check(ch != nullptr, "ch != nullptr");
    check_eq(ch->shortcut_count(), contractor.preprocess(*g)->shortcut_count(), "ch->shortcut_count()");

    bool thrown = false;
    try {
        contractor.preprocess_async(nullptr).get();
    } catch (const RoutingError&) {
        thrown = true;
    }
    check(thrown, "thrown");
}

// ============================================================
// PERSISTENCE
// ============================================================

void test_hierarchy_roundtrip() {
    GraphStore g = GraphBuilder::create_grid(5, 6, 0.01);
    auto ch = Contractor().preprocess(g);

    std::string dir = scratch_dir("hierarchy");
    check(ch->save(dir), "ch->save(dir)");

    auto loaded = ContractionHierarchies::load(dir, g);
    check(loaded != nullptr, "loaded != nullptr");
    check(loaded->node_order() == ch->node_order(), "loaded->node_order() == ch->node_order()");
    check_eq(loaded->shortcut_count(), ch->shortcut_count(), "loaded->shortcut_count()");
    check_eq(loaded->stats().witness_searches, ch->stats().witness_searches, "loaded->stats().witness_searches");
    for (size_t i = 0; i < ch->shortcut_count(); ++i) {
        check_eq(loaded->shortcuts()[i].cost, ch->shortcuts()[i].cost, "loaded->shortcuts()[i].cost");
        check_eq(loaded->shortcuts()[i].via, ch->shortcuts()[i].via, "loaded->shortcuts()[i].via");
        check_eq(loaded->shortcuts()[i].first_edge, ch->shortcuts()[i].first_edge, "loaded->shortcuts()[i].first_edge");
        check_eq(loaded->shortcuts()[i].last_edge, ch->shortcuts()[i].last_edge, "loaded->shortcuts()[i].last_edge");
    }

    HierarchyQueryEngine before(ch);
    HierarchyQueryEngine after(loaded);
    for (NodeId s = 0; s < g.node_count(); s += 3) {
        for (NodeId t = 0; t < g.node_count(); ++t) {
            CHQueryResult x = before.query_path(s, t);
            CHQueryResult y = after.query_path(s, t);
            check_eq(x.distance, y.distance, "x.distance");
            check(x.path == y.path, "x.path == y.path");
        }
    }

    // Hierarchy does not belong to a different graph
    GraphStore other = GraphBuilder::create_grid(4, 4, 0.01);
    check(ContractionHierarchies::load(dir, other) == nullptr, "ContractionHierarchies::load(dir, other) == nullptr");
    check(ContractionHierarchies::load("/nonexistent/ch_routing/ch", g) == nullptr, "ContractionHierarchies::load(\"/nonexistent/ch_routing/ch\", g) == nullptr");

    std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
    std::vector<TestCase> cases = {
        {"orders_are_total", test_orders_are_total},
        {"degree_order_on_grid", test_degree_order_on_grid},
        {"node_order_from_ranks", test_node_order_from_ranks},
        {"unknown_ordering", test_unknown_ordering},
        {"grid_5x5", test_grid_5x5},
        {"shortcut_invariants", test_shortcut_invariants},
        {"deterministic", test_deterministic},
        {"witness_bounds_keep_distances", test_witness_bounds_keep_distances},
        {"restricted_pair_skipped", test_restricted_pair_skipped},
        {"invalid_graph_rejected", test_invalid_graph_rejected},
        {"non_total_order_rejected", test_non_total_order_rejected},
        {"trivial_graphs", test_trivial_graphs},
        {"preprocess_async", test_preprocess_async},
        {"hierarchy_roundtrip", test_hierarchy_roundtrip},
    };
    return run_tests("contraction", cases);
}
