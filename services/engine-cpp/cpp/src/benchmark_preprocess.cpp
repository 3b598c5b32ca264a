/**
 * @file benchmark_preprocess.cpp
 * @brief Benchmark tool for CH preprocessing time, memory and query speed on grid graphs.
 */

#include "contractor.hpp"
#include "dijkstra_router.hpp"
#include "graph_builder.hpp"
#include "hierarchy_query.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <sys/resource.h>
#include <iomanip>
#include <chrono>

using namespace ch_routing;

// Helper to get current RSS memory usage in MB
double get_memory_usage_mb() {
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        return usage.ru_maxrss / 1024.0; // Linux: ru_maxrss is in KB
    }
    return 0.0;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --grid N           Grid side length (default: 50)\n"
              << "  --config PATH      Engine config JSON\n"
              << "  --ordering NAME    Node ordering: degree, edge_difference\n"
              << "  --queries N        Random queries to time (default: 1000)\n"
              << "  --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    size_t grid = 50;
    size_t num_queries = 1000;
    std::string config_path, ordering;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--grid" && i + 1 < argc) {
            grid = std::stoul(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--ordering" && i + 1 < argc) {
            ordering = argv[++i];
        } else if (arg == "--queries" && i + 1 < argc) {
            num_queries = std::stoul(argv[++i]);
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    if (grid == 0) {
        print_usage(argv[0]);
        return 1;
    }

    RoutingConfig config;
    if (!config_path.empty() && !load_routing_config(config_path, config)) {
        std::cerr << "Failed to load config: " << config_path << "\n";
        return 1;
    }
    if (!ordering.empty()) config.node_ordering = ordering;

    std::cout << "Starting Preprocessing Benchmark\n";
    std::cout << "Grid: " << grid << "x" << grid << ", ordering: " << config.node_ordering << "\n";
    print_separator();

    double baseline_mem = get_memory_usage_mb();
    std::cout << "Baseline Memory: " << std::fixed << std::setprecision(2) << baseline_mem << " MB\n";

    auto graph = std::make_shared<const GraphStore>(GraphBuilder::create_grid(grid, grid, 0.01));
    std::cout << "Graph: " << graph->node_count() << " nodes, " << graph->edge_count() << " edges, "
              << (graph->memory_usage() / 1024.0 / 1024.0) << " MB\n";
    print_separator();

    std::shared_ptr<const ContractionHierarchies> ch;
    try {
        Contractor contractor(config);

        std::cout << "[1] Preprocessing...\n";
        auto t0 = std::chrono::steady_clock::now();
        ch = contractor.preprocess(*graph);
        auto t1 = std::chrono::steady_clock::now();
        double dt = std::chrono::duration<double>(t1 - t0).count();

        const ContractionStats& stats = ch->stats();
        std::cout << "Shortcuts: " << ch->shortcut_count() << "\n";
        std::cout << "Witness searches: " << stats.witness_searches
                  << ", witnesses found: " << stats.witnesses_found
                  << " / " << stats.pairs_examined << " pairs\n";
        std::cout << "Time: " << dt << " s\n";
        std::cout << "Total RSS: " << get_memory_usage_mb() << " MB\n";
        std::cout << "Hierarchy Size: " << (ch->memory_usage() / 1024.0 / 1024.0) << " MB\n";
    } catch (const std::exception& e) {
        std::cerr << "Preprocessing failed: " << e.what() << "\n";
        return 1;
    }
    print_separator();

    HierarchyQueryEngine engine(ch, config);
    DijkstraRouter dijkstra(config);

    std::mt19937 rng(42);
    std::uniform_int_distribution<NodeId> pick(0, static_cast<NodeId>(graph->node_count() - 1));
    std::vector<std::pair<NodeId, NodeId>> pairs;
    for (size_t i = 0; i < num_queries; ++i) pairs.emplace_back(pick(rng), pick(rng));

    std::cout << "[2] Running " << num_queries << " queries...\n";

    size_t ch_settled = 0, dij_settled = 0, mismatches = 0;
    double ch_ms = 0, dij_ms = 0;
    for (const auto& [s, t] : pairs) {
        auto q0 = std::chrono::steady_clock::now();
        CHQueryResult r = engine.query(s, t);
        auto q1 = std::chrono::steady_clock::now();
        QueryResult expected = dijkstra.shortest_path(*graph, s, t);
        auto q2 = std::chrono::steady_clock::now();

        ch_ms += std::chrono::duration<double, std::milli>(q1 - q0).count();
        dij_ms += std::chrono::duration<double, std::milli>(q2 - q1).count();
        ch_settled += r.settled_nodes;
        dij_settled += expected.settled_nodes;

        if (r.reachable != expected.reachable ||
            (r.reachable && std::abs(r.distance - expected.distance) > 1e-9 * std::max(1.0, expected.distance))) {
            ++mismatches;
        }
    }

    double n = static_cast<double>(std::max<size_t>(num_queries, 1));
    std::cout << "CH:       " << std::setprecision(4) << ch_ms / n << " ms/query, "
              << ch_settled / n << " settled\n";
    std::cout << "Dijkstra: " << dij_ms / n << " ms/query, " << dij_settled / n << " settled\n";
    std::cout << "Mismatches: " << mismatches << "\n";
    print_separator();

    return mismatches == 0 ? 0 : 1;
}
