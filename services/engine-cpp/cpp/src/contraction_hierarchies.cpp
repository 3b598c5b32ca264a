/**
 * @file contraction_hierarchies.cpp
 * @brief CH artifact - adjacency assembly, shortcut unpacking and persistence.
 *
 * Directory layout:
 *   ranks.parquet      node_id, rank
 *   shortcuts.parquet  source, target, cost, via, first_id, first_is_shortcut,
 *                      second_id, second_is_shortcut (creation order)
 *   hierarchy.json
 */

#include "contraction_hierarchies.hpp"
#include "parquet_io.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ch_routing {

namespace {

constexpr int kFormatVersion = 1;

}  // namespace

ContractionHierarchies::ContractionHierarchies(NodeOrder node_order,
                                               std::vector<Shortcut> shortcuts,
                                               std::vector<std::vector<CHArc>> forward_graph,
                                               std::vector<std::vector<CHArc>> backward_graph,
                                               TurnRestrictionIndex restrictions,
                                               size_t original_edge_count,
                                               ContractionStats stats)
    : node_order_(std::move(node_order)),
      shortcuts_(std::move(shortcuts)),
      forward_graph_(std::move(forward_graph)),
      backward_graph_(std::move(backward_graph)),
      restrictions_(std::move(restrictions)),
      original_edge_count_(original_edge_count),
      stats_(stats) {}

void ContractionHierarchies::seed_arcs(const GraphStore& graph,
                                       std::vector<std::vector<CHArc>>& forward_graph,
                                       std::vector<std::vector<CHArc>>& backward_graph) {
    forward_graph.assign(graph.node_count(), {});
    backward_graph.assign(graph.node_count(), {});

    for (size_t node_id = 0; node_id < graph.node_count(); ++node_id) {
        for (EdgeId edge_id : graph.outgoing_edges(static_cast<NodeId>(node_id))) {
            const Edge* e = graph.edge(edge_id);
            if (!e) continue;

            forward_graph[node_id].push_back({e->target, e->cost.base_time, ArcRef::edge(edge_id), edge_id, edge_id});
            backward_graph[e->target].push_back({static_cast<NodeId>(node_id), e->cost.base_time,
                                                 ArcRef::edge(edge_id), edge_id, edge_id});
        }
    }
}

void ContractionHierarchies::append_shortcut_arcs(const Shortcut& shortcut, uint32_t index,
                                                  std::vector<std::vector<CHArc>>& forward_graph,
                                                  std::vector<std::vector<CHArc>>& backward_graph) {
    forward_graph[shortcut.source].push_back({shortcut.target, shortcut.cost, ArcRef::shortcut(index),
                                              shortcut.first_edge, shortcut.last_edge});
    backward_graph[shortcut.target].push_back({shortcut.source, shortcut.cost, ArcRef::shortcut(index),
                                               shortcut.first_edge, shortcut.last_edge});
}

void ContractionHierarchies::unpack(ArcRef arc, std::vector<EdgeId>& out) const {
    std::vector<ArcRef> stack;
    stack.push_back(arc);

    while (!stack.empty()) {
        ArcRef top = stack.back();
        stack.pop_back();

        if (!top.is_shortcut) {
            out.push_back(top.id);
            continue;
        }
        const Shortcut& sc = shortcuts_.at(top.id);
        // Second half pushed first so the first half is expanded first
        stack.push_back(sc.second);
        stack.push_back(sc.first);
    }
}

std::vector<EdgeId> ContractionHierarchies::unpack_path(const std::vector<ArcRef>& arcs) const {
    std::vector<EdgeId> edges;
    for (const ArcRef& arc : arcs) {
        unpack(arc, edges);
    }
    return edges;
}

size_t ContractionHierarchies::memory_usage() const {
    size_t bytes = shortcuts_.capacity() * sizeof(Shortcut);
    bytes += (node_order_.sequence().capacity() + node_order_.ranks().capacity()) * sizeof(uint32_t);
    for (const auto& arcs : forward_graph_) bytes += arcs.capacity() * sizeof(CHArc);
    for (const auto& arcs : backward_graph_) bytes += arcs.capacity() * sizeof(CHArc);
    bytes += (forward_graph_.capacity() + backward_graph_.capacity()) * sizeof(std::vector<CHArc>);
    return bytes;
}

// ============================================================
// PERSISTENCE
// ============================================================

bool ContractionHierarchies::save(const std::string& dir) const {
    try {
        fs::create_directories(dir);

        {
            std::vector<uint32_t> node_ids, ranks;
            for (size_t node = 0; node < node_order_.size(); ++node) {
                node_ids.push_back(static_cast<uint32_t>(node));
                ranks.push_back(node_order_.rank(static_cast<NodeId>(node)));
            }
            auto schema = arrow::schema({
                arrow::field("node_id", arrow::uint32()),
                arrow::field("rank", arrow::uint32())
            });
            auto table = arrow::Table::Make(schema, {
                parquet_io::build_array<arrow::UInt32Builder>(node_ids),
                parquet_io::build_array<arrow::UInt32Builder>(ranks)
            });
            parquet_io::write_table((fs::path(dir) / "ranks.parquet").string(), table);
        }

        {
            std::vector<uint32_t> sources, targets, vias, first_ids, second_ids;
            std::vector<double> costs;
            std::vector<bool> first_sc, second_sc;
            for (const auto& sc : shortcuts_) {
                sources.push_back(sc.source);
                targets.push_back(sc.target);
                costs.push_back(sc.cost);
                vias.push_back(sc.via);
                first_ids.push_back(sc.first.id);
                first_sc.push_back(sc.first.is_shortcut);
                second_ids.push_back(sc.second.id);
                second_sc.push_back(sc.second.is_shortcut);
            }
            auto schema = arrow::schema({
                arrow::field("source", arrow::uint32()),
                arrow::field("target", arrow::uint32()),
                arrow::field("cost", arrow::float64()),
                arrow::field("via", arrow::uint32()),
                arrow::field("first_id", arrow::uint32()),
                arrow::field("first_is_shortcut", arrow::boolean()),
                arrow::field("second_id", arrow::uint32()),
                arrow::field("second_is_shortcut", arrow::boolean())
            });
            auto table = arrow::Table::Make(schema, {
                parquet_io::build_array<arrow::UInt32Builder>(sources),
                parquet_io::build_array<arrow::UInt32Builder>(targets),
                parquet_io::build_array<arrow::DoubleBuilder>(costs),
                parquet_io::build_array<arrow::UInt32Builder>(vias),
                parquet_io::build_array<arrow::UInt32Builder>(first_ids),
                parquet_io::build_array<arrow::BooleanBuilder>(first_sc),
                parquet_io::build_array<arrow::UInt32Builder>(second_ids),
                parquet_io::build_array<arrow::BooleanBuilder>(second_sc)
            });
            parquet_io::write_table((fs::path(dir) / "shortcuts.parquet").string(), table);
        }

        json doc = {
            {"format_version", kFormatVersion},
            {"node_count", node_count()},
            {"edge_count", original_edge_count_},
            {"shortcut_count", shortcuts_.size()},
            {"stats", {
                {"nodes_contracted", stats_.nodes_contracted},
                {"pairs_examined", stats_.pairs_examined},
                {"witness_searches", stats_.witness_searches},
                {"witnesses_found", stats_.witnesses_found},
                {"restricted_pairs", stats_.restricted_pairs},
                {"elapsed_ms", stats_.elapsed_ms}
            }}
        };
        std::ofstream meta_file(fs::path(dir) / "hierarchy.json");
        if (!meta_file) {
            std::cerr << "Failed to write hierarchy metadata in " << dir << "\n";
            return false;
        }
        meta_file << doc.dump(2) << "\n";
        return static_cast<bool>(meta_file);

    } catch (const std::exception& e) {
        std::cerr << "Error saving hierarchy to " << dir << ": " << e.what() << "\n";
        return false;
    }
}

std::shared_ptr<const ContractionHierarchies> ContractionHierarchies::load(const std::string& dir,
                                                                           const GraphStore& graph) {
    try {
        std::ifstream meta_file(fs::path(dir) / "hierarchy.json");
        if (!meta_file) {
            std::cerr << "Hierarchy metadata not found in " << dir << "\n";
            return nullptr;
        }
        json doc = json::parse(meta_file);
        if (doc.value("format_version", 0) != kFormatVersion) {
            std::cerr << "Unsupported hierarchy format version in " << dir << "\n";
            return nullptr;
        }
        if (doc.value("node_count", size_t{0}) != graph.node_count() ||
            doc.value("edge_count", size_t{0}) != graph.edge_count()) {
            std::cerr << "Hierarchy in " << dir << " was built for a different graph\n";
            return nullptr;
        }

        // Ranks
        auto rank_table = parquet_io::read_table((fs::path(dir) / "ranks.parquet").string());
        auto node_ids = parquet_io::column_values<arrow::UInt32Array, NodeId>(*rank_table, "node_id");
        auto rank_values = parquet_io::column_values<arrow::UInt32Array, uint32_t>(*rank_table, "rank");
        if (node_ids.size() != graph.node_count()) {
            std::cerr << "Rank table size does not match graph\n";
            return nullptr;
        }
        std::vector<uint32_t> ranks(graph.node_count(), 0);
        for (size_t i = 0; i < node_ids.size(); ++i) {
            if (node_ids[i] >= ranks.size()) {
                std::cerr << "Rank table references missing node " << node_ids[i] << "\n";
                return nullptr;
            }
            ranks[node_ids[i]] = rank_values[i];
        }
        NodeOrder order = NodeOrder::from_ranks(ranks);
        if (!order.is_total()) {
            std::cerr << "Loaded node order is not a bijection\n";
            return nullptr;
        }

        // Shortcuts
        auto sc_table = parquet_io::read_table((fs::path(dir) / "shortcuts.parquet").string());
        auto sources = parquet_io::column_values<arrow::UInt32Array, NodeId>(*sc_table, "source");
        auto targets = parquet_io::column_values<arrow::UInt32Array, NodeId>(*sc_table, "target");
        auto costs = parquet_io::column_values<arrow::DoubleArray, double>(*sc_table, "cost");
        auto vias = parquet_io::column_values<arrow::UInt32Array, NodeId>(*sc_table, "via");
        auto first_ids = parquet_io::column_values<arrow::UInt32Array, uint32_t>(*sc_table, "first_id");
        auto first_sc = parquet_io::column_values<arrow::BooleanArray, bool>(*sc_table, "first_is_shortcut");
        auto second_ids = parquet_io::column_values<arrow::UInt32Array, uint32_t>(*sc_table, "second_id");
        auto second_sc = parquet_io::column_values<arrow::BooleanArray, bool>(*sc_table, "second_is_shortcut");

        std::vector<std::vector<CHArc>> forward_graph, backward_graph;
        seed_arcs(graph, forward_graph, backward_graph);

        std::vector<Shortcut> shortcuts;
        shortcuts.reserve(sources.size());

        // Children always precede parents in creation order
        struct ArcInfo { NodeId from; NodeId to; double cost; EdgeId first_edge; EdgeId last_edge; };
        auto arc_info = [&](ArcRef ref, size_t limit, ArcInfo& info) -> bool {
            if (ref.is_shortcut) {
                if (ref.id >= limit) return false;
                const Shortcut& sc = shortcuts[ref.id];
                info = {sc.source, sc.target, sc.cost, sc.first_edge, sc.last_edge};
                return true;
            }
            const Edge* e = graph.edge(ref.id);
            if (!e) return false;
            info = {e->source, e->target, e->cost.base_time, e->id, e->id};
            return true;
        };

        for (size_t i = 0; i < sources.size(); ++i) {
            Shortcut sc;
            sc.source = sources[i];
            sc.target = targets[i];
            sc.cost = costs[i];
            sc.via = vias[i];
            sc.first = {first_ids[i], first_sc[i]};
            sc.second = {second_ids[i], second_sc[i]};

            ArcInfo a, b;
            if (!arc_info(sc.first, i, a) || !arc_info(sc.second, i, b) ||
                a.from != sc.source || a.to != sc.via || b.from != sc.via || b.to != sc.target ||
                sc.source >= graph.node_count() || sc.target >= graph.node_count()) {
                std::cerr << "Shortcut " << i << " is inconsistent with the graph\n";
                return nullptr;
            }
            if (std::fabs(sc.cost - (a.cost + b.cost)) > 1e-9 * std::max(1.0, std::fabs(sc.cost))) {
                std::cerr << "Shortcut " << i << " cost does not match its parts\n";
                return nullptr;
            }
            sc.first_edge = a.first_edge;
            sc.last_edge = b.last_edge;

            shortcuts.push_back(sc);
            append_shortcut_arcs(sc, static_cast<uint32_t>(i), forward_graph, backward_graph);
        }

        ContractionStats stats;
        if (doc.contains("stats")) {
            const auto& s = doc["stats"];
            stats.nodes_contracted = s.value("nodes_contracted", size_t{0});
            stats.pairs_examined = s.value("pairs_examined", size_t{0});
            stats.witness_searches = s.value("witness_searches", size_t{0});
            stats.witnesses_found = s.value("witnesses_found", size_t{0});
            stats.restricted_pairs = s.value("restricted_pairs", size_t{0});
            stats.elapsed_ms = s.value("elapsed_ms", 0.0);
        }

        return std::make_shared<ContractionHierarchies>(
            std::move(order), std::move(shortcuts), std::move(forward_graph), std::move(backward_graph),
            graph.restriction_index(), graph.edge_count(), stats);

    } catch (const std::exception& e) {
        std::cerr << "Error loading hierarchy from " << dir << ": " << e.what() << "\n";
        return nullptr;
    }
}

}  // namespace ch_routing
