/**
 * @file graph_store_io.cpp
 * @brief GraphStore persistence - Parquet tables plus a JSON metadata file.
 *
 * Directory layout:
 *   nodes.parquet              node_id, lon, lat, elevation (nullable)
 *   edges.parquet              edge_id, source, target, base_time, distance, bearing
 *   adjacency.parquet          node_id, edge_id in forward bucket order
 *   turn_restrictions.parquet  from_edge, via_node, to_edge
 *   metadata.json
 */

#include "graph_store.hpp"
#include "parquet_io.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ch_routing {

namespace {

constexpr int kFormatVersion = 1;

json metadata_to_json(const GraphMetadata& meta, size_t node_count, size_t edge_count) {
    json doc = {
        {"format_version", kFormatVersion},
        {"source", meta.source},
        {"created_at", meta.created_at},
        {"node_count", node_count},
        {"edge_count", edge_count}
    };
    if (meta.bounds) {
        doc["bounds"] = {
            {"min_lon", meta.bounds->min_lon},
            {"min_lat", meta.bounds->min_lat},
            {"max_lon", meta.bounds->max_lon},
            {"max_lat", meta.bounds->max_lat}
        };
    }
    return doc;
}

GraphMetadata metadata_from_json(const json& doc) {
    GraphMetadata meta;
    meta.source = doc.value("source", "");
    meta.created_at = doc.value("created_at", "");
    if (doc.contains("bounds")) {
        const auto& b = doc["bounds"];
        meta.bounds = GeoBounds{b.at("min_lon").get<double>(), b.at("min_lat").get<double>(),
                                b.at("max_lon").get<double>(), b.at("max_lat").get<double>()};
    }
    return meta;
}

}  // namespace

bool GraphStore::save(const std::string& dir) const {
    try {
        fs::create_directories(dir);

        // Nodes
        {
            std::vector<uint32_t> ids;
            std::vector<double> lons, lats;
            std::vector<std::optional<double>> elevations;
            for (const auto& n : nodes_) {
                ids.push_back(n.id);
                lons.push_back(lon_of(n.location));
                lats.push_back(lat_of(n.location));
                elevations.push_back(n.elevation);
            }
            auto schema = arrow::schema({
                arrow::field("node_id", arrow::uint32()),
                arrow::field("lon", arrow::float64()),
                arrow::field("lat", arrow::float64()),
                arrow::field("elevation", arrow::float64(), true)
            });
            auto table = arrow::Table::Make(schema, {
                parquet_io::build_array<arrow::UInt32Builder>(ids),
                parquet_io::build_array<arrow::DoubleBuilder>(lons),
                parquet_io::build_array<arrow::DoubleBuilder>(lats),
                parquet_io::build_optional_doubles(elevations)
            });
            parquet_io::write_table((fs::path(dir) / "nodes.parquet").string(), table);
        }

        // Edges
        {
            std::vector<uint32_t> ids, sources, targets;
            std::vector<double> times, distances, bearings;
            for (const auto& e : edges_) {
                ids.push_back(e.id);
                sources.push_back(e.source);
                targets.push_back(e.target);
                times.push_back(e.cost.base_time);
                distances.push_back(e.cost.distance);
                bearings.push_back(e.bearing);
            }
            auto schema = arrow::schema({
                arrow::field("edge_id", arrow::uint32()),
                arrow::field("source", arrow::uint32()),
                arrow::field("target", arrow::uint32()),
                arrow::field("base_time", arrow::float64()),
                arrow::field("distance", arrow::float64()),
                arrow::field("bearing", arrow::float64())
            });
            auto table = arrow::Table::Make(schema, {
                parquet_io::build_array<arrow::UInt32Builder>(ids),
                parquet_io::build_array<arrow::UInt32Builder>(sources),
                parquet_io::build_array<arrow::UInt32Builder>(targets),
                parquet_io::build_array<arrow::DoubleBuilder>(times),
                parquet_io::build_array<arrow::DoubleBuilder>(distances),
                parquet_io::build_array<arrow::DoubleBuilder>(bearings)
            });
            parquet_io::write_table((fs::path(dir) / "edges.parquet").string(), table);
        }

        // Forward adjacency, bucket order preserved
        {
            std::vector<uint32_t> node_ids, edge_ids;
            for (size_t node_id = 0; node_id < adjacency_.size(); ++node_id) {
                for (EdgeId edge_id : adjacency_[node_id]) {
                    node_ids.push_back(static_cast<uint32_t>(node_id));
                    edge_ids.push_back(edge_id);
                }
            }
            auto schema = arrow::schema({
                arrow::field("node_id", arrow::uint32()),
                arrow::field("edge_id", arrow::uint32())
            });
            auto table = arrow::Table::Make(schema, {
                parquet_io::build_array<arrow::UInt32Builder>(node_ids),
                parquet_io::build_array<arrow::UInt32Builder>(edge_ids)
            });
            parquet_io::write_table((fs::path(dir) / "adjacency.parquet").string(), table);
        }

        // Turn restrictions
        {
            std::vector<uint32_t> from_edges, via_nodes, to_edges;
            for (const auto& r : turn_restrictions_) {
                from_edges.push_back(r.from_edge);
                via_nodes.push_back(r.via_node);
                to_edges.push_back(r.to_edge);
            }
            auto schema = arrow::schema({
                arrow::field("from_edge", arrow::uint32()),
                arrow::field("via_node", arrow::uint32()),
                arrow::field("to_edge", arrow::uint32())
            });
            auto table = arrow::Table::Make(schema, {
                parquet_io::build_array<arrow::UInt32Builder>(from_edges),
                parquet_io::build_array<arrow::UInt32Builder>(via_nodes),
                parquet_io::build_array<arrow::UInt32Builder>(to_edges)
            });
            parquet_io::write_table((fs::path(dir) / "turn_restrictions.parquet").string(), table);
        }

        std::ofstream meta_file(fs::path(dir) / "metadata.json");
        if (!meta_file) {
            std::cerr << "Failed to write graph metadata in " << dir << "\n";
            return false;
        }
        meta_file << metadata_to_json(metadata_, nodes_.size(), edges_.size()).dump(2) << "\n";
        return static_cast<bool>(meta_file);

    } catch (const std::exception& e) {
        std::cerr << "Error saving graph to " << dir << ": " << e.what() << "\n";
        return false;
    }
}

bool GraphStore::load(const std::string& dir) {
    try {
        std::ifstream meta_file(fs::path(dir) / "metadata.json");
        if (!meta_file) {
            std::cerr << "Graph metadata not found in " << dir << "\n";
            return false;
        }
        json meta_doc = json::parse(meta_file);
        if (meta_doc.value("format_version", 0) != kFormatVersion) {
            std::cerr << "Unsupported graph format version in " << dir << "\n";
            return false;
        }

        // Nodes
        auto node_table = parquet_io::read_table((fs::path(dir) / "nodes.parquet").string());
        auto node_ids = parquet_io::column_values<arrow::UInt32Array, NodeId>(*node_table, "node_id");
        auto lons = parquet_io::column_values<arrow::DoubleArray, double>(*node_table, "lon");
        auto lats = parquet_io::column_values<arrow::DoubleArray, double>(*node_table, "lat");
        auto elevations = parquet_io::optional_double_values(*node_table, "elevation");

        std::vector<Node> nodes(node_ids.size());
        for (size_t i = 0; i < node_ids.size(); ++i) {
            nodes[i].id = node_ids[i];
            nodes[i].location = make_point(lons[i], lats[i]);
            nodes[i].elevation = elevations[i];
        }

        // Edges
        auto edge_table = parquet_io::read_table((fs::path(dir) / "edges.parquet").string());
        auto edge_ids = parquet_io::column_values<arrow::UInt32Array, EdgeId>(*edge_table, "edge_id");
        auto sources = parquet_io::column_values<arrow::UInt32Array, NodeId>(*edge_table, "source");
        auto targets = parquet_io::column_values<arrow::UInt32Array, NodeId>(*edge_table, "target");
        auto times = parquet_io::column_values<arrow::DoubleArray, double>(*edge_table, "base_time");
        auto distances = parquet_io::column_values<arrow::DoubleArray, double>(*edge_table, "distance");
        auto bearings = parquet_io::column_values<arrow::DoubleArray, double>(*edge_table, "bearing");

        std::vector<Edge> edges(edge_ids.size());
        for (size_t i = 0; i < edge_ids.size(); ++i) {
            edges[i].id = edge_ids[i];
            edges[i].source = sources[i];
            edges[i].target = targets[i];
            edges[i].cost.base_time = times[i];
            edges[i].cost.distance = distances[i];
            edges[i].bearing = bearings[i];
        }

        // Adjacency
        auto adj_table = parquet_io::read_table((fs::path(dir) / "adjacency.parquet").string());
        auto adj_nodes = parquet_io::column_values<arrow::UInt32Array, NodeId>(*adj_table, "node_id");
        auto adj_edges = parquet_io::column_values<arrow::UInt32Array, EdgeId>(*adj_table, "edge_id");

        std::vector<std::vector<EdgeId>> adjacency(nodes.size());
        for (size_t i = 0; i < adj_nodes.size(); ++i) {
            if (adj_nodes[i] >= adjacency.size()) {
                std::cerr << "Adjacency row " << i << " references missing node " << adj_nodes[i] << "\n";
                return false;
            }
            adjacency[adj_nodes[i]].push_back(adj_edges[i]);
        }

        // Turn restrictions
        auto tr_table = parquet_io::read_table((fs::path(dir) / "turn_restrictions.parquet").string());
        auto from_edges = parquet_io::column_values<arrow::UInt32Array, EdgeId>(*tr_table, "from_edge");
        auto via_nodes = parquet_io::column_values<arrow::UInt32Array, NodeId>(*tr_table, "via_node");
        auto to_edges = parquet_io::column_values<arrow::UInt32Array, EdgeId>(*tr_table, "to_edge");

        std::vector<TurnRestriction> restrictions(from_edges.size());
        for (size_t i = 0; i < from_edges.size(); ++i) {
            restrictions[i] = {from_edges[i], via_nodes[i], to_edges[i]};
        }

        GraphStore loaded(std::move(nodes), std::move(edges), std::move(adjacency), std::move(restrictions),
                          metadata_from_json(meta_doc), cell_size());

        Status status = loaded.validate();
        if (!status.ok()) {
            std::cerr << "Loaded graph failed validation (" << to_string(status.code) << "): "
                      << status.message << "\n";
            return false;
        }

        *this = std::move(loaded);
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error loading graph from " << dir << ": " << e.what() << "\n";
        return false;
    }
}

}  // namespace ch_routing
