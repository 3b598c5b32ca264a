/**
 * @file graph_store.cpp
 * @brief GraphStore implementation - lookups, spatial index and validation.
 */

#include "graph_store.hpp"
#include "geo_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace ch_routing {

namespace {

const std::vector<EdgeId> kNoEdges;

std::string edge_str(EdgeId id) { return std::to_string(id); }

}  // namespace

// ============================================================
// TURN RESTRICTIONS
// ============================================================

TurnRestrictionIndex::TurnRestrictionIndex(const std::vector<TurnRestriction>& restrictions) {
    for (const auto& r : restrictions) {
        by_via_[r.via_node].emplace_back(r.from_edge, r.to_edge);
        ++count_;
    }
}

bool TurnRestrictionIndex::is_restricted(EdgeId from_edge, NodeId via_node, EdgeId to_edge) const {
    if (count_ == 0) return false;
    auto it = by_via_.find(via_node);
    if (it == by_via_.end()) return false;
    for (const auto& [from, to] : it->second) {
        if (from == from_edge && to == to_edge) return true;
    }
    return false;
}

// ============================================================
// SPATIAL INDEX
// ============================================================

NodeSpatialIndex::NodeSpatialIndex(double cell_size) : cell_size_(cell_size) {
    if (!(cell_size >= kMinGridCellSize) || !std::isfinite(cell_size)) {
        throw RoutingError(ErrorCode::GraphConstruction,
                           "Invalid grid cell size: " + std::to_string(cell_size));
    }
}

void NodeSpatialIndex::clear() {
    grid_.clear();
}

void NodeSpatialIndex::insert(const GeoPoint& point, NodeId node_id) {
    auto [cx, cy] = geo_utils::grid_cell(point, cell_size_);
    grid_[geo_utils::cell_key(cx, cy)].push_back(node_id);
}

std::optional<NodeId> NodeSpatialIndex::nearest(const GeoPoint& point, const std::vector<Node>& nodes) const {
    auto [cx, cy] = geo_utils::grid_cell(point, cell_size_);
    std::optional<NodeId> best;
    double best_dist = std::numeric_limits<double>::infinity();

    // Search current cell and neighbours
    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = -1; dy <= 1; ++dy) {
            auto it = grid_.find(geo_utils::cell_key(cx + dx, cy + dy));
            if (it == grid_.end()) continue;

            for (NodeId node_id : it->second) {
                if (node_id >= nodes.size()) continue;
                double dist = geo_utils::haversine_distance(point, nodes[node_id].location);
                if (dist < best_dist || (dist == best_dist && best && node_id < *best)) {
                    best_dist = dist;
                    best = node_id;
                }
            }
        }
    }
    return best;
}

std::vector<NodeId> NodeSpatialIndex::within_radius(const GeoPoint& point, double radius_meters,
                                                    const std::vector<Node>& nodes) const {
    std::vector<std::pair<double, NodeId>> hits;
    if (!(radius_meters >= 0.0) || grid_.empty()) return {};

    // Every point within the radius lies within dlat of the query latitude, so
    // its longitude offset is bounded using the cosine at the most poleward latitude
    const double dlat = radius_meters / geo_utils::kMetersPerDegree;
    const double max_lat = std::fabs(lat_of(point)) + dlat;
    const double cell_height_m = cell_size_ * geo_utils::kMetersPerDegree;
    double window_cells = std::numeric_limits<double>::infinity();
    double ry = 0.0;
    double rx = 0.0;
    if (std::isfinite(radius_meters) && max_lat < 90.0) {
        const double cell_width_m = cell_height_m * std::cos(max_lat * M_PI / 180.0);
        ry = std::ceil(radius_meters / cell_height_m) + 1.0;
        rx = std::ceil(radius_meters / cell_width_m) + 1.0;
        window_cells = (2.0 * rx + 1.0) * (2.0 * ry + 1.0);
    }

    auto collect = [&](const std::vector<NodeId>& ids) {
        for (NodeId node_id : ids) {
            if (node_id >= nodes.size()) continue;
            double dist = geo_utils::haversine_distance(point, nodes[node_id].location);
            if (dist <= radius_meters) hits.emplace_back(dist, node_id);
        }
    };

    if (!(window_cells <= static_cast<double>(grid_.size()))) {
        // Window larger than the populated grid, or reaching a pole: scan populated cells instead
        for (const auto& [key, ids] : grid_) collect(ids);
    } else {
        auto [cx, cy] = geo_utils::grid_cell(point, cell_size_);
        const int64_t wx = static_cast<int64_t>(rx);
        const int64_t wy = static_cast<int64_t>(ry);
        for (int64_t dx = -wx; dx <= wx; ++dx) {
            for (int64_t dy = -wy; dy <= wy; ++dy) {
                auto it = grid_.find(geo_utils::cell_key(static_cast<int32_t>(cx + dx),
                                                         static_cast<int32_t>(cy + dy)));
                if (it != grid_.end()) collect(it->second);
            }
        }
    }

    std::sort(hits.begin(), hits.end());
    std::vector<NodeId> result;
    result.reserve(hits.size());
    for (const auto& hit : hits) result.push_back(hit.second);
    return result;
}

// ============================================================
// GRAPH STORE
// ============================================================

GraphStore::GraphStore(double cell_size) : spatial_index_(cell_size) {}

GraphStore::GraphStore(std::vector<Node> nodes,
                       std::vector<Edge> edges,
                       std::vector<std::vector<EdgeId>> adjacency,
                       std::vector<TurnRestriction> turn_restrictions,
                       GraphMetadata metadata,
                       double cell_size)
    : nodes_(std::move(nodes)),
      edges_(std::move(edges)),
      adjacency_(std::move(adjacency)),
      spatial_index_(cell_size),
      turn_restrictions_(std::move(turn_restrictions)),
      metadata_(std::move(metadata)) {
    rebuild_indexes();
}

void GraphStore::rebuild_indexes() {
    // Reverse adjacency follows forward bucket order so it is reproducible
    reverse_adjacency_.assign(nodes_.size(), {});
    for (const auto& bucket : adjacency_) {
        for (EdgeId edge_id : bucket) {
            const Edge* e = edge(edge_id);
            if (e && e->target < reverse_adjacency_.size()) {
                reverse_adjacency_[e->target].push_back(edge_id);
            }
        }
    }

    spatial_index_.clear();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        spatial_index_.insert(nodes_[i].location, static_cast<NodeId>(i));
    }

    restriction_index_ = TurnRestrictionIndex(turn_restrictions_);
}

const Node* GraphStore::node(NodeId id) const {
    return id < nodes_.size() ? &nodes_[id] : nullptr;
}

const Edge* GraphStore::edge(EdgeId id) const {
    return id < edges_.size() ? &edges_[id] : nullptr;
}

const std::vector<EdgeId>& GraphStore::outgoing_edges(NodeId node) const {
    return node < adjacency_.size() ? adjacency_[node] : kNoEdges;
}

const std::vector<EdgeId>& GraphStore::incoming_edges(NodeId node) const {
    return node < reverse_adjacency_.size() ? reverse_adjacency_[node] : kNoEdges;
}

std::optional<NodeId> GraphStore::nearest_node(const GeoPoint& point) const {
    if (nodes_.empty()) return std::nullopt;
    return spatial_index_.nearest(point, nodes_);
}

std::vector<NodeId> GraphStore::nodes_within_radius(const GeoPoint& point, double radius_meters) const {
    return spatial_index_.within_radius(point, radius_meters, nodes_);
}

bool GraphStore::is_turn_restricted(EdgeId from_edge, NodeId via_node, EdgeId to_edge) const {
    return restriction_index_.is_restricted(from_edge, via_node, to_edge);
}

std::optional<double> GraphStore::turn_penalty(EdgeId from_edge, EdgeId to_edge,
                                               const TurnPenaltyTable& table) const {
    const Edge* from = edge(from_edge);
    const Edge* to = edge(to_edge);
    if (!from || !to) return std::nullopt;

    return table.penalty_for(geo_utils::bearing_difference(from->bearing, to->bearing));
}

Status GraphStore::validate() const {
    const size_t n = nodes_.size();

    if (adjacency_.size() != n || reverse_adjacency_.size() != n) {
        return Status::failure(ErrorCode::GraphConstruction, "Node count mismatch with adjacency");
    }

    for (size_t i = 0; i < n; ++i) {
        if (nodes_[i].id != i) {
            return Status::failure(ErrorCode::GraphConstruction,
                                   "Node at index " + std::to_string(i) + " has id " + std::to_string(nodes_[i].id));
        }
    }

    for (size_t i = 0; i < edges_.size(); ++i) {
        const Edge& e = edges_[i];
        if (e.id != i) {
            return Status::failure(ErrorCode::GraphConstruction,
                                   "Edge at index " + std::to_string(i) + " has id " + edge_str(e.id));
        }
        if (e.source >= n || e.target >= n) {
            return Status::failure(ErrorCode::GraphConstruction,
                                   "Edge " + edge_str(e.id) + " references a missing node");
        }
        if (!std::isfinite(e.cost.base_time) || e.cost.base_time < 0.0) {
            return Status::failure(ErrorCode::GraphConstruction,
                                   "Edge " + edge_str(e.id) + " has invalid cost");
        }
    }

    // Every edge filed exactly once under its source and once under its target
    std::vector<uint8_t> seen_fwd(edges_.size(), 0);
    for (size_t node_id = 0; node_id < n; ++node_id) {
        for (EdgeId edge_id : adjacency_[node_id]) {
            const Edge* e = edge(edge_id);
            if (!e) {
                return Status::failure(ErrorCode::EdgeNotFound,
                                       "Adjacency of node " + std::to_string(node_id) +
                                       " references missing edge " + edge_str(edge_id));
            }
            if (e->source != node_id) {
                return Status::failure(ErrorCode::GraphConstruction,
                                       "Edge " + edge_str(edge_id) + " has wrong source");
            }
            if (seen_fwd[edge_id]++) {
                return Status::failure(ErrorCode::GraphConstruction,
                                       "Edge " + edge_str(edge_id) + " listed twice in adjacency");
            }
        }
    }

    std::vector<uint8_t> seen_bwd(edges_.size(), 0);
    for (size_t node_id = 0; node_id < n; ++node_id) {
        for (EdgeId edge_id : reverse_adjacency_[node_id]) {
            const Edge* e = edge(edge_id);
            if (!e) {
                return Status::failure(ErrorCode::EdgeNotFound,
                                       "Reverse adjacency references missing edge " + edge_str(edge_id));
            }
            if (e->target != node_id) {
                return Status::failure(ErrorCode::GraphConstruction,
                                       "Edge " + edge_str(edge_id) + " has wrong target");
            }
            seen_bwd[edge_id]++;
        }
    }

    for (size_t i = 0; i < edges_.size(); ++i) {
        if (seen_fwd[i] != 1 || seen_bwd[i] != 1) {
            return Status::failure(ErrorCode::GraphConstruction,
                                   "Edge " + std::to_string(i) + " missing from adjacency");
        }
    }

    for (const auto& r : turn_restrictions_) {
        const Edge* from = edge(r.from_edge);
        const Edge* to = edge(r.to_edge);
        if (!from || !to) {
            return Status::failure(ErrorCode::EdgeNotFound, "Turn restriction references missing edge");
        }
        if (from->target != r.via_node || to->source != r.via_node) {
            std::ostringstream msg;
            msg << "Turn restriction (" << r.from_edge << ", " << r.via_node << ", " << r.to_edge
                << ") does not meet at its via node";
            return Status::failure(ErrorCode::GraphConstruction, msg.str());
        }
    }

    return Status::success();
}

size_t GraphStore::memory_usage() const {
    size_t bytes = nodes_.capacity() * sizeof(Node) + edges_.capacity() * sizeof(Edge);
    for (const auto& bucket : adjacency_) bytes += bucket.capacity() * sizeof(EdgeId);
    for (const auto& bucket : reverse_adjacency_) bytes += bucket.capacity() * sizeof(EdgeId);
    bytes += (adjacency_.capacity() + reverse_adjacency_.capacity()) * sizeof(std::vector<EdgeId>);
    bytes += turn_restrictions_.capacity() * sizeof(TurnRestriction);
    bytes += nodes_.size() * sizeof(NodeId);  // grid entries
    return bytes;
}

}  // namespace ch_routing
