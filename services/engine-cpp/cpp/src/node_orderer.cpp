/**
 * @file node_orderer.cpp
 * @brief NodeOrder and ordering heuristics.
 */

#include "node_orderer.hpp"

#include <algorithm>
#include <limits>
#include <tuple>

namespace ch_routing {

NodeOrder::NodeOrder(std::vector<NodeId> sequence) : sequence_(std::move(sequence)) {
    ranks_.assign(sequence_.size(), std::numeric_limits<uint32_t>::max());
    for (size_t rank = 0; rank < sequence_.size(); ++rank) {
        NodeId node = sequence_[rank];
        if (node < ranks_.size()) ranks_[node] = static_cast<uint32_t>(rank);
    }
}

NodeOrder NodeOrder::from_ranks(const std::vector<uint32_t>& ranks) {
    std::vector<NodeId> sequence(ranks.size(), kInvalidNode);
    for (size_t node = 0; node < ranks.size(); ++node) {
        if (ranks[node] < sequence.size()) sequence[ranks[node]] = static_cast<NodeId>(node);
    }
    return NodeOrder(std::move(sequence));
}

bool NodeOrder::is_total() const {
    if (ranks_.size() != sequence_.size()) return false;
    for (size_t rank = 0; rank < sequence_.size(); ++rank) {
        NodeId node = sequence_[rank];
        if (node >= ranks_.size() || ranks_[node] != rank) return false;
    }
    return true;
}

// Degree-based: contract low-connectivity nodes first
NodeOrder DegreeNodeOrderer::order(const GraphStore& graph) const {
    const size_t n = graph.node_count();
    std::vector<std::pair<size_t, NodeId>> keyed;
    keyed.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        NodeId node = static_cast<NodeId>(i);
        keyed.emplace_back(graph.outgoing_edges(node).size() + graph.incoming_edges(node).size(), node);
    }
    std::sort(keyed.begin(), keyed.end());

    std::vector<NodeId> sequence;
    sequence.reserve(n);
    for (const auto& [degree, node] : keyed) sequence.push_back(node);
    return NodeOrder(std::move(sequence));
}

NodeOrder EdgeDifferenceNodeOrderer::order(const GraphStore& graph) const {
    const size_t n = graph.node_count();
    std::vector<std::tuple<int64_t, size_t, NodeId>> keyed;
    keyed.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        NodeId node = static_cast<NodeId>(i);
        auto in = static_cast<int64_t>(graph.incoming_edges(node).size());
        auto out = static_cast<int64_t>(graph.outgoing_edges(node).size());
        keyed.emplace_back(in * out - (in + out), static_cast<size_t>(in + out), node);
    }
    std::sort(keyed.begin(), keyed.end());

    std::vector<NodeId> sequence;
    sequence.reserve(n);
    for (const auto& entry : keyed) sequence.push_back(std::get<2>(entry));
    return NodeOrder(std::move(sequence));
}

std::unique_ptr<NodeOrderer> make_node_orderer(const std::string& name) {
    if (name == "degree") return std::make_unique<DegreeNodeOrderer>();
    if (name == "edge_difference") return std::make_unique<EdgeDifferenceNodeOrderer>();
    return nullptr;
}

}  // namespace ch_routing
