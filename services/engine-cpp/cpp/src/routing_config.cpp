/**
 * @file routing_config.cpp
 * @brief JSON configuration loading.
 */

#include "routing_config.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace ch_routing {

double TurnPenaltyTable::penalty_for(double bearing_diff) const {
    if (bearing_diff <= 30.0) return slight;
    if (bearing_diff <= 90.0) return medium;
    if (bearing_diff <= 150.0) return sharp;
    return u_turn;
}

static void apply_config(const json& doc, RoutingConfig& config) {
    if (doc.contains("grid_cell_size")) config.grid_cell_size = doc["grid_cell_size"].get<double>();
    if (doc.contains("node_ordering")) config.node_ordering = doc["node_ordering"].get<std::string>();
    if (doc.contains("witness_max_hops")) config.witness_max_hops = doc["witness_max_hops"].get<int>();
    if (doc.contains("witness_max_settled")) config.witness_max_settled = doc["witness_max_settled"].get<size_t>();
    if (doc.contains("progress_interval")) config.progress_interval = doc["progress_interval"].get<size_t>();
    if (doc.contains("verbose")) config.verbose = doc["verbose"].get<bool>();

    if (doc.contains("turn_penalties")) {
        const auto& tp = doc["turn_penalties"];
        config.turn_penalties.slight = tp.value("slight", config.turn_penalties.slight);
        config.turn_penalties.medium = tp.value("medium", config.turn_penalties.medium);
        config.turn_penalties.sharp = tp.value("sharp", config.turn_penalties.sharp);
        config.turn_penalties.u_turn = tp.value("u_turn", config.turn_penalties.u_turn);
    }
}

static bool check_config(const RoutingConfig& config) {
    if (!(config.grid_cell_size >= kMinGridCellSize) || !std::isfinite(config.grid_cell_size)) {
        std::cerr << "Error in config: grid_cell_size must be a finite value >= "
                  << kMinGridCellSize << "\n";
        return false;
    }
    if (config.witness_max_hops < 0) {
        std::cerr << "Error in config: witness_max_hops must not be negative\n";
        return false;
    }
    return true;
}

bool parse_routing_config(const std::string& text, RoutingConfig& config) {
    try {
        json doc = json::parse(text);
        RoutingConfig parsed = config;
        apply_config(doc, parsed);
        if (!check_config(parsed)) return false;
        config = parsed;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

bool load_routing_config(const std::string& path, RoutingConfig& config) {
    std::ifstream file(path);
    if (!file) {
        std::cerr << "Config file not found: " << path << "\n";
        return false;
    }

    try {
        json doc = json::parse(file);
        RoutingConfig parsed = config;
        apply_config(doc, parsed);
        if (!check_config(parsed)) return false;
        config = parsed;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }

    if (config.verbose) {
        std::cout << "Loaded config from: " << path << "\n";
    }
    return true;
}

}  // namespace ch_routing
