/**
 * @file routing_config.hpp
 * @brief Tunables for graph indexing, preprocessing and queries.
 */

#pragma once

#include <cstddef>
#include <string>

namespace ch_routing {

constexpr double kDefaultGridCellSize = 0.01;  // degrees, ~1km
constexpr double kMinGridCellSize = 1e-6;     // keeps cell indices of valid coordinates in int32

/**
 * @brief Turn penalty per bearing-difference bucket (time units).
 */
struct TurnPenaltyTable {
    double slight = 2.0;   ///< up to 30 degrees
    double medium = 5.0;   ///< up to 90 degrees
    double sharp = 10.0;   ///< up to 150 degrees
    double u_turn = 15.0;  ///< above 150 degrees

    double penalty_for(double bearing_diff) const;
};

/**
 * @brief Engine configuration.
 *
 * Witness search bounds trade preprocessing time for shortcut count. Lower
 * bounds only ever add shortcuts; query distances never change.
 */
struct RoutingConfig {
    double grid_cell_size = kDefaultGridCellSize;
    std::string node_ordering = "degree";
    int witness_max_hops = 5;
    size_t witness_max_settled = 1000;
    size_t progress_interval = 10000;
    bool verbose = false;
    TurnPenaltyTable turn_penalties;
};

/**
 * @brief Load configuration from a JSON file.
 *
 * Keys missing from the file keep their current values in `config`.
 * @return false if the file is missing or malformed (config left untouched)
 */
bool load_routing_config(const std::string& path, RoutingConfig& config);

/**
 * @brief Parse configuration from a JSON string (same rules as the file loader).
 */
bool parse_routing_config(const std::string& text, RoutingConfig& config);

}  // namespace ch_routing
