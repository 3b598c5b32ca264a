/**
 * @file routing_types.cpp
 * @brief Error code names.
 */

#include "routing_types.hpp"

namespace ch_routing {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidCoordinates: return "InvalidCoordinates";
        case ErrorCode::GraphConstruction: return "GraphConstruction";
        case ErrorCode::EdgeNotFound: return "EdgeNotFound";
        case ErrorCode::NoRouteFound: return "NoRouteFound";
        case ErrorCode::NodeNotFound: return "NodeNotFound";
        case ErrorCode::Io: return "Io";
    }
    return "Unknown";
}

}  // namespace ch_routing
