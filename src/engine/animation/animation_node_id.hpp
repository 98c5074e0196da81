#pragma once

#include <cstdint>

#include <EASTL/string.h>
#include <EASTL/string_view.h>
#include <entt/core/hashed_string.hpp>

/**
 * Identifies a node in an animation state machine
 *
 * This is a hash of the node's name. Configs store the name and resolve it to a NodeId when they're loaded, live
 * animation events carry the NodeId, and the two meet in the FX trigger components
 */
using NodeId = entt::id_type;

inline NodeId to_node_id(const eastl::string_view name) {
    return entt::hashed_string::value(name.data(), name.size());
}

inline NodeId to_node_id(const eastl::string& name) {
    return entt::hashed_string::value(name.data(), name.size());
}

inline NodeId to_node_id(const char* name) {
    return to_node_id(eastl::string_view{name});
}
