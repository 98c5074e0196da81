#pragma once

#include <EASTL/unordered_set.h>

#include "animation/animation_node_id.hpp"

namespace fx {
    /**
     * The animation nodes that a character is currently in
     */
    class NodeResidencySet {
    public:
        void enter(NodeId node);

        /**
         * Removes the node. Exiting a node we're not in does nothing
         */
        void exit(NodeId node);

        bool is_active(NodeId node) const;

        size_t size() const;

        void clear();

    private:
        eastl::unordered_set<NodeId> active_nodes;
    };
} // fx
