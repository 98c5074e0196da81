#include "node_residency_set.hpp"

namespace fx {
    void NodeResidencySet::enter(const NodeId node) {
        active_nodes.insert(node);
    }

    void NodeResidencySet::exit(const NodeId node) {
        active_nodes.erase(node);
    }

    bool NodeResidencySet::is_active(const NodeId node) const {
        return active_nodes.find(node) != active_nodes.end();
    }

    size_t NodeResidencySet::size() const {
        return active_nodes.size();
    }

    void NodeResidencySet::clear() {
        active_nodes.clear();
    }
} // fx
