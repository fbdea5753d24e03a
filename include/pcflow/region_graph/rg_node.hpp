#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pcflow/scope.hpp"

namespace pcflow {

// Stable index of a node inside the arena of its region graph
using NodeId = size_t;

// The declaration order is the tie-break order used by rg_node_less:
// at equal scope a partition comes before the region it decomposes.
enum class RGNodeKind : uint8_t { Partition, Region };

// A node of a region graph.
//
// Region nodes are unpartitioned variable scopes; partition nodes split the
// scope of their (single) output region into disjoint sub-regions. Nodes
// are owned by the arena of a RegionGraph and compared by id, never by
// value.
struct RGNode {
    NodeId id = 0;
    RGNodeKind kind = RGNodeKind::Region;
    Scope scope;

    // Insertion-ordered, duplicate-free adjacency
    std::vector<NodeId> inputs;
    std::vector<NodeId> outputs;

    // Opaque metadata; an integer "sort_key" refines the node order
    nlohmann::json metadata = nlohmann::json::object();

    bool is_region() const { return kind == RGNodeKind::Region; }
    bool is_partition() const { return kind == RGNodeKind::Partition; }

    std::optional<int64_t> sort_key() const;

    std::string to_string() const;
};

// Strict weak order over nodes: scope first, then kind (partition before
// region), then the optional sort key. Nodes that compare equal under all
// three keys are incomparable and keep their insertion order when sorted.
//
// For every edge u -> v of a well-formed region graph, rg_node_less(u, v)
// holds, hence sorting by this order yields a topological ordering.
bool rg_node_less(const RGNode &lhs, const RGNode &rhs);

std::string to_string(RGNodeKind kind);

} // namespace pcflow
