#pragma once

#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

#include "pcflow/region_graph/rg_node.hpp"
#include "pcflow/scope.hpp"

namespace pcflow {

class RegionGraphBuilder;

// An immutable, validated region graph.
//
// The graph is a bipartite DAG of region and partition nodes. Every
// partition has at least two inputs with pairwise disjoint scopes whose
// union is the partition scope, and exactly one output region with the
// same scope. Instances are only obtained from RegionGraphBuilder::build(),
// the templates or the JSON loader.
class RegionGraph {
  public:
    // All nodes in topological order (consistent with rg_node_less)
    const std::vector<NodeId> &nodes() const { return ordering_; }

    const RGNode &node(NodeId id) const;
    size_t num_nodes() const { return nodes_.size(); }

    std::vector<NodeId> region_nodes() const;
    std::vector<NodeId> partition_nodes() const;

    // Leaf regions (no input partitions)
    std::vector<NodeId> input_nodes() const;

    // Root regions (no outgoing edges)
    const std::vector<NodeId> &output_nodes() const { return outputs_; }
    bool is_output(NodeId id) const;

    const Scope &scope() const { return scope_; }
    size_t num_variables() const { return scope_.size(); }

    // True if every region scope is decomposed in at most one way, i.e. all
    // partitions over the same scope split it into the same sub-scopes.
    bool is_structured_decomposable() const;

  private:
    friend class RegionGraphBuilder;
    RegionGraph() = default;

    std::vector<RGNode> nodes_;
    std::vector<NodeId> ordering_;
    std::vector<NodeId> outputs_;
    Scope scope_;
};

// Incremental construction of a RegionGraph.
//
// Local invariants (non-empty scopes, edge kinds, scope containment,
// disjointness of partition inputs, a single parent region per partition)
// are checked greedily as nodes and edges are added; a violating call
// throws MalformedRegionGraphError and leaves the builder unchanged.
// build() checks the remaining global invariants.
class RegionGraphBuilder {
  public:
    NodeId add_region(const Scope &scope,
                      nlohmann::json metadata = nlohmann::json::object());
    NodeId add_partition(const Scope &scope,
                         nlohmann::json metadata = nlohmann::json::object());

    // Adds the edge from -> to; re-adding an existing edge is a no-op.
    void add_edge(NodeId from, NodeId to);

    // Creates a partition of `region` into the given input regions and
    // wires it up. Returns the id of the new partition node.
    NodeId add_partitioning(NodeId region, const std::vector<NodeId> &inputs);

    const RGNode &node(NodeId id) const;
    size_t num_nodes() const { return nodes_.size(); }

    RegionGraph build() const;

  private:
    NodeId add_node(RGNodeKind kind, const Scope &scope,
                    nlohmann::json metadata);
    void check_id(NodeId id) const;
    void check_edge(NodeId from, NodeId to) const;

    std::vector<RGNode> nodes_;
};

} // namespace pcflow
