#include "pcflow/region_graph/region_graph.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "pcflow/error.hpp"

namespace pcflow {

// ============================================================================
// RegionGraph
// ============================================================================

const RGNode &RegionGraph::node(NodeId id) const {
    if (id >= nodes_.size())
        throw MalformedRegionGraphError::unknown_node(id);
    return nodes_[id];
}

std::vector<NodeId> RegionGraph::region_nodes() const {
    std::vector<NodeId> result;
    for (NodeId id : ordering_) {
        if (nodes_[id].is_region())
            result.push_back(id);
    }
    return result;
}

std::vector<NodeId> RegionGraph::partition_nodes() const {
    std::vector<NodeId> result;
    for (NodeId id : ordering_) {
        if (nodes_[id].is_partition())
            result.push_back(id);
    }
    return result;
}

std::vector<NodeId> RegionGraph::input_nodes() const {
    std::vector<NodeId> result;
    for (NodeId id : ordering_) {
        if (nodes_[id].is_region() && nodes_[id].inputs.empty())
            result.push_back(id);
    }
    return result;
}

bool RegionGraph::is_output(NodeId id) const {
    return std::find(outputs_.begin(), outputs_.end(), id) != outputs_.end();
}

bool RegionGraph::is_structured_decomposable() const {
    std::map<Scope, std::set<Scope>> decompositions;
    for (NodeId id : ordering_) {
        const RGNode &ptn = nodes_[id];
        if (!ptn.is_partition())
            continue;
        std::set<Scope> split;
        for (NodeId in : ptn.inputs)
            split.insert(nodes_[in].scope);
        auto [it, inserted] = decompositions.emplace(ptn.scope, split);
        if (!inserted && it->second != split)
            return false;
    }
    return true;
}

// ============================================================================
// RegionGraphBuilder
// ============================================================================

NodeId RegionGraphBuilder::add_region(const Scope &scope,
                                      nlohmann::json metadata) {
    return add_node(RGNodeKind::Region, scope, std::move(metadata));
}

NodeId RegionGraphBuilder::add_partition(const Scope &scope,
                                         nlohmann::json metadata) {
    return add_node(RGNodeKind::Partition, scope, std::move(metadata));
}

NodeId RegionGraphBuilder::add_node(RGNodeKind kind, const Scope &scope,
                                    nlohmann::json metadata) {
    if (scope.empty())
        throw MalformedRegionGraphError::empty_scope(to_string(kind));
    if (!metadata.is_object())
        throw MalformedRegionGraphError("node metadata must be an object");
    RGNode node;
    node.id = nodes_.size();
    node.kind = kind;
    node.scope = scope;
    node.metadata = std::move(metadata);
    nodes_.push_back(std::move(node));
    return nodes_.back().id;
}

const RGNode &RegionGraphBuilder::node(NodeId id) const {
    check_id(id);
    return nodes_[id];
}

void RegionGraphBuilder::check_id(NodeId id) const {
    if (id >= nodes_.size())
        throw MalformedRegionGraphError::unknown_node(id);
}

void RegionGraphBuilder::check_edge(NodeId from, NodeId to) const {
    check_id(from);
    check_id(to);
    const RGNode &src = nodes_[from];
    const RGNode &dst = nodes_[to];
    if (src.kind == dst.kind) {
        throw MalformedRegionGraphError::bad_edge(
            src.to_string() + " -> " + dst.to_string() +
            " must connect a region and a partition");
    }

    if (src.is_region()) {
        // Region -> Partition: a proper part of the partitioned scope,
        // disjoint from the other parts
        if (!src.scope.is_subset_of(dst.scope) || src.scope == dst.scope) {
            throw MalformedRegionGraphError::bad_partition(
                src.to_string() + " is not a proper subset of " +
                dst.to_string());
        }
        for (NodeId sibling : dst.inputs) {
            if (!nodes_[sibling].scope.is_disjoint(src.scope)) {
                throw MalformedRegionGraphError::bad_partition(
                    "inputs " + nodes_[sibling].to_string() + " and " +
                    src.to_string() + " of " + dst.to_string() +
                    " overlap");
            }
        }
        return;
    }

    // Partition -> Region: same scope, single parent region
    if (src.scope != dst.scope) {
        throw MalformedRegionGraphError::bad_edge(
            src.to_string() + " and its region " + dst.to_string() +
            " must have the same scope");
    }
    if (!src.outputs.empty()) {
        throw MalformedRegionGraphError::bad_partition(
            src.to_string() + " already decomposes " +
            nodes_[src.outputs.front()].to_string());
    }
}

void RegionGraphBuilder::add_edge(NodeId from, NodeId to) {
    check_id(from);
    check_id(to);
    const auto &outs = nodes_[from].outputs;
    if (std::find(outs.begin(), outs.end(), to) != outs.end())
        return;
    check_edge(from, to);
    nodes_[from].outputs.push_back(to);
    nodes_[to].inputs.push_back(from);
}

NodeId RegionGraphBuilder::add_partitioning(NodeId region,
                                            const std::vector<NodeId> &inputs) {
    check_id(region);
    const RGNode &rgn = nodes_[region];
    if (!rgn.is_region()) {
        throw MalformedRegionGraphError::bad_region(
            rgn.to_string() + " cannot be partitioned");
    }
    if (inputs.size() < 2) {
        throw MalformedRegionGraphError::bad_partition(
            "a partitioning of " + rgn.to_string() +
            " needs at least two inputs");
    }

    // Validate everything up front so a failure leaves no dangling node
    Scope covered;
    for (NodeId in : inputs) {
        check_id(in);
        const RGNode &sub = nodes_[in];
        if (!sub.is_region()) {
            throw MalformedRegionGraphError::bad_partition(
                "input " + sub.to_string() + " is not a region");
        }
        if (!sub.scope.is_disjoint(covered)) {
            throw MalformedRegionGraphError::bad_partition(
                "input " + sub.to_string() + " overlaps another input of " +
                rgn.to_string());
        }
        covered = covered | sub.scope;
    }
    if (covered != rgn.scope) {
        throw MalformedRegionGraphError::bad_partition(
            "inputs cover " + covered.to_string() + " instead of " +
            rgn.scope.to_string());
    }

    NodeId ptn = add_partition(rgn.scope);
    for (NodeId in : inputs)
        add_edge(in, ptn);
    add_edge(ptn, region);
    return ptn;
}

RegionGraph RegionGraphBuilder::build() const {
    if (nodes_.empty())
        throw MalformedRegionGraphError("a region graph needs at least one "
                                        "region");

    for (const RGNode &n : nodes_) {
        if (!n.is_partition())
            continue;
        if (n.outputs.size() != 1) {
            throw MalformedRegionGraphError::bad_partition(
                n.to_string() + " has no parent region");
        }
        if (n.inputs.size() < 2) {
            throw MalformedRegionGraphError::bad_partition(
                n.to_string() + " has fewer than two inputs");
        }
        Scope covered;
        for (NodeId in : n.inputs)
            covered = covered | nodes_[in].scope;
        if (covered != n.scope) {
            throw MalformedRegionGraphError::bad_partition(
                "inputs of " + n.to_string() + " cover only " +
                covered.to_string());
        }
    }

    RegionGraph rg;
    rg.nodes_ = nodes_;
    rg.ordering_.resize(nodes_.size());
    for (NodeId id = 0; id < nodes_.size(); ++id)
        rg.ordering_[id] = id;
    std::stable_sort(rg.ordering_.begin(), rg.ordering_.end(),
                     [&](NodeId a, NodeId b) {
                         return rg_node_less(nodes_[a], nodes_[b]);
                     });

    // The order must agree with every edge; this also rules out cycles
    std::vector<size_t> position(nodes_.size());
    for (size_t i = 0; i < rg.ordering_.size(); ++i)
        position[rg.ordering_[i]] = i;
    for (const RGNode &n : nodes_) {
        for (NodeId out : n.outputs) {
            if (position[n.id] >= position[out]) {
                throw MalformedRegionGraphError::bad_edge(
                    n.to_string() + " -> " + nodes_[out].to_string() +
                    " breaks the topological order");
            }
        }
    }

    for (NodeId id : rg.ordering_) {
        const RGNode &n = nodes_[id];
        rg.scope_ = rg.scope_ | n.scope;
        if (n.is_region() && n.outputs.empty())
            rg.outputs_.push_back(id);
    }
    return rg;
}

} // namespace pcflow
