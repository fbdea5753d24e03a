#include "pcflow/region_graph/rg_node.hpp"

#include <sstream>

namespace pcflow {

std::optional<int64_t> RGNode::sort_key() const {
    auto it = metadata.find("sort_key");
    if (it == metadata.end() || !it->is_number_integer())
        return std::nullopt;
    return it->get<int64_t>();
}

std::string RGNode::to_string() const {
    std::ostringstream oss;
    oss << pcflow::to_string(kind) << "#" << id << scope;
    return oss.str();
}

bool rg_node_less(const RGNode &lhs, const RGNode &rhs) {
    if (lhs.scope < rhs.scope)
        return true;
    if (rhs.scope < lhs.scope)
        return false;
    if (lhs.kind != rhs.kind)
        return lhs.kind < rhs.kind;
    // Same default as an absent key, so that keyed and unkeyed nodes still
    // form a strict weak order
    int64_t lkey = lhs.sort_key().value_or(-1);
    int64_t rkey = rhs.sort_key().value_or(-1);
    return lkey < rkey;
}

std::string to_string(RGNodeKind kind) {
    switch (kind) {
    case RGNodeKind::Partition:
        return "PartitionNode";
    case RGNodeKind::Region:
        return "RegionNode";
    }
    return "Unknown";
}

} // namespace pcflow
