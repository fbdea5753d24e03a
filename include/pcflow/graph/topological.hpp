#pragma once

#include <deque>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pcflow {
namespace graph {

// Kahn's algorithm over the DAG reachable from `roots` by following
// `incomings(node)` (which returns the producers of `node`, in order).
//
// The result lists every reachable node after all of its producers. Nodes
// that become ready at the same time are emitted in discovery order, so the
// same graph always yields the same ordering. Returns std::nullopt if the
// reachable graph has a cycle; the callers turn this into the cycle error
// of their own level (pipeline or layer).
template <typename Node, typename Incomings,
          typename Hash = std::hash<Node>>
std::optional<std::vector<Node>>
topological_ordering(const std::vector<Node> &roots, Incomings &&incomings) {
    std::vector<Node> discovered;
    std::unordered_map<Node, size_t, Hash> num_incomings;
    std::unordered_map<Node, std::vector<Node>, Hash> outgoings;

    // BFS discovery from the roots
    std::unordered_set<Node, Hash> seen;
    std::deque<Node> queue;
    for (const Node &root : roots) {
        if (seen.insert(root).second)
            queue.push_back(root);
    }
    while (!queue.empty()) {
        Node node = queue.front();
        queue.pop_front();
        discovered.push_back(node);
        const auto &producers = incomings(node);
        num_incomings[node] = producers.size();
        for (const Node &p : producers) {
            outgoings[p].push_back(node);
            if (seen.insert(p).second)
                queue.push_back(p);
        }
    }

    // Kahn's algorithm, seeded with the sources in discovery order
    std::vector<Node> ordering;
    ordering.reserve(discovered.size());
    std::deque<Node> to_visit;
    for (const Node &node : discovered) {
        if (num_incomings[node] == 0)
            to_visit.push_back(node);
    }
    while (!to_visit.empty()) {
        Node node = to_visit.front();
        to_visit.pop_front();
        ordering.push_back(node);
        auto it = outgoings.find(node);
        if (it == outgoings.end())
            continue;
        for (const Node &out : it->second) {
            if (--num_incomings[out] == 0)
                to_visit.push_back(out);
        }
    }

    // Any node left with pending incomings sits on (or behind) a cycle
    if (ordering.size() != discovered.size())
        return std::nullopt;
    return ordering;
}

} // namespace graph
} // namespace pcflow
