#include "pcflow/io/region_graph_json.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "pcflow/error.hpp"

namespace pcflow {
namespace io {

namespace {

size_t parse_region_id(const std::string &key) {
    if (key.empty() || !std::all_of(key.begin(), key.end(),
                                     [](unsigned char c) {
                                         return std::isdigit(c) != 0;
                                     }))
        throw FileFormatError("region graph: invalid region id '" + key + "'");
    try {
        return static_cast<size_t>(std::stoull(key));
    } catch (const std::out_of_range &) {
        throw FileFormatError("region graph: region id '" + key +
                              "' is out of range");
    }
}

Scope parse_scope(const nlohmann::json &vars, const std::string &key) {
    if (!vars.is_array())
        throw FileFormatError("region graph: scope of region " + key +
                              " must be an array");
    std::vector<size_t> out;
    for (const auto &v : vars) {
        if (!v.is_number_unsigned())
            throw FileFormatError("region graph: scope of region " + key +
                                  " must contain variable ids");
        out.push_back(v.get<size_t>());
    }
    return Scope(std::move(out));
}

} // namespace

nlohmann::json region_graph_to_json(const RegionGraph &rg) {
    // Regions are renumbered densely in topological order
    std::unordered_map<NodeId, size_t> region_ids;
    nlohmann::json regions = nlohmann::json::object();
    for (NodeId id : rg.region_nodes()) {
        size_t rid = region_ids.size();
        region_ids[id] = rid;
        regions[std::to_string(rid)] = rg.node(id).scope.vars();
    }

    nlohmann::json graph = nlohmann::json::array();
    for (NodeId id : rg.partition_nodes()) {
        const RGNode &ptn = rg.node(id);
        nlohmann::json inputs = nlohmann::json::array();
        for (NodeId in : ptn.inputs)
            inputs.push_back(region_ids.at(in));
        graph.push_back({{"p", region_ids.at(ptn.outputs.front())},
                         {"i", std::move(inputs)}});
    }

    return {{"regions", std::move(regions)}, {"graph", std::move(graph)}};
}

RegionGraph region_graph_from_json(const nlohmann::json &doc) {
    if (!doc.is_object() || !doc.contains("regions") ||
        !doc["regions"].is_object()) {
        throw FileFormatError("region graph: missing \"regions\" object");
    }

    // Object keys are strings; add the regions in numeric id order
    std::map<size_t, Scope> scopes;
    for (const auto &[key, vars] : doc["regions"].items()) {
        size_t rid = parse_region_id(key);
        if (!scopes.emplace(rid, parse_scope(vars, key)).second)
            throw FileFormatError("region graph: duplicate region id " +
                                  std::to_string(rid) + " ('" + key + "')");
    }

    RegionGraphBuilder builder;
    std::unordered_map<size_t, NodeId> nodes;
    for (const auto &[rid, scope] : scopes)
        nodes[rid] = builder.add_region(scope);

    auto lookup = [&](const nlohmann::json &ref) {
        if (!ref.is_number_unsigned())
            throw FileFormatError("region graph: region references must be "
                                  "unsigned integers");
        auto it = nodes.find(ref.get<size_t>());
        if (it == nodes.end())
            throw FileFormatError("region graph: unknown region " +
                                  ref.dump());
        return it->second;
    };

    if (doc.contains("graph")) {
        const auto &graph = doc["graph"];
        if (!graph.is_array())
            throw FileFormatError("region graph: \"graph\" must be an array");
        for (const auto &entry : graph) {
            if (!entry.is_object() || !entry.contains("p") ||
                !entry.contains("i") || !entry["i"].is_array()) {
                throw FileFormatError("region graph: partition entries need "
                                      "\"p\" and \"i\"");
            }
            std::vector<NodeId> inputs;
            for (const auto &in : entry["i"])
                inputs.push_back(lookup(in));
            builder.add_partitioning(lookup(entry["p"]), inputs);
        }
    }
    return builder.build();
}

void save_region_graph(const RegionGraph &rg, const std::string &filename) {
    std::ofstream file(filename);
    if (!file.is_open())
        throw SerializationError("region graph: cannot open file: " +
                                 filename);
    file << region_graph_to_json(rg).dump(2) << "\n";
    if (!file)
        throw SerializationError("region graph: failed writing " + filename);
}

RegionGraph load_region_graph(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open())
        throw SerializationError("region graph: cannot open file: " +
                                 filename);
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error &e) {
        throw FileFormatError("region graph: " + std::string(e.what()));
    }
    return region_graph_from_json(doc);
}

} // namespace io
} // namespace pcflow
