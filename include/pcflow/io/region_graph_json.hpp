#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "pcflow/region_graph/region_graph.hpp"

namespace pcflow {
namespace io {

// Region graph documents have the layout
//
//   {
//     "regions": {"0": [0, 1], "1": [0], "2": [1]},
//     "graph":   [{"p": 0, "i": [1, 2]}]
//   }
//
// where "regions" maps a region id to its scope and every "graph" entry is
// one partition of region "p" into the regions "i".

nlohmann::json region_graph_to_json(const RegionGraph &rg);
RegionGraph region_graph_from_json(const nlohmann::json &doc);

void save_region_graph(const RegionGraph &rg, const std::string &filename);
RegionGraph load_region_graph(const std::string &filename);

} // namespace io
} // namespace pcflow
