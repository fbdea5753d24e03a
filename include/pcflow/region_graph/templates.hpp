#pragma once

#include <cstddef>
#include <cstdint>

#include "pcflow/region_graph/region_graph.hpp"

namespace pcflow {
namespace templates {

// Quad tree over a height x width image; variable (i, j) is i * width + j.
// Each full 2x2 block is merged row by row and then vertically, so every
// region has a single decomposition.
RegionGraph quad_tree(size_t height, size_t width);

// Same recursion as quad_tree, but every full 2x2 block is decomposed both
// horizontally-first and vertically-first, giving the merged region two
// partitions.
RegionGraph quad_graph(size_t height, size_t width);

// `num_repetitions` random balanced binary trees of the given depth over
// the variables {0..num_vars-1}, all sharing the root region. Deterministic
// for a given seed.
RegionGraph random_binary_tree(size_t num_vars, size_t depth,
                               size_t num_repetitions = 1,
                               uint64_t seed = 42);

// A single partition of all variables into univariate regions.
RegionGraph fully_factorized(size_t num_vars);

} // namespace templates
} // namespace pcflow
