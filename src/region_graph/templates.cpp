#include "pcflow/region_graph/templates.hpp"

#include <optional>
#include <random>
#include <vector>

#include "pcflow/error.hpp"

namespace pcflow {
namespace templates {

namespace {

using Cell = std::optional<NodeId>;
using Grid = std::vector<std::vector<Cell>>;

NodeId merge_2_regions(RegionGraphBuilder &builder, NodeId a, NodeId b) {
    Scope scope = builder.node(a).scope | builder.node(b).scope;
    NodeId region = builder.add_region(scope);
    builder.add_partitioning(region, {a, b});
    return region;
}

// tl tr
// bl br
NodeId merge_4_regions(RegionGraphBuilder &builder, NodeId tl, NodeId tr,
                       NodeId bl, NodeId br, bool is_tree) {
    NodeId top = merge_2_regions(builder, tl, tr);
    NodeId bot = merge_2_regions(builder, bl, br);
    if (is_tree)
        return merge_2_regions(builder, top, bot);

    NodeId left = merge_2_regions(builder, tl, bl);
    NodeId right = merge_2_regions(builder, tr, br);
    Scope scope = builder.node(top).scope | builder.node(bot).scope;
    NodeId region = builder.add_region(scope);
    builder.add_partitioning(region, {top, bot});
    builder.add_partitioning(region, {left, right});
    return region;
}

RegionGraph quad_build(size_t height, size_t width, bool is_tree) {
    if (height == 0 || width == 0)
        throw MalformedRegionGraphError("image shape must be non-empty");

    RegionGraphBuilder builder;
    Grid grid(height, std::vector<Cell>(width));
    for (size_t i = 0; i < height; ++i) {
        for (size_t j = 0; j < width; ++j)
            grid[i][j] = builder.add_region(Scope{i * width + j});
    }

    // Merge 2x2 blocks level by level; cells past the border are absent
    while (height > 1 || width > 1) {
        size_t next_h = (height + 1) / 2;
        size_t next_w = (width + 1) / 2;
        Grid next(next_h, std::vector<Cell>(next_w));
        for (size_t r = 0; r < next_h; ++r) {
            for (size_t c = 0; c < next_w; ++c) {
                bool has_right = 2 * c + 1 < width;
                bool has_bottom = 2 * r + 1 < height;
                NodeId tl = *grid[2 * r][2 * c];
                if (has_right && has_bottom) {
                    next[r][c] = merge_4_regions(
                        builder, tl, *grid[2 * r][2 * c + 1],
                        *grid[2 * r + 1][2 * c], *grid[2 * r + 1][2 * c + 1],
                        is_tree);
                } else if (has_right) {
                    next[r][c] =
                        merge_2_regions(builder, tl, *grid[2 * r][2 * c + 1]);
                } else if (has_bottom) {
                    next[r][c] =
                        merge_2_regions(builder, tl, *grid[2 * r + 1][2 * c]);
                } else {
                    next[r][c] = tl;
                }
            }
        }
        grid = std::move(next);
        height = next_h;
        width = next_w;
    }
    return builder.build();
}

void split_region(RegionGraphBuilder &builder, NodeId region, size_t level,
                  size_t depth, std::mt19937_64 &rng) {
    std::vector<size_t> vars = builder.node(region).scope.vars();
    if (level >= depth || vars.size() < 2)
        return;

    // Fisher-Yates with the raw engine output, identical on every platform
    for (size_t i = vars.size() - 1; i > 0; --i) {
        size_t j = static_cast<size_t>(rng() % (i + 1));
        std::swap(vars[i], vars[j]);
    }
    size_t half = vars.size() / 2;
    Scope left(std::vector<size_t>(vars.begin(), vars.begin() + half));
    Scope right(std::vector<size_t>(vars.begin() + half, vars.end()));

    NodeId left_region = builder.add_region(left);
    NodeId right_region = builder.add_region(right);
    builder.add_partitioning(region, {left_region, right_region});
    split_region(builder, left_region, level + 1, depth, rng);
    split_region(builder, right_region, level + 1, depth, rng);
}

} // namespace

RegionGraph quad_tree(size_t height, size_t width) {
    return quad_build(height, width, /*is_tree=*/true);
}

RegionGraph quad_graph(size_t height, size_t width) {
    return quad_build(height, width, /*is_tree=*/false);
}

RegionGraph random_binary_tree(size_t num_vars, size_t depth,
                               size_t num_repetitions, uint64_t seed) {
    RegionGraphBuilder builder;
    NodeId root = builder.add_region(Scope::range(num_vars));
    std::mt19937_64 rng(seed);
    for (size_t rep = 0; rep < num_repetitions; ++rep)
        split_region(builder, root, 0, depth, rng);
    return builder.build();
}

RegionGraph fully_factorized(size_t num_vars) {
    RegionGraphBuilder builder;
    NodeId root = builder.add_region(Scope::range(num_vars));
    if (num_vars > 1) {
        std::vector<NodeId> leaves;
        for (size_t v = 0; v < num_vars; ++v)
            leaves.push_back(builder.add_region(Scope{v}));
        builder.add_partitioning(root, leaves);
    }
    return builder.build();
}

} // namespace templates
} // namespace pcflow
