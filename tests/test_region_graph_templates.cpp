#include "pcflow_test_utils.hpp"

using namespace pcflow;

namespace {

size_t count_partitions_over(const RegionGraph &rg, const Scope &scope) {
    size_t n = 0;
    for (NodeId id : rg.partition_nodes())
        n += rg.node(id).scope == scope;
    return n;
}

} // namespace

TEST(QuadTree, FourByFour) {
    RegionGraph rg = templates::quad_tree(4, 4);
    EXPECT_EQ(rg.num_variables(), 16u);
    EXPECT_EQ(rg.input_nodes().size(), 16u);
    EXPECT_EQ(rg.region_nodes().size(), 31u);
    EXPECT_EQ(rg.partition_nodes().size(), 15u);
    ASSERT_EQ(rg.output_nodes().size(), 1u);
    EXPECT_EQ(rg.node(rg.output_nodes().front()).scope, Scope::range(16));
}

TEST(QuadTree, EveryPartitionIsBinary) {
    RegionGraph rg = templates::quad_tree(3, 5);
    for (NodeId id : rg.partition_nodes())
        EXPECT_EQ(rg.node(id).inputs.size(), 2u);
    EXPECT_EQ(rg.scope(), Scope::range(15));
}

TEST(QuadGraph, ThreeByThree) {
    RegionGraph rg = templates::quad_graph(3, 3);
    EXPECT_EQ(rg.input_nodes().size(), 9u);
    EXPECT_EQ(rg.partition_nodes().size(), 14u);
    EXPECT_EQ(count_partitions_over(rg, Scope{0, 1, 3, 4}), 2u);
    EXPECT_EQ(count_partitions_over(rg, Scope::range(9)), 2u);
    EXPECT_EQ(rg.output_nodes().size(), 1u);
}

TEST(QuadGraph, SingleVariable) {
    RegionGraph rg = templates::quad_graph(1, 1);
    EXPECT_EQ(rg.num_nodes(), 1u);
    EXPECT_TRUE(rg.partition_nodes().empty());
}

TEST(QuadGraph, EmptyImageIsRejected) {
    EXPECT_THROW(templates::quad_graph(0, 3), MalformedRegionGraphError);
    EXPECT_THROW(templates::quad_tree(2, 0), MalformedRegionGraphError);
}

TEST(RandomBinaryTree, IsDeterministicForASeed) {
    RegionGraph a = templates::random_binary_tree(8, 3, 2, 7);
    RegionGraph b = templates::random_binary_tree(8, 3, 2, 7);
    EXPECT_EQ(io::region_graph_to_json(a), io::region_graph_to_json(b));
}

TEST(RandomBinaryTree, RepetitionsShareTheRoot) {
    RegionGraph rg = templates::random_binary_tree(8, 3, 2);
    ASSERT_EQ(rg.output_nodes().size(), 1u);
    const RGNode &root = rg.node(rg.output_nodes().front());
    EXPECT_EQ(root.scope, Scope::range(8));
    EXPECT_EQ(root.inputs.size(), 2u);
    // Depth 3 over 8 variables ends in univariate leaves
    for (NodeId id : rg.input_nodes())
        EXPECT_EQ(rg.node(id).scope.size(), 1u);
}

TEST(FullyFactorized, SinglePartitionOfLeaves) {
    RegionGraph rg = templates::fully_factorized(5);
    ASSERT_EQ(rg.partition_nodes().size(), 1u);
    EXPECT_EQ(rg.node(rg.partition_nodes().front()).inputs.size(), 5u);
    EXPECT_EQ(rg.input_nodes().size(), 5u);

    RegionGraph single = templates::fully_factorized(1);
    EXPECT_EQ(single.num_nodes(), 1u);
}
