#include "pcflow_test_utils.hpp"

using namespace pcflow;
using namespace pcflow::symbolic;

namespace {

ParameterPtr leaf(Shape shape) {
    return std::make_shared<Parameter>(std::move(shape));
}

} // namespace

TEST(Parameters, LeafShapes) {
    auto p = leaf({2, 3});
    EXPECT_EQ(p->shape(), (Shape{2, 3}));
    EXPECT_TRUE(p->operands().empty());
    EXPECT_EQ(p->name(), "Parameter");

    ConstantParameter c({4}, 1.5);
    EXPECT_EQ(c.shape(), (Shape{4}));
    EXPECT_DOUBLE_EQ(c.value(), 1.5);
    EXPECT_EQ(c.config()["value"], 1.5);
}

TEST(Parameters, EntrywiseOpsKeepShape) {
    auto p = leaf({2, 3});
    EXPECT_EQ(ExpParameter(p).shape(), p->shape());
    EXPECT_EQ(LogParameter(p).shape(), p->shape());
    EXPECT_EQ(SoftplusParameter(p).shape(), p->shape());
    EXPECT_EQ(SigmoidParameter(p).shape(), p->shape());
    EXPECT_EQ(SoftmaxParameter(p, 0).shape(), p->shape());
    EXPECT_THROW(ScaledSigmoidParameter(p, 1.0, 1.0), ValueError);
}

TEST(Parameters, AxesAreNormalized) {
    auto p = leaf({2, 3, 4});
    EXPECT_EQ(SoftmaxParameter(p).axis(), 2u);
    EXPECT_EQ(LogSoftmaxParameter(p, -2).axis(), 1u);
    EXPECT_THROW(SoftmaxParameter(p, 3), ShapeError);
    EXPECT_THROW(SoftmaxParameter(p, -4), ShapeError);
}

TEST(Parameters, ReductionsDropTheAxis) {
    auto p = leaf({2, 3, 4});
    EXPECT_EQ(ReduceSumParameter(p, 1).shape(), (Shape{2, 4}));
    EXPECT_EQ(ReduceProductParameter(p, 0).shape(), (Shape{3, 4}));
    EXPECT_EQ(ReduceLSEParameter(p).shape(), (Shape{2, 3}));
}

TEST(Parameters, ReshapeKeepsElementCount) {
    auto p = leaf({2, 12});
    ReshapeParameter split(p, {2, 3, 4});
    EXPECT_EQ(split.shape(), (Shape{2, 3, 4}));
    EXPECT_EQ(split.config()["shape"], nlohmann::json({2, 3, 4}));
    EXPECT_THROW(ReshapeParameter(p, {5, 5}), ShapeError);
    EXPECT_THROW(ReshapeParameter(nullptr, {1}), ValueError);
}

TEST(Parameters, PermuteReordersAxes) {
    auto p = leaf({2, 3, 4, 5});
    PermuteParameter permuted(p, {0, 2, 1, 3});
    EXPECT_EQ(permuted.shape(), (Shape{2, 4, 3, 5}));
    EXPECT_EQ(permuted.config()["axes"], nlohmann::json({0, 2, 1, 3}));
    EXPECT_THROW(PermuteParameter(p, {0, 1, 2}), ShapeError);
    EXPECT_THROW(PermuteParameter(p, {0, 1, 1, 3}), ShapeError);
    EXPECT_THROW(PermuteParameter(p, {0, 1, 2, 4}), ShapeError);
}

TEST(Parameters, BinaryShapes) {
    auto a = leaf({2, 3});
    auto b = leaf({4, 5});
    EXPECT_EQ(KroneckerParameter(a, b).shape(), (Shape{8, 15}));
    EXPECT_EQ(HadamardParameter(a, leaf({2, 3})).shape(), (Shape{2, 3}));
    EXPECT_THROW(HadamardParameter(a, b), ShapeError);
    EXPECT_THROW(KroneckerParameter(a, leaf({2})), ShapeError);

    auto c = leaf({2, 5, 3});
    auto d = leaf({2, 7, 3});
    EXPECT_EQ(OuterProductParameter(c, d, 1).shape(), (Shape{2, 35, 3}));
    EXPECT_EQ(OuterSumParameter(c, d, 1).shape(), (Shape{2, 35, 3}));
    // Sizes must agree outside the combined axis
    EXPECT_THROW(OuterProductParameter(c, leaf({3, 7, 3}), 1), ShapeError);
}

TEST(Parameters, NaryShapes) {
    auto a = leaf({2, 3});
    auto b = leaf({2, 3});
    EXPECT_EQ(EntrywiseSumParameter({a, b}).shape(), (Shape{2, 3}));
    EXPECT_EQ(StackParameter({a, b}, 0).shape(), (Shape{2, 2, 3}));
    EXPECT_EQ(StackParameter({a, b, a}).shape(), (Shape{2, 3, 3}));
    EXPECT_THROW(EntrywiseSumParameter({a, leaf({3, 2})}), ShapeError);
    EXPECT_THROW(EntrywiseSumParameter({}), ValueError);
}

TEST(Parameters, NullOperandsAreRejected) {
    EXPECT_THROW(ExpParameter(nullptr), ValueError);
    EXPECT_THROW(HadamardParameter(leaf({1}), nullptr), ValueError);
}

TEST(Parameters, GaussianProduct) {
    auto m1 = leaf({3, 2, 1});
    auto s1 = leaf({3, 2, 1});
    auto m2 = leaf({3, 4, 1});
    auto s2 = leaf({3, 4, 1});

    MeanGaussianProduct mean({m1, m2}, {s1, s2});
    StddevGaussianProduct stddev({s1, s2});
    LogPartitionGaussianProduct log_partition({m1, m2}, {s1, s2});
    EXPECT_EQ(mean.shape(), (Shape{3, 8, 1}));
    EXPECT_EQ(stddev.shape(), (Shape{3, 8, 1}));
    EXPECT_EQ(log_partition.shape(), (Shape{3, 8, 1}));
    EXPECT_EQ(mean.operands().size(), 4u);

    EXPECT_THROW(MeanGaussianProduct({m1, m2}, {s1}), ValueError);
    EXPECT_THROW(StddevGaussianProduct({s1}), ValueError);
    EXPECT_THROW(StddevGaussianProduct({s1, leaf({2, 4, 1})}), ShapeError);
    EXPECT_THROW(StddevGaussianProduct({leaf({2, 3}), leaf({2, 3})}),
                 ShapeError);
}

TEST(Parameters, LeavesAreListedOnce) {
    auto a = leaf({2, 2});
    auto b = leaf({2, 2});
    auto sum = std::make_shared<EntrywiseSumParameter>(
        std::vector<ParameterPtr>{std::make_shared<ExpParameter>(a), b, a});
    auto leaves = parameter_leaves(sum);
    ASSERT_EQ(leaves.size(), 2u);
    EXPECT_EQ(leaves[0].get(), a.get());
    EXPECT_EQ(leaves[1].get(), b.get());
}

TEST(Parameters, Describe) {
    auto p = std::make_shared<SoftmaxParameter>(leaf({2, 3}));
    auto doc = describe(p);
    EXPECT_EQ(doc["name"], "SoftmaxParameter");
    EXPECT_EQ(doc["config"]["axis"], 1);
    ASSERT_EQ(doc["operands"].size(), 1u);
    EXPECT_EQ(doc["operands"][0]["name"], "Parameter");
    EXPECT_EQ(doc["operands"][0]["shape"], nlohmann::json({2, 3}));
}
