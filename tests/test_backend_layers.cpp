#include "pcflow_test_utils.hpp"

using namespace pcflow;
using namespace pcflow::backend;

namespace {

LayerArgs make_args(size_t in, size_t out, size_t arity) {
    LayerArgs args;
    args.num_input_units = in;
    args.num_output_units = out;
    args.arity = arity;
    return args;
}

} // namespace

// ============================================================================
// Input layers
// ============================================================================

TEST(BackendLayers, CategoricalShapes) {
    LayerArgs args = make_args(2, 5, 3);
    args.kwargs["num_categories"] = 4;
    CategoricalLayer layer(args);

    EXPECT_EQ(layer.kind(), symbolic::LayerKind::Categorical);
    EXPECT_EQ(layer.num_channels(), 2u);
    EXPECT_EQ(layer.num_variables(), 3u);
    EXPECT_EQ(layer.num_categories(), 4u);
    ASSERT_EQ(layer.parameters().size(), 1u);
    EXPECT_EQ(layer.parameter("probs")->shape(), (Shape{3, 5, 2, 4}));
    EXPECT_EQ(layer.config()["num_categories"], 4);
}

TEST(BackendLayers, CategoricalDefaultsToSoftmax) {
    CategoricalLayer layer(make_args(1, 2, 1));
    ASSERT_TRUE(layer.reparam());
    EXPECT_EQ(layer.reparam()->name(), "softmax");
    EXPECT_TRUE(std::dynamic_pointer_cast<const symbolic::SoftmaxParameter>(
        layer.parameter("probs")));
}

TEST(BackendLayers, SuppliedReparameterization) {
    LayerArgs args = make_args(1, 2, 1);
    args.reparam = std::make_shared<ExpReparameterization>();
    CategoricalLayer layer(args);
    EXPECT_EQ(layer.reparam()->name(), "exp");
    EXPECT_TRUE(std::dynamic_pointer_cast<const symbolic::ExpParameter>(
        layer.parameter("probs")));
    EXPECT_EQ(layer.config()["reparam"]["name"], "exp");
}

TEST(BackendLayers, GaussianShapes) {
    GaussianLayer layer(make_args(1, 4, 1));
    auto named = layer.named_parameters("input.");
    ASSERT_EQ(named.size(), 2u);
    EXPECT_EQ(named[0].first, "input.mean");
    EXPECT_EQ(named[1].first, "input.stddev");
    EXPECT_EQ(layer.parameter("mean")->shape(), (Shape{1, 4, 1}));
    EXPECT_EQ(layer.parameter("stddev")->shape(), (Shape{1, 4, 1}));
    EXPECT_TRUE(std::dynamic_pointer_cast<const symbolic::SoftplusParameter>(
        layer.parameter("stddev")));
    EXPECT_FALSE(layer.has_parameter("log_partition"));
}

TEST(BackendLayers, GaussianKeepsSuppliedLogPartition) {
    LayerArgs args = make_args(1, 4, 1);
    auto lp = std::make_shared<symbolic::Parameter>(Shape{1, 4, 1});
    args.parameters["log_partition"] = lp;
    GaussianLayer layer(args);
    ASSERT_TRUE(layer.has_parameter("log_partition"));
    EXPECT_EQ(layer.parameter("log_partition"), lp);
}

TEST(BackendLayers, ConstantHasNoParameters) {
    LayerArgs args = make_args(1, 3, 2);
    args.kwargs["value"] = -1.5;
    ConstantLayer layer(args);
    EXPECT_TRUE(layer.parameters().empty());
    EXPECT_DOUBLE_EQ(layer.value(), -1.5);
    EXPECT_FALSE(layer.reparam());
}

TEST(BackendLayers, IntegratedVariables) {
    LayerArgs args = make_args(1, 2, 2);
    args.kwargs["integrated"] = std::vector<size_t>{3};
    CategoricalLayer layer(args);
    EXPECT_EQ(layer.integrated_vars(), (std::vector<size_t>{3}));
    EXPECT_EQ(layer.config()["integrated"], nlohmann::json::array({3}));
}

// ============================================================================
// Inner layers
// ============================================================================

TEST(BackendLayers, DenseWeightShape) {
    DenseLayer layer(make_args(3, 4, 2));
    EXPECT_EQ(layer.parameter("weight")->shape(), (Shape{4, 6}));
    EXPECT_EQ(layer.config()["arity"], 2);
}

TEST(BackendLayers, ProductLayersHaveNoParameters) {
    HadamardLayer hadamard(make_args(3, 3, 2));
    KroneckerLayer kronecker(make_args(3, 9, 2));
    EXPECT_TRUE(hadamard.parameters().empty());
    EXPECT_TRUE(kronecker.parameters().empty());
    EXPECT_FALSE(hadamard.reparam());
}

TEST(BackendLayers, MixingNeedsSeveralInputs) {
    EXPECT_NO_THROW(MixingLayer(make_args(2, 2, 2)));
    EXPECT_THROW(MixingLayer(make_args(2, 2, 1)), ValueError);
}

TEST(BackendLayers, RejectsZeroSizes) {
    EXPECT_THROW(DenseLayer(make_args(0, 2, 1)), ValueError);
    EXPECT_THROW(DenseLayer(make_args(2, 0, 1)), ValueError);
    EXPECT_THROW(CategoricalLayer(make_args(1, 2, 0)), ValueError);
}

TEST(BackendLayers, SuppliedParameterIsShared) {
    auto weight = std::make_shared<symbolic::Parameter>(Shape{2, 3});
    LayerArgs args = make_args(3, 2, 1);
    args.parameters["weight"] = weight;
    DenseLayer a(args);
    DenseLayer b(args);
    EXPECT_EQ(a.parameter("weight"), weight);
    EXPECT_EQ(a.parameter("weight"), b.parameter("weight"));
}

TEST(BackendLayers, SuppliedParameterShapeMismatch) {
    LayerArgs args = make_args(3, 2, 1);
    args.parameters["weight"] =
        std::make_shared<symbolic::Parameter>(Shape{3, 2});
    EXPECT_THROW(DenseLayer{args}, ShapeError);

    args.parameters["weight"] = nullptr;
    EXPECT_THROW(DenseLayer{args}, ValueError);
}

TEST(BackendLayers, UnknownParameter) {
    DenseLayer layer(make_args(2, 2, 1));
    EXPECT_FALSE(layer.has_parameter("bias"));
    EXPECT_THROW(layer.parameter("bias"), ValueError);
}

TEST(BackendLayers, OperationIsReported) {
    LayerArgs args = make_args(2, 2, 1);
    args.operation = symbolic::Operator::Integration;
    DenseLayer layer(args);
    ASSERT_TRUE(layer.operation().has_value());
    EXPECT_EQ(*layer.operation(), symbolic::Operator::Integration);
    EXPECT_TRUE(layer.config().contains("operation"));
}

// ============================================================================
// Reparameterizations
// ============================================================================

TEST(Reparameterization, ByName) {
    for (const char *name :
         {"leaf", "exp", "softplus", "sigmoid", "softmax", "log_softmax"}) {
        ReparamPtr reparam = make_reparameterization(name);
        ASSERT_TRUE(reparam);
        EXPECT_EQ(reparam->name(), name);
        EXPECT_EQ(reparam->parameterize(Shape{2, 3})->shape(), (Shape{2, 3}));
    }
    EXPECT_THROW(make_reparameterization("tanh"), ValueError);
}

TEST(Reparameterization, FreshLeaves) {
    SoftmaxReparameterization reparam(0);
    auto a = reparam.parameterize(Shape{4});
    auto b = reparam.parameterize(Shape{4});
    auto a_leaves = symbolic::parameter_leaves(a);
    auto b_leaves = symbolic::parameter_leaves(b);
    ASSERT_EQ(a_leaves.size(), 1u);
    ASSERT_EQ(b_leaves.size(), 1u);
    EXPECT_NE(a_leaves[0], b_leaves[0]);
    EXPECT_EQ(reparam.config()["axis"], 0);
}

// ============================================================================
// Registry
// ============================================================================

TEST(ExecutableLayerRegistry, BuiltinLayers) {
    ExecutableLayerRegistry registry;
    using symbolic::LayerKind;
    for (LayerKind kind :
         {LayerKind::Categorical, LayerKind::Gaussian, LayerKind::Constant,
          LayerKind::Dense, LayerKind::Mixing, LayerKind::Hadamard,
          LayerKind::Kronecker}) {
        EXPECT_TRUE(registry.has_layer(kind)) << symbolic::to_string(kind);
    }
    EXPECT_FALSE(registry.has_layer(LayerKind::Sum));

    auto layer = registry.construct(LayerKind::Dense, make_args(2, 3, 1));
    EXPECT_EQ(layer->kind(), LayerKind::Dense);
    EXPECT_EQ(layer->name(), "DenseLayer");
}

TEST(ExecutableLayerRegistry, AbstractKindsAreRejected) {
    ExecutableLayerRegistry registry;
    auto ctor = [](const LayerArgs &args) -> std::unique_ptr<ExecutableLayer> {
        return std::make_unique<DenseLayer>(args);
    };
    EXPECT_THROW(registry.register_layer(symbolic::LayerKind::Sum, ctor),
                 ValueError);
    EXPECT_THROW(registry.register_layer(symbolic::LayerKind::Dense, nullptr),
                 ValueError);
    EXPECT_THROW(registry.construct(symbolic::LayerKind::Product,
                                    make_args(1, 1, 1)),
                 StructuralError);
}

TEST(ExecutableLayerRegistry, OverrideConstructor) {
    ExecutableLayerRegistry registry;
    size_t calls = 0;
    registry.register_layer(
        symbolic::LayerKind::Hadamard,
        [&calls](const LayerArgs &args) -> std::unique_ptr<ExecutableLayer> {
            ++calls;
            return std::make_unique<HadamardLayer>(args);
        });
    registry.construct(symbolic::LayerKind::Hadamard, make_args(2, 2, 2));
    EXPECT_EQ(calls, 1u);

    registry.register_layer(
        symbolic::LayerKind::Hadamard,
        [](const LayerArgs &) -> std::unique_ptr<ExecutableLayer> {
            return nullptr;
        });
    EXPECT_THROW(registry.construct(symbolic::LayerKind::Hadamard,
                                    make_args(2, 2, 2)),
                 RuntimeError);
}
