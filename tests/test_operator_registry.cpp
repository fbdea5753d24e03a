#include "pcflow_test_utils.hpp"

using namespace pcflow;
using namespace pcflow::symbolic;

namespace {

// Encodes its operands in the number of units of the result
CircuitBlock tag_sum_layers(const SumLayer &lhs, const SumLayer &rhs) {
    return CircuitBlock::from_layer(std::make_unique<DenseLayer>(
        lhs.scope(), lhs.num_units() * 100 + rhs.num_units()));
}

CircuitBlock tag_dense_mixing(const DenseLayer &dense,
                              const MixingLayer &mixing) {
    return CircuitBlock::from_layer(std::make_unique<DenseLayer>(
        dense.scope(), dense.num_units() * 100 + mixing.num_units()));
}

size_t call_units(const RulePtr &rule,
                  std::vector<const SymbolicLayer *> operands) {
    return (*rule)(operands).layer(0).num_units();
}

} // namespace

TEST(OperatorRegistry, EmptyRegistry) {
    OperatorRegistry registry;
    EXPECT_TRUE(registry.operators().empty());
    EXPECT_FALSE(registry.has_rule(Operator::Integration, {LayerKind::Dense}));
    EXPECT_THROW(registry.retrieve_rule(Operator::Integration,
                                        {LayerKind::Dense}),
                 OperatorNotFound);
}

TEST(OperatorRegistry, SignatureNotFound) {
    OperatorRegistry registry;
    registry.register_rule(Operator::Multiplication, tag_sum_layers);
    EXPECT_THROW(registry.retrieve_rule(
                     Operator::Multiplication,
                     {LayerKind::Hadamard, LayerKind::Hadamard}),
                 OperatorSignatureNotFound);
    // Arity must match too
    EXPECT_THROW(registry.retrieve_rule(Operator::Multiplication,
                                        {LayerKind::Dense}),
                 OperatorSignatureNotFound);
}

TEST(OperatorRegistry, SubkindDispatch) {
    OperatorRegistry registry;
    registry.register_rule(Operator::Multiplication, tag_sum_layers);

    Signature concrete = {LayerKind::Dense, LayerKind::Mixing};
    EXPECT_TRUE(registry.has_rule(Operator::Multiplication, concrete));
    RulePtr first = registry.retrieve_rule(Operator::Multiplication, concrete);
    RulePtr second = registry.retrieve_rule(Operator::Multiplication, concrete);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->signature, (Signature{LayerKind::Sum, LayerKind::Sum}));

    DenseLayer dense(Scope{0}, 3);
    MixingLayer mixing(Scope{0}, 2, 2);
    EXPECT_EQ(call_units(first, {&dense, &mixing}), 302u);
}

TEST(OperatorRegistry, CachingDoesNotChangeAnswers) {
    OperatorRegistry registry;
    registry.register_rule(Operator::Multiplication, tag_sum_layers);

    Signature unrelated = {LayerKind::Hadamard, LayerKind::Dense};
    EXPECT_FALSE(registry.has_rule(Operator::Multiplication, unrelated));
    registry.retrieve_rule(Operator::Multiplication,
                           {LayerKind::Dense, LayerKind::Dense});
    EXPECT_FALSE(registry.has_rule(Operator::Multiplication, unrelated));
    EXPECT_TRUE(registry.has_rule(Operator::Multiplication,
                                  {LayerKind::Mixing, LayerKind::Dense}));
    EXPECT_EQ(registry.num_rules(Operator::Multiplication), 1u);
}

TEST(OperatorRegistry, ExactMatchWinsOverSubkind) {
    OperatorRegistry registry;
    registry.register_rule(Operator::Multiplication, tag_sum_layers);
    registry.register_rule(Operator::Multiplication, tag_dense_mixing);

    RulePtr rule = registry.retrieve_rule(
        Operator::Multiplication, {LayerKind::Dense, LayerKind::Mixing});
    EXPECT_EQ(rule->signature,
              (Signature{LayerKind::Dense, LayerKind::Mixing}));
}

TEST(OperatorRegistry, NewRulesInvalidateResolutions) {
    OperatorRegistry registry;
    registry.register_rule(Operator::Multiplication, tag_sum_layers);
    Signature concrete = {LayerKind::Dense, LayerKind::Mixing};
    registry.retrieve_rule(Operator::Multiplication, concrete);

    registry.register_rule(Operator::Multiplication, tag_dense_mixing);
    EXPECT_EQ(registry.retrieve_rule(Operator::Multiplication, concrete)
                  ->signature,
              concrete);
}

TEST(OperatorRegistry, CommutativeRulesAreMirrored) {
    OperatorRegistry registry;
    registry.register_rule(Operator::Multiplication, tag_dense_mixing,
                           /*commutative=*/true);
    EXPECT_EQ(registry.num_rules(Operator::Multiplication), 2u);

    DenseLayer dense(Scope{0}, 4);
    MixingLayer mixing(Scope{0}, 7, 2);
    RulePtr forward = registry.retrieve_rule(
        Operator::Multiplication, {LayerKind::Dense, LayerKind::Mixing});
    RulePtr mirrored = registry.retrieve_rule(
        Operator::Multiplication, {LayerKind::Mixing, LayerKind::Dense});
    EXPECT_EQ(call_units(mirrored, {&mixing, &dense}),
              call_units(forward, {&dense, &mixing}));
    EXPECT_EQ(call_units(mirrored, {&mixing, &dense}), 407u);
}

TEST(OperatorRegistry, SymmetricSignatureIsNotDuplicated) {
    OperatorRegistry registry;
    registry.register_rule(Operator::Multiplication, tag_sum_layers,
                           /*commutative=*/true);
    EXPECT_EQ(registry.num_rules(Operator::Multiplication), 1u);
}

TEST(OperatorRegistry, ReRegisteringReplaces) {
    OperatorRegistry registry;
    registry.register_rule(Operator::Differentiation,
                           rules::differentiate_sum_layer);
    registry.register_rule(Operator::Differentiation,
                           [](const SumLayer &sl) {
                               return CircuitBlock::from_layer(sl.clone());
                           });
    EXPECT_EQ(registry.num_rules(Operator::Differentiation), 1u);

    DenseLayer dense(Scope{0}, 2);
    RulePtr rule = registry.retrieve_rule(Operator::Differentiation,
                                          {LayerKind::Dense});
    // The replacement does not stamp an operation
    EXPECT_FALSE((*rule)({&dense}).layer(0).operation().has_value());
}

TEST(OperatorRegistry, KeywordArgumentsAreForwarded) {
    OperatorRegistry registry;
    registry.register_rule(
        Operator::Integration,
        [](const InputLayer &sl, const nlohmann::json &kwargs) {
            return CircuitBlock::from_layer(std::make_unique<GaussianLayer>(
                sl.scope(), kwargs.at("units").get<size_t>(), 1));
        });
    GaussianLayer g(Scope{0}, 2, 1);
    RulePtr rule =
        registry.retrieve_rule(Operator::Integration, {LayerKind::Gaussian});
    EXPECT_EQ((*rule)({&g}, {{"units", 9}}).layer(0).num_units(), 9u);
}

// ============================================================================
// Invalid rules
// ============================================================================

TEST(OperatorRegistry, RuleMustReturnABlock) {
    OperatorRegistry registry;
    EXPECT_THROW(registry.register_rule(Operator::Integration,
                                        [](const DenseLayer &) { return 0; }),
                 ValueError);
}

TEST(OperatorRegistry, OperandsMustComeFirst) {
    OperatorRegistry registry;
    auto rule = [](const DenseLayer &sl, const nlohmann::json &,
                   const DenseLayer &) {
        return CircuitBlock::from_layer(sl.clone());
    };
    EXPECT_THROW(registry.register_rule(Operator::Multiplication, rule),
                 ValueError);
    EXPECT_EQ(registry.num_rules(Operator::Multiplication), 0u);
}

TEST(OperatorRegistry, RuleNeedsLayerOperands) {
    OperatorRegistry registry;
    EXPECT_THROW(registry.register_rule(
                     Operator::Integration,
                     [](const nlohmann::json &) { return CircuitBlock(); }),
                 ValueError);
    EXPECT_THROW(registry.register_rule(
                     Operator::Integration,
                     [](const DenseLayer &sl, int) {
                         return CircuitBlock::from_layer(sl.clone());
                     }),
                 ValueError);
}

// ============================================================================
// Default rules
// ============================================================================

TEST(OperatorRegistry, DefaultRules) {
    auto registry = OperatorRegistry::from_default_rules();
    EXPECT_EQ(registry.operators().size(), 3u);
    EXPECT_EQ(registry.num_rules(Operator::Integration), 3u);
    EXPECT_EQ(registry.num_rules(Operator::Differentiation), 3u);
    EXPECT_EQ(registry.num_rules(Operator::Multiplication), 7u);

    for (LayerKind kind : {LayerKind::Categorical, LayerKind::Gaussian,
                           LayerKind::Constant, LayerKind::Dense,
                           LayerKind::Mixing, LayerKind::Hadamard,
                           LayerKind::Kronecker}) {
        EXPECT_TRUE(registry.has_rule(Operator::Integration, {kind}));
        EXPECT_TRUE(registry.has_rule(Operator::Differentiation, {kind}));
        EXPECT_TRUE(registry.has_rule(Operator::Multiplication, {kind, kind}));
    }
    EXPECT_FALSE(registry.has_rule(Operator::Multiplication,
                                   {LayerKind::Categorical,
                                    LayerKind::Gaussian}));
}

TEST(OperatorRegistry, MultiplicationRulesCheckCompatibility) {
    auto registry = OperatorRegistry::from_default_rules();
    CategoricalLayer a(Scope{0}, 2, 1, 3);
    CategoricalLayer b(Scope{0}, 5, 1, 4);
    CategoricalLayer c(Scope{1}, 5, 1, 3);
    RulePtr rule = registry.retrieve_rule(
        Operator::Multiplication,
        {LayerKind::Categorical, LayerKind::Categorical});
    EXPECT_THROW((*rule)({&a, &b}), StructuralError);
    EXPECT_THROW((*rule)({&a, &c}), StructuralError);

    CategoricalLayer d(Scope{0}, 5, 1, 3);
    CircuitBlock block = (*rule)({&a, &d});
    EXPECT_EQ(block.layer(0).num_units(), 10u);
    ASSERT_TRUE(block.layer(0).operation().has_value());
    EXPECT_EQ(block.layer(0).operation()->op, Operator::Multiplication);
}

TEST(OperatorRegistry, KroneckerProductsMultiplyInputUnits) {
    auto registry = OperatorRegistry::from_default_rules();
    KroneckerLayer lhs(Scope{0, 1}, 2, 2);
    KroneckerLayer rhs(Scope{0, 1}, 3, 2);
    RulePtr rule = registry.retrieve_rule(
        Operator::Multiplication, {LayerKind::Kronecker, LayerKind::Kronecker});
    CircuitBlock block = (*rule)({&lhs, &rhs});
    const auto *product = layer_cast<KroneckerLayer>(block.layer(0));
    ASSERT_NE(product, nullptr);
    EXPECT_EQ(product->arity(), 2u);
    EXPECT_EQ(product->num_input_units(), 6u);
    EXPECT_EQ(product->num_units(), 36u);
}

TEST(OperatorRegistry, MixingProductsAreRejected) {
    auto registry = OperatorRegistry::from_default_rules();
    MixingLayer lhs(Scope{0, 1}, 2, 2);
    MixingLayer rhs(Scope{0, 1}, 3, 2);
    RulePtr rule = registry.retrieve_rule(
        Operator::Multiplication, {LayerKind::Mixing, LayerKind::Mixing});
    EXPECT_THROW((*rule)({&lhs, &rhs}), StructuralError);
}
