#include "pcflow/symbolic/rules.hpp"

#include "pcflow/error.hpp"
#include "pcflow/symbolic/registry.hpp"

namespace pcflow {
namespace symbolic {

namespace {

CircuitBlock stamped(std::unique_ptr<SymbolicLayer> layer, Operator op,
                     nlohmann::json metadata = nlohmann::json::object()) {
    layer->set_operation(LayerOperation{op, {}, std::move(metadata)});
    return CircuitBlock::from_layer(std::move(layer));
}

void check_same_scope(const SymbolicLayer &lhs, const SymbolicLayer &rhs) {
    if (lhs.scope() != rhs.scope())
        throw StructuralError::incompatible(
            lhs.to_string() + " and " + rhs.to_string() +
            " are defined over different scopes");
}

void check_same_arity(const SymbolicLayer &lhs, const SymbolicLayer &rhs) {
    check_same_scope(lhs, rhs);
    if (lhs.arity() != rhs.arity())
        throw StructuralError::incompatible(lhs.to_string() + " and " +
                                            rhs.to_string() +
                                            " have different arities");
}

void check_same_channels(const InputLayer &lhs, const InputLayer &rhs) {
    check_same_scope(lhs, rhs);
    if (lhs.num_channels() != rhs.num_channels())
        throw StructuralError::incompatible(lhs.to_string() + " and " +
                                            rhs.to_string() +
                                            " have different channels");
}

} // namespace

namespace rules {

// ============================================================================
// Integration
// ============================================================================

CircuitBlock integrate_input_layer(const InputLayer &sl,
                                   const nlohmann::json &kwargs) {
    Scope integrated = sl.scope();
    if (kwargs.contains("scope"))
        integrated =
            sl.scope() & Scope(kwargs["scope"].get<std::vector<size_t>>());
    return stamped(sl.clone(), Operator::Integration,
                   {{"scope", integrated.vars()}});
}

CircuitBlock integrate_sum_layer(const SumLayer &sl) {
    return stamped(sl.clone(), Operator::Integration);
}

CircuitBlock integrate_product_layer(const ProductLayer &sl) {
    return stamped(sl.clone(), Operator::Integration);
}

// ============================================================================
// Differentiation
// ============================================================================

CircuitBlock differentiate_input_layer(const InputLayer &sl) {
    return stamped(sl.clone(), Operator::Differentiation);
}

CircuitBlock differentiate_sum_layer(const SumLayer &sl) {
    return stamped(sl.clone(), Operator::Differentiation);
}

CircuitBlock differentiate_product_layer(const ProductLayer &sl) {
    return stamped(sl.clone(), Operator::Differentiation);
}

// ============================================================================
// Multiplication
// ============================================================================

CircuitBlock multiply_categorical_layers(const CategoricalLayer &lhs,
                                         const CategoricalLayer &rhs) {
    check_same_channels(lhs, rhs);
    if (lhs.num_categories() != rhs.num_categories())
        throw StructuralError::incompatible(
            "categorical layers with " + std::to_string(lhs.num_categories()) +
            " and " + std::to_string(rhs.num_categories()) + " categories");
    return stamped(std::make_unique<CategoricalLayer>(
                       lhs.scope(), lhs.num_units() * rhs.num_units(),
                       lhs.num_channels(), lhs.num_categories()),
                   Operator::Multiplication);
}

CircuitBlock multiply_gaussian_layers(const GaussianLayer &lhs,
                                      const GaussianLayer &rhs) {
    check_same_channels(lhs, rhs);
    return stamped(std::make_unique<GaussianLayer>(
                       lhs.scope(), lhs.num_units() * rhs.num_units(),
                       lhs.num_channels()),
                   Operator::Multiplication);
}

CircuitBlock multiply_constant_layers(const ConstantLayer &lhs,
                                      const ConstantLayer &rhs) {
    check_same_channels(lhs, rhs);
    // Log-space values add up
    return stamped(std::make_unique<ConstantLayer>(
                       lhs.scope(), lhs.num_units() * rhs.num_units(),
                       lhs.num_channels(), lhs.value() + rhs.value()),
                   Operator::Multiplication);
}

CircuitBlock multiply_dense_layers(const DenseLayer &lhs,
                                   const DenseLayer &rhs) {
    check_same_arity(lhs, rhs);
    return stamped(std::make_unique<DenseLayer>(
                       lhs.scope(), lhs.num_units() * rhs.num_units(),
                       lhs.arity()),
                   Operator::Multiplication);
}

// (sum_i f_i) * (sum_j g_j) needs every cross term f_i * g_j, and f_i and
// g_j decompose the scope along different partitions. Those products are
// not layerwise.
CircuitBlock multiply_mixing_layers(const MixingLayer &lhs,
                                    const MixingLayer &rhs) {
    check_same_arity(lhs, rhs);
    throw StructuralError::incompatible(
        "cannot multiply " + lhs.to_string() + " and " + rhs.to_string() +
        ": products of mixtures over several region partitions are not "
        "layerwise");
}

CircuitBlock multiply_hadamard_layers(const HadamardLayer &lhs,
                                      const HadamardLayer &rhs) {
    check_same_arity(lhs, rhs);
    return stamped(std::make_unique<HadamardLayer>(
                       lhs.scope(), lhs.num_units() * rhs.num_units(),
                       lhs.arity()),
                   Operator::Multiplication);
}

CircuitBlock multiply_kronecker_layers(const KroneckerLayer &lhs,
                                       const KroneckerLayer &rhs) {
    check_same_arity(lhs, rhs);
    return stamped(std::make_unique<KroneckerLayer>(
                       lhs.scope(),
                       lhs.num_input_units() * rhs.num_input_units(),
                       lhs.arity()),
                   Operator::Multiplication);
}

} // namespace rules

void register_default_rules(OperatorRegistry &registry) {
    registry.register_rule(Operator::Integration, rules::integrate_input_layer);
    registry.register_rule(Operator::Integration, rules::integrate_sum_layer);
    registry.register_rule(Operator::Integration,
                           rules::integrate_product_layer);

    registry.register_rule(Operator::Differentiation,
                           rules::differentiate_input_layer);
    registry.register_rule(Operator::Differentiation,
                           rules::differentiate_sum_layer);
    registry.register_rule(Operator::Differentiation,
                           rules::differentiate_product_layer);

    constexpr bool commutative = true;
    registry.register_rule(Operator::Multiplication,
                           rules::multiply_categorical_layers, commutative);
    registry.register_rule(Operator::Multiplication,
                           rules::multiply_gaussian_layers, commutative);
    registry.register_rule(Operator::Multiplication,
                           rules::multiply_constant_layers, commutative);
    registry.register_rule(Operator::Multiplication,
                           rules::multiply_dense_layers, commutative);
    registry.register_rule(Operator::Multiplication,
                           rules::multiply_mixing_layers, commutative);
    registry.register_rule(Operator::Multiplication,
                           rules::multiply_hadamard_layers, commutative);
    registry.register_rule(Operator::Multiplication,
                           rules::multiply_kronecker_layers, commutative);
}

} // namespace symbolic
} // namespace pcflow
