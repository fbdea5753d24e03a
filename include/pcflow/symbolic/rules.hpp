#pragma once

#include <nlohmann/json.hpp>

#include "pcflow/symbolic/circuit_block.hpp"
#include "pcflow/symbolic/layers.hpp"

namespace pcflow {
namespace symbolic {

class OperatorRegistry;

// Built-in rewrite rules. Every rule returns a block of fresh layers whose
// operation records the operator and its metadata; the functional
// operators fill in the operand layers when splicing the block.
namespace rules {

// Integration keeps the layer and records the integrated variables
// (kwargs "scope") that fall into its scope
CircuitBlock integrate_input_layer(const InputLayer &sl,
                                   const nlohmann::json &kwargs);
CircuitBlock integrate_sum_layer(const SumLayer &sl);
CircuitBlock integrate_product_layer(const ProductLayer &sl);

CircuitBlock differentiate_input_layer(const InputLayer &sl);
CircuitBlock differentiate_sum_layer(const SumLayer &sl);
CircuitBlock differentiate_product_layer(const ProductLayer &sl);

// Products of two layers over the same scope; the result has the product
// of the numbers of units
CircuitBlock multiply_categorical_layers(const CategoricalLayer &lhs,
                                         const CategoricalLayer &rhs);
CircuitBlock multiply_gaussian_layers(const GaussianLayer &lhs,
                                      const GaussianLayer &rhs);
CircuitBlock multiply_constant_layers(const ConstantLayer &lhs,
                                      const ConstantLayer &rhs);
CircuitBlock multiply_dense_layers(const DenseLayer &lhs,
                                   const DenseLayer &rhs);
CircuitBlock multiply_mixing_layers(const MixingLayer &lhs,
                                    const MixingLayer &rhs);
CircuitBlock multiply_hadamard_layers(const HadamardLayer &lhs,
                                      const HadamardLayer &rhs);
CircuitBlock multiply_kronecker_layers(const KroneckerLayer &lhs,
                                       const KroneckerLayer &rhs);

} // namespace rules

void register_default_rules(OperatorRegistry &registry);

} // namespace symbolic
} // namespace pcflow
