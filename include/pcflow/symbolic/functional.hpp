#pragma once

#include <optional>

#include "pcflow/scope.hpp"
#include "pcflow/symbolic/circuit.hpp"
#include "pcflow/symbolic/registry.hpp"

namespace pcflow {
namespace symbolic {

// Structural operators over circuits. Each one rewrites every layer with
// the rule the registry holds for it and returns a new circuit whose
// operation refers to the operand circuit(s); the operands are left
// untouched.

// Integrates out `scope` (all the variables of the circuit by default).
// Throws ValueError if `scope` has variables outside the circuit scope.
CircuitPtr integrate(const CircuitPtr &sc,
                     const std::optional<Scope> &scope,
                     OperatorRegistry &registry);

CircuitPtr differentiate(const CircuitPtr &sc, OperatorRegistry &registry);

// Product of two circuits with the same structure, layer by layer.
// Throws StructuralError if their structures differ.
CircuitPtr multiply(const CircuitPtr &lhs, const CircuitPtr &rhs,
                    OperatorRegistry &registry);

} // namespace symbolic
} // namespace pcflow
