#pragma once

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pcflow/backend/compiled_circuit.hpp"
#include "pcflow/backend/layers.hpp"
#include "pcflow/backend/reparam.hpp"
#include "pcflow/scope.hpp"
#include "pcflow/symbolic/circuit.hpp"
#include "pcflow/symbolic/registry.hpp"

namespace pcflow {
namespace backend {

// A compilation session.
//
// Owns the operator registry used by the structural operators, the
// executable layer registry and the table of materialized circuits keyed
// by the identity of their symbolic circuit. Contexts are independent of
// each other; a single context must not be used from several threads at
// once.
class PipelineContext {
  public:
    // Seeded with the default operator rules and executable layers
    explicit PipelineContext(ReparamPtr reparam = nullptr);

    PipelineContext(const PipelineContext &) = delete;
    PipelineContext &operator=(const PipelineContext &) = delete;
    PipelineContext(PipelineContext &&) = default;
    PipelineContext &operator=(PipelineContext &&) = default;

    // Compiles `sc` and the operand circuits it was derived from
    CompiledCircuitPtr compile(const symbolic::CircuitPtr &sc);

    // Structural operators on compiled circuits: the symbolic result is
    // derived with this context's registry, then compiled. Throw
    // ValueError for circuits this context did not compile.
    CompiledCircuitPtr integrate(const CompiledCircuitPtr &cc,
                                 const std::optional<Scope> &scope = {});
    CompiledCircuitPtr differentiate(const CompiledCircuitPtr &cc);
    CompiledCircuitPtr multiply(const CompiledCircuitPtr &lhs,
                                const CompiledCircuitPtr &rhs);

    bool contains(const symbolic::SymbolicCircuit &sc) const;
    bool has_symbolic(const CompiledCircuitPtr &cc) const;

    // Throw ValueError if the circuit was not compiled in this context
    const CompiledCircuitPtr &
    get_compiled_circuit(const symbolic::SymbolicCircuit &sc) const;
    const symbolic::CircuitPtr &
    get_symbolic_circuit(const CompiledCircuitPtr &cc) const;
    const ExecutableLayer &
    get_materialized_layer(const symbolic::SymbolicCircuit &sc,
                           symbolic::LayerId id) const;

    // Registers a compiled circuit; its symbolic circuit must be new
    void register_materialized_circuit(CompiledCircuitPtr cc);

    size_t num_circuits() const { return circuits_.size(); }

    template <typename F>
    void register_operator_rule(symbolic::Operator op, F &&fn,
                                bool commutative = false) {
        operators_.register_rule(op, std::forward<F>(fn), commutative);
    }

    void register_layer(symbolic::LayerKind kind, LayerConstructor ctor) {
        layers_.register_layer(kind, std::move(ctor));
    }

    symbolic::OperatorRegistry &operator_registry() { return operators_; }
    const symbolic::OperatorRegistry &operator_registry() const {
        return operators_;
    }
    const ExecutableLayerRegistry &layer_registry() const { return layers_; }

    const ReparamPtr &reparam() const { return reparam_; }

  private:
    symbolic::OperatorRegistry operators_;
    ExecutableLayerRegistry layers_;
    ReparamPtr reparam_;

    struct Entry {
        symbolic::CircuitPtr symbolic;
        CompiledCircuitPtr compiled;
    };
    std::unordered_map<const symbolic::SymbolicCircuit *, Entry> circuits_;
};

} // namespace backend
} // namespace pcflow
