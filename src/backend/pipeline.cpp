#include "pcflow/backend/pipeline.hpp"

#include "pcflow/backend/compiler.hpp"
#include "pcflow/error.hpp"
#include "pcflow/symbolic/functional.hpp"

namespace pcflow {
namespace backend {

using symbolic::CircuitPtr;
using symbolic::SymbolicCircuit;

PipelineContext::PipelineContext(ReparamPtr reparam)
    : operators_(symbolic::OperatorRegistry::from_default_rules()),
      reparam_(std::move(reparam)) {}

CompiledCircuitPtr PipelineContext::compile(const CircuitPtr &sc) {
    if (!sc)
        throw ValueError("cannot compile a null circuit");
    compile_pipeline({sc}, reparam_, *this);
    return get_compiled_circuit(*sc);
}

// ============================================================================
// Structural operators
// ============================================================================

CompiledCircuitPtr
PipelineContext::integrate(const CompiledCircuitPtr &cc,
                           const std::optional<Scope> &scope) {
    const CircuitPtr &sc = get_symbolic_circuit(cc);
    return compile(symbolic::integrate(sc, scope, operators_));
}

CompiledCircuitPtr
PipelineContext::differentiate(const CompiledCircuitPtr &cc) {
    const CircuitPtr &sc = get_symbolic_circuit(cc);
    return compile(symbolic::differentiate(sc, operators_));
}

CompiledCircuitPtr PipelineContext::multiply(const CompiledCircuitPtr &lhs,
                                             const CompiledCircuitPtr &rhs) {
    const CircuitPtr &lhs_sc = get_symbolic_circuit(lhs);
    const CircuitPtr &rhs_sc = get_symbolic_circuit(rhs);
    return compile(symbolic::multiply(lhs_sc, rhs_sc, operators_));
}

// ============================================================================
// Materialized circuits
// ============================================================================

bool PipelineContext::contains(const SymbolicCircuit &sc) const {
    return circuits_.count(&sc) != 0;
}

bool PipelineContext::has_symbolic(const CompiledCircuitPtr &cc) const {
    if (!cc)
        return false;
    auto it = circuits_.find(cc->symbolic_circuit().get());
    return it != circuits_.end() && it->second.compiled == cc;
}

const CompiledCircuitPtr &
PipelineContext::get_compiled_circuit(const SymbolicCircuit &sc) const {
    auto it = circuits_.find(&sc);
    if (it == circuits_.end())
        throw ValueError("the circuit was not compiled in this pipeline");
    return it->second.compiled;
}

const CircuitPtr &
PipelineContext::get_symbolic_circuit(const CompiledCircuitPtr &cc) const {
    if (!has_symbolic(cc))
        throw ValueError(
            "the compiled circuit does not belong to this pipeline");
    return circuits_.at(cc->symbolic_circuit().get()).symbolic;
}

const ExecutableLayer &
PipelineContext::get_materialized_layer(const SymbolicCircuit &sc,
                                        symbolic::LayerId id) const {
    return get_compiled_circuit(sc)->materialized_layer(id);
}

void PipelineContext::register_materialized_circuit(CompiledCircuitPtr cc) {
    if (!cc)
        throw ValueError("cannot register a null compiled circuit");
    CircuitPtr sc = cc->symbolic_circuit();
    if (contains(*sc))
        throw ValueError("the circuit is already materialized");
    const SymbolicCircuit *key = sc.get();
    circuits_.emplace(key, Entry{std::move(sc), std::move(cc)});
}

} // namespace backend
} // namespace pcflow
