#pragma once

#include <vector>

#include "pcflow/backend/compiled_circuit.hpp"
#include "pcflow/backend/reparam.hpp"
#include "pcflow/symbolic/circuit.hpp"

namespace pcflow {
namespace backend {

class PipelineContext;

// Compiles every circuit reachable from `roots` through operator
// provenance, operands first. Circuits already materialized in `ctx` are
// skipped. `reparam` parameterizes fresh parameters; when null every
// layer uses its own default.
void compile_pipeline(const std::vector<symbolic::CircuitPtr> &roots,
                      const ReparamPtr &reparam, PipelineContext &ctx);

// Same, in a fresh context seeded with the default rules
PipelineContext compile_pipeline(const std::vector<symbolic::CircuitPtr> &roots,
                                 const ReparamPtr &reparam = nullptr);

// Lowers one circuit and registers it into `ctx`. The operand circuits of
// a derived circuit must already be materialized in `ctx`. On failure the
// context is left unmodified.
CompiledCircuitPtr compile_circuit(const symbolic::CircuitPtr &sc,
                                   const ReparamPtr &reparam,
                                   PipelineContext &ctx);

} // namespace backend
} // namespace pcflow
