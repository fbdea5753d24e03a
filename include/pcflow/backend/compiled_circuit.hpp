#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "pcflow/backend/layers.hpp"
#include "pcflow/symbolic/circuit.hpp"

namespace pcflow {
namespace backend {

// One step of the evaluation plan.
//
// For an input layer `inputs` is empty and `scope_indices` lists the input
// columns (variables) to feed it. For an inner layer `inputs` lists the
// indices of the layers whose outputs it consumes. The final entry of a
// plan lists the layers forming the circuit outputs.
struct BookkeepingEntry {
    std::vector<size_t> inputs;
    std::optional<std::vector<size_t>> scope_indices;
};

// A materialized circuit: executable layers in evaluation order, the
// bookkeeping plan (one entry per layer plus the outputs entry) and the
// symbolic circuit it was compiled from.
class CompiledCircuit {
  public:
    CompiledCircuit(symbolic::CircuitPtr symbolic,
                    std::vector<std::unique_ptr<ExecutableLayer>> layers,
                    std::vector<BookkeepingEntry> bookkeeping,
                    std::unordered_map<symbolic::LayerId, size_t> layer_map);

    CompiledCircuit(const CompiledCircuit &) = delete;
    CompiledCircuit &operator=(const CompiledCircuit &) = delete;

    const symbolic::CircuitPtr &symbolic_circuit() const { return symbolic_; }

    size_t num_layers() const { return layers_.size(); }
    const ExecutableLayer &layer(size_t index) const;

    const std::vector<BookkeepingEntry> &bookkeeping() const {
        return bookkeeping_;
    }
    const std::vector<size_t> &output_indices() const {
        return bookkeeping_.back().inputs;
    }

    // Index of the executable layer compiled from a symbolic layer
    size_t layer_index(symbolic::LayerId id) const;
    const ExecutableLayer &materialized_layer(symbolic::LayerId id) const {
        return layer(layer_index(id));
    }

    const Scope &scope() const { return symbolic_->scope(); }
    size_t num_variables() const { return symbolic_->num_variables(); }

    // Every distinct parameter expression, in layer order
    std::vector<ParameterPtr> parameters() const;

  private:
    symbolic::CircuitPtr symbolic_;
    std::vector<std::unique_ptr<ExecutableLayer>> layers_;
    std::vector<BookkeepingEntry> bookkeeping_;
    std::unordered_map<symbolic::LayerId, size_t> layer_map_;
};

using CompiledCircuitPtr = std::shared_ptr<const CompiledCircuit>;

} // namespace backend
} // namespace pcflow
