#include "pcflow/backend/compiled_circuit.hpp"

#include <unordered_set>

#include "pcflow/error.hpp"

namespace pcflow {
namespace backend {

CompiledCircuit::CompiledCircuit(
    symbolic::CircuitPtr symbolic,
    std::vector<std::unique_ptr<ExecutableLayer>> layers,
    std::vector<BookkeepingEntry> bookkeeping,
    std::unordered_map<symbolic::LayerId, size_t> layer_map)
    : symbolic_(std::move(symbolic)), layers_(std::move(layers)),
      bookkeeping_(std::move(bookkeeping)), layer_map_(std::move(layer_map)) {
    if (!symbolic_)
        throw ValueError("a compiled circuit needs its symbolic circuit");
    if (bookkeeping_.size() != layers_.size() + 1)
        throw RuntimeError::internal(
            "expected " + std::to_string(layers_.size() + 1) +
            " bookkeeping entries but got " +
            std::to_string(bookkeeping_.size()));
}

const ExecutableLayer &CompiledCircuit::layer(size_t index) const {
    if (index >= layers_.size())
        throw ValueError("no compiled layer with index " +
                         std::to_string(index));
    return *layers_[index];
}

size_t CompiledCircuit::layer_index(symbolic::LayerId id) const {
    auto it = layer_map_.find(id);
    if (it == layer_map_.end())
        throw ValueError("symbolic layer " + std::to_string(id) +
                         " was not compiled");
    return it->second;
}

std::vector<ParameterPtr> CompiledCircuit::parameters() const {
    std::vector<ParameterPtr> result;
    std::unordered_set<const symbolic::AbstractParameter *> seen;
    for (const auto &layer : layers_) {
        for (const auto &param : layer->parameters()) {
            if (seen.insert(param.get()).second)
                result.push_back(param);
        }
    }
    return result;
}

} // namespace backend
} // namespace pcflow
