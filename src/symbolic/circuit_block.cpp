#include "pcflow/symbolic/circuit_block.hpp"

#include "pcflow/error.hpp"

namespace pcflow {
namespace symbolic {

CircuitBlock CircuitBlock::from_layer(std::unique_ptr<SymbolicLayer> layer) {
    CircuitBlock block;
    block.add_layer(std::move(layer));
    return block;
}

CircuitBlock CircuitBlock::from_layer_composition(
    std::vector<std::unique_ptr<SymbolicLayer>> layers) {
    if (layers.empty())
        throw ValueError("a circuit block needs at least one layer");
    CircuitBlock block;
    for (auto &layer : layers) {
        if (block.num_layers() == 0)
            block.add_layer(std::move(layer));
        else
            block.add_layer(std::move(layer), {block.output()});
    }
    return block;
}

size_t CircuitBlock::add_layer(std::unique_ptr<SymbolicLayer> layer,
                               std::vector<size_t> inputs) {
    if (!layer)
        throw ValueError("cannot add a null layer to a circuit block");
    size_t id = layers_.size();
    for (size_t in : inputs) {
        if (in >= id)
            throw ValueError("circuit block layers must be added after "
                             "their inputs");
    }
    layers_.push_back(std::move(layer));
    in_layers_.push_back(std::move(inputs));
    output_ = id;
    return id;
}

std::vector<size_t> CircuitBlock::entry_layers() const {
    std::vector<size_t> entries;
    for (size_t i = 0; i < layers_.size(); ++i) {
        if (in_layers_[i].empty())
            entries.push_back(i);
    }
    return entries;
}

} // namespace symbolic
} // namespace pcflow
