#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "pcflow/symbolic/layers.hpp"

namespace pcflow {
namespace symbolic {

// A fragment of a circuit produced by an operator rule: a few layers, the
// edges among them and the layer standing for the whole fragment.
//
// Layers are addressed by their position in the block and must be added
// after their inputs. Layers without inputs in the block are its entry
// layers; when the block is spliced into a circuit they take as inputs
// the blocks produced for the inputs of the rewritten layer.
class CircuitBlock {
  public:
    CircuitBlock() = default;
    CircuitBlock(CircuitBlock &&) = default;
    CircuitBlock &operator=(CircuitBlock &&) = default;
    CircuitBlock(const CircuitBlock &) = delete;
    CircuitBlock &operator=(const CircuitBlock &) = delete;

    static CircuitBlock from_layer(std::unique_ptr<SymbolicLayer> layer);

    // Chain of layers, each feeding the next one
    static CircuitBlock
    from_layer_composition(std::vector<std::unique_ptr<SymbolicLayer>> layers);

    // Appends a layer and makes it the output of the block
    size_t add_layer(std::unique_ptr<SymbolicLayer> layer,
                     std::vector<size_t> inputs = {});

    size_t num_layers() const { return layers_.size(); }
    const SymbolicLayer &layer(size_t i) const { return *layers_.at(i); }
    SymbolicLayer &layer(size_t i) { return *layers_.at(i); }
    const std::vector<size_t> &layer_inputs(size_t i) const {
        return in_layers_.at(i);
    }

    size_t output() const { return output_; }
    std::vector<size_t> entry_layers() const;

    std::vector<std::unique_ptr<SymbolicLayer>> release_layers() {
        return std::move(layers_);
    }

  private:
    std::vector<std::unique_ptr<SymbolicLayer>> layers_;
    std::vector<std::vector<size_t>> in_layers_;
    size_t output_ = 0;
};

} // namespace symbolic
} // namespace pcflow
