#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "pcflow/region_graph/region_graph.hpp"
#include "pcflow/scope.hpp"
#include "pcflow/symbolic/layers.hpp"

namespace pcflow {
namespace symbolic {

class SymbolicCircuit;
using CircuitPtr = std::shared_ptr<const SymbolicCircuit>;

// Records that a circuit was derived from other circuits by an operator
struct CircuitOperation {
    Operator op;
    std::vector<CircuitPtr> operands;
    nlohmann::json metadata = nlohmann::json::object();
};

struct CircuitOptions {
    size_t num_channels = 1;
    size_t num_input_units = 1;
    size_t num_sum_units = 1;
    size_t num_classes = 1;
};

// Parameterization of the sum-product blocks built for every partition
enum class SumProduct {
    CP,     // one dense layer per input, then a Hadamard product
    Tucker, // a Kronecker product, then one dense layer
};

// An immutable symbolic circuit.
//
// Layers live in an arena addressed by LayerId and are stored in a
// topological order: the inputs of a layer always have smaller ids.
// Structural operators never modify a circuit, they build a new one that
// refers to its operands through its CircuitOperation.
class SymbolicCircuit {
  public:
    // `layers` must already be topologically ordered, with `in_layers[i]`
    // listing the producers of layer i. Use from_layers() otherwise.
    SymbolicCircuit(std::vector<std::unique_ptr<SymbolicLayer>> layers,
                    std::vector<std::vector<LayerId>> in_layers,
                    std::optional<CircuitOperation> operation = std::nullopt);

    SymbolicCircuit(const SymbolicCircuit &) = delete;
    SymbolicCircuit &operator=(const SymbolicCircuit &) = delete;

    // Builds a circuit from layers in any order; throws LayerCycleError if
    // the edges have a cycle
    static CircuitPtr
    from_layers(std::vector<std::unique_ptr<SymbolicLayer>> layers,
                const std::vector<std::vector<LayerId>> &in_layers,
                std::optional<CircuitOperation> operation = std::nullopt);

    // One input layer and one sum layer per leaf region, one product
    // layer per partition and one sum (or mixing, if the region has
    // several partitions) layer per inner region.
    static CircuitPtr from_region_graph(const RegionGraph &rg,
                                        const InputLayerFactory &input_factory,
                                        const SumLayerFactory &sum_factory,
                                        const ProductLayerFactory &product_factory,
                                        const CircuitOptions &options = {});

    // Leaf regions get an input layer only and every partition becomes a
    // sum-product block; regions with several partitions mix the blocks.
    static CircuitPtr from_region_graph(const RegionGraph &rg,
                                        SumProduct sum_product,
                                        const InputLayerFactory &input_factory,
                                        const SumLayerFactory &mixing_factory,
                                        const CircuitOptions &options = {});

    size_t num_layers() const { return layers_.size(); }
    const SymbolicLayer &layer(LayerId id) const;

    const std::vector<LayerId> &layer_inputs(LayerId id) const;
    const std::vector<LayerId> &layer_outputs(LayerId id) const;

    // Ids of the layers whose kind is (a subkind of) T
    template <typename T> std::vector<LayerId> layers_of() const {
        std::vector<LayerId> ids;
        for (LayerId id = 0; id < layers_.size(); ++id) {
            if (is_subkind(layers_[id]->kind(), T::static_kind))
                ids.push_back(id);
        }
        return ids;
    }

    std::vector<LayerId> input_layers() const;
    std::vector<LayerId> sum_layers() const;
    std::vector<LayerId> product_layers() const;
    std::vector<LayerId> inner_layers() const;
    const std::vector<LayerId> &output_layers() const { return outputs_; }

    // Evaluation order of the layers reachable from the outputs
    std::vector<LayerId> topological_ordering() const;

    const Scope &scope() const { return scope_; }
    size_t num_variables() const { return scope_.size(); }

    const std::optional<CircuitOperation> &operation() const {
        return operation_;
    }

    // Sum inputs have the scope of the sum
    bool is_smooth() const;
    // Product inputs have disjoint scopes covering the product scope
    bool is_decomposable() const;

  private:
    std::vector<std::unique_ptr<SymbolicLayer>> layers_;
    std::vector<std::vector<LayerId>> in_layers_;
    std::vector<std::vector<LayerId>> out_layers_;
    std::vector<LayerId> outputs_;
    Scope scope_;
    std::optional<CircuitOperation> operation_;
};

// Orders the circuits reachable from `roots` through their operations so
// that every circuit comes after its operands. Throws PipelineCycleError.
std::vector<CircuitPtr>
pipeline_topological_ordering(const std::vector<CircuitPtr> &roots);

} // namespace symbolic
} // namespace pcflow
