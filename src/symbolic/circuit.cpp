#include "pcflow/symbolic/circuit.hpp"

#include <unordered_map>

#include "pcflow/debug.hpp"
#include "pcflow/error.hpp"
#include "pcflow/graph/topological.hpp"

namespace pcflow {
namespace symbolic {

namespace {

// Layers and edges accumulated while walking a region graph
struct LayerArena {
    std::vector<std::unique_ptr<SymbolicLayer>> layers;
    std::vector<std::vector<LayerId>> in_layers;

    template <typename L>
    LayerId emit(std::unique_ptr<L> layer, std::vector<LayerId> inputs) {
        if (!layer)
            throw ValueError("a layer factory returned no layer");
        layers.push_back(std::move(layer));
        in_layers.push_back(std::move(inputs));
        return layers.size() - 1;
    }

    size_t units(LayerId id) const { return layers[id]->num_units(); }
};

std::vector<LayerId> map_inputs(const RGNode &node,
                                const std::unordered_map<NodeId, LayerId> &m) {
    std::vector<LayerId> ids;
    ids.reserve(node.inputs.size());
    for (NodeId in : node.inputs)
        ids.push_back(m.at(in));
    return ids;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

SymbolicCircuit::SymbolicCircuit(
    std::vector<std::unique_ptr<SymbolicLayer>> layers,
    std::vector<std::vector<LayerId>> in_layers,
    std::optional<CircuitOperation> operation)
    : layers_(std::move(layers)), in_layers_(std::move(in_layers)),
      operation_(std::move(operation)) {
    if (layers_.empty())
        throw ValueError("a symbolic circuit needs at least one layer");
    if (in_layers_.size() != layers_.size())
        throw ValueError("expected the inputs of " +
                         std::to_string(layers_.size()) + " layers but got " +
                         std::to_string(in_layers_.size()));

    out_layers_.resize(layers_.size());
    for (LayerId id = 0; id < layers_.size(); ++id) {
        if (!layers_[id])
            throw ValueError("a symbolic circuit cannot hold a null layer");
        for (LayerId in : in_layers_[id]) {
            if (in >= id)
                throw ValueError("the layers of a symbolic circuit must be "
                                 "in topological order");
            out_layers_[in].push_back(id);
        }
    }
    for (LayerId id = 0; id < layers_.size(); ++id) {
        if (out_layers_[id].empty()) {
            outputs_.push_back(id);
            scope_ = scope_ | layers_[id]->scope();
        }
    }
}

CircuitPtr SymbolicCircuit::from_layers(
    std::vector<std::unique_ptr<SymbolicLayer>> layers,
    const std::vector<std::vector<LayerId>> &in_layers,
    std::optional<CircuitOperation> operation) {
    size_t n = layers.size();
    if (in_layers.size() != n)
        throw ValueError("expected the inputs of " + std::to_string(n) +
                         " layers but got " + std::to_string(in_layers.size()));

    std::vector<bool> has_outputs(n, false);
    for (const auto &ins : in_layers) {
        for (LayerId in : ins) {
            if (in >= n)
                throw ValueError("no layer with id " + std::to_string(in));
            has_outputs[in] = true;
        }
    }
    std::vector<LayerId> roots;
    for (LayerId id = 0; id < n; ++id) {
        if (!has_outputs[id])
            roots.push_back(id);
    }

    auto ordering = graph::topological_ordering<LayerId>(
        roots, [&](LayerId id) -> const std::vector<LayerId> & {
            return in_layers[id];
        });
    // Layers sitting on a cycle are never reached from the outputs
    if (!ordering || ordering->size() != n)
        throw LayerCycleError();

    std::vector<LayerId> new_id(n);
    for (size_t pos = 0; pos < n; ++pos)
        new_id[(*ordering)[pos]] = pos;

    std::vector<std::unique_ptr<SymbolicLayer>> sorted_layers;
    std::vector<std::vector<LayerId>> sorted_in_layers;
    sorted_layers.reserve(n);
    sorted_in_layers.reserve(n);
    for (LayerId old_id : *ordering) {
        sorted_layers.push_back(std::move(layers[old_id]));
        std::vector<LayerId> ins;
        for (LayerId in : in_layers[old_id])
            ins.push_back(new_id[in]);
        sorted_in_layers.push_back(std::move(ins));
    }
    return std::make_shared<SymbolicCircuit>(
        std::move(sorted_layers), std::move(sorted_in_layers),
        std::move(operation));
}

CircuitPtr SymbolicCircuit::from_region_graph(
    const RegionGraph &rg, const InputLayerFactory &input_factory,
    const SumLayerFactory &sum_factory,
    const ProductLayerFactory &product_factory, const CircuitOptions &options) {
    trace::ScopedTrace trace("from_region_graph", "sum-product");

    LayerArena arena;
    std::unordered_map<NodeId, LayerId> rgn_to_layer;

    // Region graph nodes are already in topological order
    for (NodeId id : rg.nodes()) {
        const RGNode &rgn = rg.node(id);
        size_t num_units =
            rg.is_output(id) ? options.num_classes : options.num_sum_units;
        if (rgn.is_region() && rgn.inputs.empty()) {
            LayerId in = arena.emit(input_factory(rgn.scope,
                                                  options.num_input_units,
                                                  options.num_channels),
                                    {});
            rgn_to_layer[id] =
                arena.emit(sum_factory(rgn.scope, num_units, 1), {in});
        } else if (rgn.is_partition()) {
            std::vector<LayerId> ins = map_inputs(rgn, rgn_to_layer);
            size_t num_input_units = arena.units(ins.front());
            size_t arity = ins.size();
            rgn_to_layer[id] = arena.emit(
                product_factory(rgn.scope, num_input_units, arity),
                std::move(ins));
        } else {
            std::vector<LayerId> ins = map_inputs(rgn, rgn_to_layer);
            if (ins.size() == 1) {
                rgn_to_layer[id] = arena.emit(
                    sum_factory(rgn.scope, num_units, 1), std::move(ins));
            } else {
                // Several decompositions of the same scope
                size_t arity = ins.size();
                rgn_to_layer[id] = arena.emit(
                    std::make_unique<MixingLayer>(rgn.scope, num_units, arity),
                    std::move(ins));
            }
        }
    }

    trace.set_num_layers(arena.layers.size());
    return std::make_shared<SymbolicCircuit>(std::move(arena.layers),
                                             std::move(arena.in_layers));
}

CircuitPtr SymbolicCircuit::from_region_graph(
    const RegionGraph &rg, SumProduct sum_product,
    const InputLayerFactory &input_factory,
    const SumLayerFactory &mixing_factory, const CircuitOptions &options) {
    trace::ScopedTrace trace("from_region_graph",
                             sum_product == SumProduct::CP ? "cp" : "tucker");

    LayerArena arena;
    std::unordered_map<NodeId, LayerId> rgn_to_layer;

    for (NodeId id : rg.nodes()) {
        const RGNode &rgn = rg.node(id);
        if (rgn.is_region() && rgn.inputs.empty()) {
            rgn_to_layer[id] = arena.emit(input_factory(rgn.scope,
                                                        options.num_input_units,
                                                        options.num_channels),
                                          {});
        } else if (rgn.is_partition()) {
            NodeId region = rgn.outputs.front();
            size_t num_units = rg.is_output(region) ? options.num_classes
                                                    : options.num_sum_units;
            std::vector<LayerId> ins = map_inputs(rgn, rgn_to_layer);
            size_t arity = ins.size();
            if (sum_product == SumProduct::CP) {
                std::vector<LayerId> dense;
                for (LayerId in : ins) {
                    dense.push_back(arena.emit(
                        std::make_unique<DenseLayer>(
                            arena.layers[in]->scope(), num_units),
                        {in}));
                }
                rgn_to_layer[id] = arena.emit(
                    std::make_unique<HadamardLayer>(rgn.scope, num_units,
                                                    arity),
                    std::move(dense));
            } else {
                size_t width = arena.units(ins.front());
                for (LayerId in : ins) {
                    if (arena.units(in) != width)
                        throw StructuralError(
                            "Tucker products need inputs with the same "
                            "number of units, got " +
                            std::to_string(width) + " and " +
                            std::to_string(arena.units(in)) + " over " +
                            rgn.scope.to_string());
                }
                LayerId kron = arena.emit(
                    std::make_unique<KroneckerLayer>(rgn.scope, width, arity),
                    std::move(ins));
                rgn_to_layer[id] = arena.emit(
                    std::make_unique<DenseLayer>(rgn.scope, num_units),
                    {kron});
            }
        } else {
            std::vector<LayerId> ins = map_inputs(rgn, rgn_to_layer);
            if (ins.size() == 1) {
                rgn_to_layer[id] = ins.front();
            } else {
                size_t num_units = rg.is_output(id) ? options.num_classes
                                                    : options.num_sum_units;
                size_t arity = ins.size();
                rgn_to_layer[id] = arena.emit(
                    mixing_factory(rgn.scope, num_units, arity),
                    std::move(ins));
            }
        }
    }

    trace.set_num_layers(arena.layers.size());
    return std::make_shared<SymbolicCircuit>(std::move(arena.layers),
                                             std::move(arena.in_layers));
}

// ============================================================================
// Queries
// ============================================================================

const SymbolicLayer &SymbolicCircuit::layer(LayerId id) const {
    if (id >= layers_.size())
        throw ValueError("no layer with id " + std::to_string(id));
    return *layers_[id];
}

const std::vector<LayerId> &SymbolicCircuit::layer_inputs(LayerId id) const {
    if (id >= layers_.size())
        throw ValueError("no layer with id " + std::to_string(id));
    return in_layers_[id];
}

const std::vector<LayerId> &SymbolicCircuit::layer_outputs(LayerId id) const {
    if (id >= layers_.size())
        throw ValueError("no layer with id " + std::to_string(id));
    return out_layers_[id];
}

std::vector<LayerId> SymbolicCircuit::input_layers() const {
    return layers_of<InputLayer>();
}

std::vector<LayerId> SymbolicCircuit::sum_layers() const {
    return layers_of<SumLayer>();
}

std::vector<LayerId> SymbolicCircuit::product_layers() const {
    return layers_of<ProductLayer>();
}

std::vector<LayerId> SymbolicCircuit::inner_layers() const {
    std::vector<LayerId> ids;
    for (LayerId id = 0; id < layers_.size(); ++id) {
        if (!in_layers_[id].empty())
            ids.push_back(id);
    }
    return ids;
}

std::vector<LayerId> SymbolicCircuit::topological_ordering() const {
    auto ordering = graph::topological_ordering<LayerId>(
        outputs_, [this](LayerId id) -> const std::vector<LayerId> & {
            return in_layers_[id];
        });
    if (!ordering)
        throw LayerCycleError();
    return *ordering;
}

bool SymbolicCircuit::is_smooth() const {
    for (LayerId id : sum_layers()) {
        for (LayerId in : in_layers_[id]) {
            if (layers_[in]->scope() != layers_[id]->scope())
                return false;
        }
    }
    return true;
}

bool SymbolicCircuit::is_decomposable() const {
    for (LayerId id : product_layers()) {
        Scope covered;
        for (LayerId in : in_layers_[id]) {
            const Scope &s = layers_[in]->scope();
            if (!covered.is_disjoint(s))
                return false;
            covered = covered | s;
        }
        if (covered != layers_[id]->scope())
            return false;
    }
    return true;
}

// ============================================================================
// Pipelines
// ============================================================================

std::vector<CircuitPtr>
pipeline_topological_ordering(const std::vector<CircuitPtr> &roots) {
    std::unordered_map<const SymbolicCircuit *, CircuitPtr> handles;
    std::vector<const SymbolicCircuit *> root_ptrs;
    for (const auto &root : roots) {
        if (!root)
            throw ValueError("a pipeline cannot contain a null circuit");
        handles.emplace(root.get(), root);
        root_ptrs.push_back(root.get());
    }

    auto ordering = graph::topological_ordering<const SymbolicCircuit *>(
        root_ptrs, [&](const SymbolicCircuit *sc) {
            std::vector<const SymbolicCircuit *> operands;
            if (sc->operation()) {
                for (const auto &opd : sc->operation()->operands) {
                    handles.emplace(opd.get(), opd);
                    operands.push_back(opd.get());
                }
            }
            return operands;
        });
    if (!ordering)
        throw PipelineCycleError();

    std::vector<CircuitPtr> out;
    out.reserve(ordering->size());
    for (const SymbolicCircuit *sc : *ordering)
        out.push_back(handles.at(sc));
    return out;
}

} // namespace symbolic
} // namespace pcflow
