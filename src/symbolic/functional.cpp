#include "pcflow/symbolic/functional.hpp"

#include "pcflow/debug.hpp"
#include "pcflow/error.hpp"

namespace pcflow {
namespace symbolic {

namespace {

// Rewrites the layers of the operand circuits position by position. All
// operands have the structure of the first one; the layers at position id
// are handed together to the rule for their kinds and the resulting block
// replaces them.
CircuitPtr rewrite_layerwise(Operator op, std::vector<CircuitPtr> operands,
                             const nlohmann::json &kwargs,
                             OperatorRegistry &registry,
                             trace::ScopedTrace &trace) {
    const SymbolicCircuit &ref = *operands.front();

    std::vector<std::unique_ptr<SymbolicLayer>> layers;
    std::vector<std::vector<LayerId>> in_layers;
    std::vector<LayerId> block_output(ref.num_layers());

    // Layer ids are a topological order
    for (LayerId id = 0; id < ref.num_layers(); ++id) {
        std::vector<const SymbolicLayer *> opds;
        for (const auto &sc : operands)
            opds.push_back(&sc->layer(id));

        RulePtr rule = registry.retrieve_rule(op, signature_of(opds));
        CircuitBlock block = (*rule)(opds, kwargs);
        if (block.num_layers() == 0)
            throw RuntimeError::internal("the " + to_string(op) +
                                         " rule for " + opds[0]->to_string() +
                                         " returned an empty block");

        std::vector<LayerId> preds;
        for (LayerId in : ref.layer_inputs(id))
            preds.push_back(block_output[in]);

        LayerId base = layers.size();
        for (size_t i = 0; i < block.num_layers(); ++i) {
            SymbolicLayer &layer = block.layer(i);
            std::vector<LayerId> ins;
            if (block.layer_inputs(i).empty()) {
                if (!layer.is_input())
                    ins = preds;
            } else {
                for (size_t in : block.layer_inputs(i))
                    ins.push_back(base + in);
            }
            in_layers.push_back(std::move(ins));

            nlohmann::json metadata = nlohmann::json::object();
            if (layer.operation() && layer.operation()->op == op)
                metadata = layer.operation()->metadata;
            layer.set_operation(LayerOperation{
                op, std::vector<LayerId>(operands.size(), id),
                std::move(metadata)});
        }
        block_output[id] = base + block.output();
        for (auto &layer : block.release_layers())
            layers.push_back(std::move(layer));
    }

    trace.set_num_layers(layers.size());
    return std::make_shared<SymbolicCircuit>(
        std::move(layers), std::move(in_layers),
        CircuitOperation{op, std::move(operands), kwargs});
}

void check_same_structure(const SymbolicCircuit &lhs,
                          const SymbolicCircuit &rhs) {
    if (lhs.num_layers() != rhs.num_layers())
        throw StructuralError::incompatible(
            "circuits with " + std::to_string(lhs.num_layers()) + " and " +
            std::to_string(rhs.num_layers()) + " layers");
    for (LayerId id = 0; id < lhs.num_layers(); ++id) {
        const SymbolicLayer &l = lhs.layer(id);
        const SymbolicLayer &r = rhs.layer(id);
        if (l.scope() != r.scope() ||
            lhs.layer_inputs(id) != rhs.layer_inputs(id))
            throw StructuralError::incompatible(
                "layer " + std::to_string(id) + " is " + l.to_string() +
                " on one side and " + r.to_string() + " on the other");
    }
}

} // namespace

CircuitPtr integrate(const CircuitPtr &sc, const std::optional<Scope> &scope,
                     OperatorRegistry &registry) {
    if (!sc)
        throw ValueError("cannot integrate a null circuit");
    trace::ScopedTrace trace("integrate");

    Scope integrated = scope ? *scope : sc->scope();
    if (integrated.empty())
        throw ValueError("cannot integrate over an empty scope");
    if (!integrated.is_subset_of(sc->scope()))
        throw ValueError::not_in_scope(integrated.to_string());
    trace.set_description(integrated.to_string());

    nlohmann::json kwargs = {{"scope", integrated.vars()}};
    return rewrite_layerwise(Operator::Integration, {sc}, kwargs, registry,
                             trace);
}

CircuitPtr differentiate(const CircuitPtr &sc, OperatorRegistry &registry) {
    if (!sc)
        throw ValueError("cannot differentiate a null circuit");
    trace::ScopedTrace trace("differentiate");
    return rewrite_layerwise(Operator::Differentiation, {sc},
                             nlohmann::json::object(), registry, trace);
}

CircuitPtr multiply(const CircuitPtr &lhs, const CircuitPtr &rhs,
                    OperatorRegistry &registry) {
    if (!lhs || !rhs)
        throw ValueError("cannot multiply a null circuit");
    trace::ScopedTrace trace("multiply");
    check_same_structure(*lhs, *rhs);
    return rewrite_layerwise(Operator::Multiplication, {lhs, rhs},
                             nlohmann::json::object(), registry, trace);
}

} // namespace symbolic
} // namespace pcflow
