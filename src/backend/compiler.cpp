#include "pcflow/backend/compiler.hpp"

#include <algorithm>
#include <utility>

#include "pcflow/backend/pipeline.hpp"
#include "pcflow/config.hpp"
#include "pcflow/debug.hpp"
#include "pcflow/error.hpp"

namespace pcflow {
namespace backend {

using symbolic::CircuitPtr;
using symbolic::LayerId;
using symbolic::LayerKind;
using symbolic::LayerOperation;
using symbolic::Operator;
using symbolic::SymbolicCircuit;
using symbolic::SymbolicLayer;

namespace {

// ============================================================================
// Provenance lookups
// ============================================================================

// The operand circuit and layer id that operand `i` of `sl`'s operation
// refers to
std::pair<const SymbolicCircuit *, LayerId>
operand_ref(const SymbolicCircuit &sc, const SymbolicLayer &sl, size_t i) {
    const auto &circuit_op = sc.operation();
    if (!circuit_op)
        throw RuntimeError::internal(sl.to_string() +
                                     " has an operation but its circuit "
                                     "was not derived by an operator");
    const LayerOperation &layer_op = *sl.operation();
    if (i >= layer_op.operands.size() || i >= circuit_op->operands.size())
        throw RuntimeError::internal("operand " + std::to_string(i) +
                                     " of " + sl.to_string() +
                                     " does not exist");
    return {circuit_op->operands[i].get(), layer_op.operands[i]};
}

const ExecutableLayer &operand_layer(const SymbolicCircuit &sc,
                                     const SymbolicLayer &sl, size_t i,
                                     const PipelineContext &ctx) {
    auto [circuit, id] = operand_ref(sc, sl, i);
    return ctx.get_materialized_layer(*circuit, id);
}

const SymbolicLayer &operand_symbolic_layer(const SymbolicCircuit &sc,
                                            const SymbolicLayer &sl,
                                            size_t i) {
    auto [circuit, id] = operand_ref(sc, sl, i);
    return circuit->layer(id);
}

bool is_integrated(const ExecutableLayer &layer) {
    return layer.config().contains("integrated");
}

// Reuses the parameter objects (and their reparameterization) of `src`
void share_parameters(LayerArgs &args, const ExecutableLayer &src) {
    args.reparam = src.reparam();
    for (const auto &[name, param] : src.named_parameters())
        args.parameters[name] = param;
}

ParameterPtr zeros_like(const ParameterPtr &param) {
    return std::make_shared<symbolic::ConstantParameter>(param->shape(), 0.0);
}

// ============================================================================
// Parameters of products of input layers
// ============================================================================

void multiply_categorical(LayerArgs &args, const ExecutableLayer &lhs,
                          const ExecutableLayer &rhs) {
    // (D, K1, C, cats) x (D, K2, C, cats) -> (D, K1 * K2, C, cats)
    args.reparam = lhs.reparam();
    args.parameters["probs"] = std::make_shared<symbolic::OuterProductParameter>(
        lhs.parameter("probs"), rhs.parameter("probs"), 1);
}

void multiply_gaussian(LayerArgs &args, const ExecutableLayer &lhs,
                       const ExecutableLayer &rhs) {
    std::vector<ParameterPtr> means = {lhs.parameter("mean"),
                                       rhs.parameter("mean")};
    std::vector<ParameterPtr> stddevs = {lhs.parameter("stddev"),
                                         rhs.parameter("stddev")};
    args.reparam = lhs.reparam();
    args.parameters["mean"] =
        std::make_shared<symbolic::MeanGaussianProduct>(means, stddevs);
    args.parameters["stddev"] =
        std::make_shared<symbolic::StddevGaussianProduct>(stddevs);

    ParameterPtr log_partition =
        std::make_shared<symbolic::LogPartitionGaussianProduct>(means,
                                                                stddevs);
    // Operands that are products themselves carry their own normalizer
    if (lhs.has_parameter("log_partition") ||
        rhs.has_parameter("log_partition")) {
        auto lhs_lp = lhs.has_parameter("log_partition")
                          ? lhs.parameter("log_partition")
                          : zeros_like(lhs.parameter("mean"));
        auto rhs_lp = rhs.has_parameter("log_partition")
                          ? rhs.parameter("log_partition")
                          : zeros_like(rhs.parameter("mean"));
        auto inherited =
            std::make_shared<symbolic::OuterSumParameter>(lhs_lp, rhs_lp, 1);
        log_partition = std::make_shared<symbolic::EntrywiseSumParameter>(
            std::vector<ParameterPtr>{log_partition, inherited});
    }
    args.parameters["log_partition"] = log_partition;
}

// ============================================================================
// Parameters of products of dense layers
// ============================================================================

// A Kronecker layer over r inputs of a units enumerates (i1, ..., ir) in
// row-major order. The product of two such layers takes inputs of a * b
// units indexed (i, j), so it enumerates (i1, j1, ..., ir, jr), while the
// Kronecker product of the dense weights orders its columns as
// (i1, ..., ir, j1, ..., jr). Permute the columns to match.
ParameterPtr interleave_kronecker_columns(const ParameterPtr &weight,
                                          const symbolic::KroneckerLayer &lhs,
                                          const symbolic::KroneckerLayer &rhs) {
    size_t r = lhs.arity();
    if (r < 2)
        return weight;
    size_t a = lhs.num_input_units();
    size_t b = rhs.num_input_units();
    size_t rows = weight->shape()[0];

    Shape split{rows};
    split.insert(split.end(), r, a);
    split.insert(split.end(), r, b);
    std::vector<size_t> axes{0};
    for (size_t k = 0; k < r; ++k) {
        axes.push_back(1 + k);
        axes.push_back(1 + r + k);
    }
    size_t cols = 1;
    for (size_t k = 0; k < r; ++k)
        cols *= a * b;

    auto reshaped = std::make_shared<symbolic::ReshapeParameter>(weight, split);
    auto permuted =
        std::make_shared<symbolic::PermuteParameter>(reshaped, axes);
    return std::make_shared<symbolic::ReshapeParameter>(permuted,
                                                        Shape{rows, cols});
}

// ============================================================================
// Layer lowering
// ============================================================================

std::unique_ptr<ExecutableLayer>
compile_input_layer(const SymbolicCircuit &sc, const SymbolicLayer &sl,
                    const ReparamPtr &reparam, const PipelineContext &ctx) {
    const auto &input = *symbolic::layer_cast<symbolic::InputLayer>(sl);

    LayerArgs args;
    args.num_input_units = input.num_channels();
    args.num_output_units = input.num_units();
    args.arity = input.scope().size();
    args.reparam = reparam;
    args.kwargs = input.config();

    if (const auto &op = input.operation()) {
        args.operation = op->op;
        switch (op->op) {
        case Operator::Integration: {
            const ExecutableLayer &src = operand_layer(sc, input, 0, ctx);
            share_parameters(args, src);
            Scope integrated(
                op->metadata.value("scope", input.scope().vars()));
            nlohmann::json src_cfg = src.config();
            if (src_cfg.contains("integrated"))
                integrated = integrated |
                             Scope(src_cfg["integrated"]
                                       .get<std::vector<size_t>>());
            args.kwargs["integrated"] = integrated.vars();
            break;
        }
        case Operator::Differentiation: {
            const ExecutableLayer &src = operand_layer(sc, input, 0, ctx);
            share_parameters(args, src);
            nlohmann::json src_cfg = src.config();
            if (src_cfg.contains("integrated"))
                args.kwargs["integrated"] = src_cfg["integrated"];
            break;
        }
        case Operator::Multiplication: {
            const ExecutableLayer &lhs = operand_layer(sc, input, 0, ctx);
            const ExecutableLayer &rhs = operand_layer(sc, input, 1, ctx);
            // The integral of a product is not the product of integrals
            if (is_integrated(lhs) || is_integrated(rhs))
                throw RuntimeError::not_implemented(
                    "compiling products of integrated input layers");
            switch (input.kind()) {
            case LayerKind::Categorical:
                multiply_categorical(args, lhs, rhs);
                break;
            case LayerKind::Gaussian:
                multiply_gaussian(args, lhs, rhs);
                break;
            case LayerKind::Constant:
                break; // the product value is part of the symbolic layer
            default:
                throw RuntimeError::not_implemented(
                    "compiling products of " +
                    symbolic::to_string(input.kind()));
            }
            break;
        }
        }
    }
    return ctx.layer_registry().construct(input.kind(), args);
}

std::unique_ptr<ExecutableLayer>
compile_inner_layer(const SymbolicCircuit &sc, LayerId id,
                    const ReparamPtr &reparam, const PipelineContext &ctx) {
    const SymbolicLayer &sl = sc.layer(id);
    const auto &inputs = sc.layer_inputs(id);
    if (inputs.empty())
        throw RuntimeError::internal(sl.to_string() + " has no inputs");

    if (sl.is_product() && sl.arity() > config::max_partition_arity())
        throw StructuralError(
            sl.to_string() + " has arity " + std::to_string(sl.arity()) +
            " but compiled product layers accept at most " +
            std::to_string(config::max_partition_arity()) + " inputs");

    LayerArgs args;
    args.num_input_units = sc.layer(inputs.front()).num_units();
    args.num_output_units = sl.num_units();
    args.arity = sl.arity();
    args.reparam = reparam;
    args.kwargs = sl.config();

    // Only dense layers own parameters; the others are rebuilt as is
    const auto &op = sl.operation();
    if (op)
        args.operation = op->op;
    if (op && sl.kind() == LayerKind::Dense) {
        switch (op->op) {
        case Operator::Integration:
        case Operator::Differentiation:
            share_parameters(args, operand_layer(sc, sl, 0, ctx));
            break;
        case Operator::Multiplication: {
            if (sl.arity() != 1)
                throw RuntimeError::not_implemented(
                    "compiling products of dense layers with several inputs");
            const ExecutableLayer &lhs = operand_layer(sc, sl, 0, ctx);
            const ExecutableLayer &rhs = operand_layer(sc, sl, 1, ctx);
            args.reparam = lhs.reparam();
            ParameterPtr weight =
                std::make_shared<symbolic::KroneckerParameter>(
                    lhs.parameter("weight"), rhs.parameter("weight"));
            const SymbolicLayer &in = sc.layer(inputs.front());
            if (in.kind() == LayerKind::Kronecker && in.operation() &&
                in.operation()->op == Operator::Multiplication) {
                const auto *lk = symbolic::layer_cast<symbolic::KroneckerLayer>(
                    operand_symbolic_layer(sc, in, 0));
                const auto *rk = symbolic::layer_cast<symbolic::KroneckerLayer>(
                    operand_symbolic_layer(sc, in, 1));
                if (!lk || !rk)
                    throw RuntimeError::internal(
                        in.to_string() +
                        " is a product of non-Kronecker layers");
                weight = interleave_kronecker_columns(weight, *lk, *rk);
            }
            args.parameters["weight"] = weight;
            break;
        }
        }
    }
    return ctx.layer_registry().construct(sl.kind(), args);
}

} // namespace

// ============================================================================
// Compiler entry points
// ============================================================================

CompiledCircuitPtr compile_circuit(const CircuitPtr &sc,
                                   const ReparamPtr &reparam,
                                   PipelineContext &ctx) {
    if (!sc)
        throw ValueError("cannot compile a null circuit");
    if (ctx.contains(*sc))
        return ctx.get_compiled_circuit(*sc);

    trace::ScopedTrace trace("compile_circuit");
    if (const auto &op = sc->operation())
        trace.set_description(symbolic::to_string(op->op));

    std::vector<std::unique_ptr<ExecutableLayer>> layers;
    std::vector<BookkeepingEntry> bookkeeping;
    std::unordered_map<LayerId, size_t> layer_map;

    for (LayerId id : sc->topological_ordering()) {
        const SymbolicLayer &sl = sc->layer(id);
        if (sl.is_input()) {
            layers.push_back(compile_input_layer(*sc, sl, reparam, ctx));
            bookkeeping.push_back({{}, sl.scope().vars()});
        } else {
            std::vector<size_t> inputs;
            for (LayerId in : sc->layer_inputs(id)) {
                auto it = layer_map.find(in);
                if (it == layer_map.end())
                    throw RuntimeError::internal(
                        "layer " + std::to_string(in) +
                        " is used before being compiled");
                inputs.push_back(it->second);
            }
            layers.push_back(compile_inner_layer(*sc, id, reparam, ctx));
            bookkeeping.push_back({std::move(inputs), std::nullopt});
        }
        layer_map.emplace(id, layers.size() - 1);
    }

    std::vector<size_t> outputs;
    for (LayerId out : sc->output_layers()) {
        auto it = layer_map.find(out);
        if (it == layer_map.end())
            throw RuntimeError::internal("output layer " +
                                         std::to_string(out) +
                                         " was not compiled");
        outputs.push_back(it->second);
    }
    bookkeeping.push_back({std::move(outputs), std::nullopt});

    trace.set_num_layers(layers.size());
    auto cc = std::make_shared<CompiledCircuit>(sc, std::move(layers),
                                                std::move(bookkeeping),
                                                std::move(layer_map));
    ctx.register_materialized_circuit(cc);
    return cc;
}

void compile_pipeline(const std::vector<CircuitPtr> &roots,
                      const ReparamPtr &reparam, PipelineContext &ctx) {
    trace::ScopedTrace trace("compile_pipeline");
    size_t num_layers = 0;
    for (const auto &sc : symbolic::pipeline_topological_ordering(roots)) {
        if (ctx.contains(*sc))
            continue;
        num_layers += compile_circuit(sc, reparam, ctx)->num_layers();
    }
    trace.set_num_layers(num_layers);
}

PipelineContext compile_pipeline(const std::vector<CircuitPtr> &roots,
                                 const ReparamPtr &reparam) {
    PipelineContext ctx(reparam);
    compile_pipeline(roots, reparam, ctx);
    return ctx;
}

} // namespace backend
} // namespace pcflow
