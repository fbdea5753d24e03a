#include "pcflow/backend/layers.hpp"

#include <algorithm>

#include "pcflow/error.hpp"

namespace pcflow {
namespace backend {

using symbolic::LayerKind;

// ============================================================================
// ExecutableLayer
// ============================================================================

ExecutableLayer::ExecutableLayer(const LayerArgs &args,
                                 ReparamPtr default_reparam)
    : num_input_units_(args.num_input_units),
      num_output_units_(args.num_output_units), arity_(args.arity),
      reparam_(args.reparam ? args.reparam : std::move(default_reparam)),
      operation_(args.operation) {
    if (num_input_units_ == 0 || num_output_units_ == 0 || arity_ == 0)
        throw ValueError("layer units and arity must be positive");
}

std::vector<std::pair<std::string, ParameterPtr>>
ExecutableLayer::named_parameters(const std::string &prefix) const {
    std::vector<std::pair<std::string, ParameterPtr>> result;
    for (const auto &[name, param] : params_)
        result.emplace_back(prefix + name, param);
    return result;
}

std::vector<ParameterPtr> ExecutableLayer::parameters() const {
    std::vector<ParameterPtr> result;
    for (const auto &[name, param] : params_)
        result.push_back(param);
    return result;
}

bool ExecutableLayer::has_parameter(const std::string &name) const {
    return std::any_of(params_.begin(), params_.end(),
                       [&](const auto &p) { return p.first == name; });
}

const ParameterPtr &ExecutableLayer::parameter(const std::string &name) const {
    for (const auto &[pname, param] : params_) {
        if (pname == name)
            return param;
    }
    throw ValueError(this->name() + " has no parameter '" + name + "'");
}

nlohmann::json ExecutableLayer::config() const {
    nlohmann::json cfg = {{"num_input_units", num_input_units_},
                          {"num_output_units", num_output_units_},
                          {"arity", arity_}};
    if (reparam_)
        cfg["reparam"] = reparam_->config();
    if (operation_)
        cfg["operation"] = symbolic::to_string(*operation_);
    return cfg;
}

void ExecutableLayer::register_parameter(const std::string &name,
                                         ParameterPtr param) {
    if (!param)
        throw ValueError("cannot register a null parameter '" + name + "'");
    params_.emplace_back(name, std::move(param));
}

ParameterPtr ExecutableLayer::resolve_parameter(
    const LayerArgs &args, const std::string &name, const Shape &shape,
    const Reparameterization &reparam) const {
    auto it = args.parameters.find(name);
    if (it == args.parameters.end())
        return reparam.parameterize(shape);
    if (!it->second)
        throw ValueError("parameter '" + name + "' of " + this->name() +
                         " is null");
    if (it->second->shape() != shape)
        throw ShapeError::mismatch(shape, it->second->shape());
    return it->second;
}

// ============================================================================
// Input layers
// ============================================================================

InputLayer::InputLayer(const LayerArgs &args, ReparamPtr default_reparam)
    : ExecutableLayer(args, std::move(default_reparam)) {
    if (args.kwargs.contains("integrated"))
        integrated_vars_ =
            args.kwargs["integrated"].get<std::vector<size_t>>();
}

nlohmann::json InputLayer::config() const {
    nlohmann::json cfg = ExecutableLayer::config();
    if (!integrated_vars_.empty())
        cfg["integrated"] = integrated_vars_;
    return cfg;
}

CategoricalLayer::CategoricalLayer(const LayerArgs &args)
    : InputLayer(args, std::make_shared<SoftmaxReparameterization>(-1)),
      num_categories_(args.kwargs.value("num_categories", size_t{2})) {
    Shape shape{num_variables(), num_output_units(), num_channels(),
                num_categories_};
    register_parameter("probs",
                       resolve_parameter(args, "probs", shape, *reparam()));
}

nlohmann::json CategoricalLayer::config() const {
    nlohmann::json cfg = InputLayer::config();
    cfg["num_categories"] = num_categories_;
    return cfg;
}

GaussianLayer::GaussianLayer(const LayerArgs &args)
    : InputLayer(args, std::make_shared<LeafReparameterization>()) {
    Shape shape{num_variables(), num_output_units(), num_channels()};
    register_parameter("mean",
                       resolve_parameter(args, "mean", shape, *reparam()));
    register_parameter("stddev",
                       resolve_parameter(args, "stddev", shape,
                                         SoftplusReparameterization()));
    if (args.parameters.count("log_partition"))
        register_parameter("log_partition",
                           resolve_parameter(args, "log_partition", shape,
                                             LeafReparameterization()));
}

ConstantLayer::ConstantLayer(const LayerArgs &args)
    : InputLayer(args, nullptr), value_(args.kwargs.value("value", 0.0)) {}

nlohmann::json ConstantLayer::config() const {
    nlohmann::json cfg = InputLayer::config();
    cfg["value"] = value_;
    return cfg;
}

// ============================================================================
// Inner layers
// ============================================================================

DenseLayer::DenseLayer(const LayerArgs &args)
    : ExecutableLayer(args, std::make_shared<SoftmaxReparameterization>(-1)) {
    Shape shape{num_output_units(), arity() * num_input_units()};
    register_parameter("weight",
                       resolve_parameter(args, "weight", shape, *reparam()));
}

MixingLayer::MixingLayer(const LayerArgs &args)
    : ExecutableLayer(args, nullptr) {
    if (arity() < 2)
        throw ValueError("a mixing layer needs at least two inputs");
}

HadamardLayer::HadamardLayer(const LayerArgs &args)
    : ExecutableLayer(args, nullptr) {}

KroneckerLayer::KroneckerLayer(const LayerArgs &args)
    : ExecutableLayer(args, nullptr) {}

// ============================================================================
// ExecutableLayerRegistry
// ============================================================================

namespace {

template <typename L> LayerConstructor make_ctor() {
    return [](const LayerArgs &args) -> std::unique_ptr<ExecutableLayer> {
        return std::make_unique<L>(args);
    };
}

} // namespace

ExecutableLayerRegistry::ExecutableLayerRegistry() {
    ctors_[LayerKind::Categorical] = make_ctor<CategoricalLayer>();
    ctors_[LayerKind::Gaussian] = make_ctor<GaussianLayer>();
    ctors_[LayerKind::Constant] = make_ctor<ConstantLayer>();
    ctors_[LayerKind::Dense] = make_ctor<DenseLayer>();
    ctors_[LayerKind::Mixing] = make_ctor<MixingLayer>();
    ctors_[LayerKind::Hadamard] = make_ctor<HadamardLayer>();
    ctors_[LayerKind::Kronecker] = make_ctor<KroneckerLayer>();
}

bool ExecutableLayerRegistry::has_layer(LayerKind kind) const {
    return ctors_.count(kind) != 0;
}

void ExecutableLayerRegistry::register_layer(LayerKind kind,
                                             LayerConstructor ctor) {
    if (symbolic::is_abstract(kind))
        throw ValueError("cannot register an executable layer for the "
                         "abstract kind " +
                         symbolic::to_string(kind));
    if (!ctor)
        throw ValueError("empty layer constructor for " +
                         symbolic::to_string(kind));
    ctors_[kind] = std::move(ctor);
}

std::unique_ptr<ExecutableLayer>
ExecutableLayerRegistry::construct(LayerKind kind,
                                   const LayerArgs &args) const {
    auto it = ctors_.find(kind);
    if (it == ctors_.end())
        throw StructuralError::unsupported_layer(symbolic::to_string(kind),
                                                 "the executable layer "
                                                 "registry");
    auto layer = it->second(args);
    if (!layer)
        throw RuntimeError::internal("the constructor of " +
                                     symbolic::to_string(kind) +
                                     " returned no layer");
    return layer;
}

} // namespace backend
} // namespace pcflow
