#include "pcflow/symbolic/layers.hpp"

#include <array>
#include <sstream>

#include "pcflow/error.hpp"

namespace pcflow {
namespace symbolic {

namespace {

struct KindInfo {
    LayerKind parent;
    bool is_abstract;
    const char *name;
};

// Indexed by LayerKind
constexpr std::array<KindInfo, 11> kKindTable = {{
    {LayerKind::Layer, true, "Layer"},
    {LayerKind::Layer, true, "InputLayer"},
    {LayerKind::Input, false, "CategoricalLayer"},
    {LayerKind::Input, false, "GaussianLayer"},
    {LayerKind::Input, false, "ConstantLayer"},
    {LayerKind::Layer, true, "SumLayer"},
    {LayerKind::Sum, false, "DenseLayer"},
    {LayerKind::Sum, false, "MixingLayer"},
    {LayerKind::Layer, true, "ProductLayer"},
    {LayerKind::Product, false, "HadamardLayer"},
    {LayerKind::Product, false, "KroneckerLayer"},
}};

const KindInfo &info(LayerKind kind) {
    return kKindTable[static_cast<size_t>(kind)];
}

size_t checked_pow(size_t base, size_t exp) {
    size_t out = 1;
    for (size_t i = 0; i < exp; ++i) {
        if (base != 0 && out > static_cast<size_t>(-1) / base)
            throw ValueError("Kronecker layer has too many units");
        out *= base;
    }
    return out;
}

} // namespace

// ============================================================================
// Layer kinds
// ============================================================================

LayerKind parent_kind(LayerKind kind) { return info(kind).parent; }

bool is_subkind(LayerKind kind, LayerKind base) {
    while (true) {
        if (kind == base)
            return true;
        if (kind == LayerKind::Layer)
            return false;
        kind = parent_kind(kind);
    }
}

bool is_abstract(LayerKind kind) { return info(kind).is_abstract; }

std::string to_string(LayerKind kind) { return info(kind).name; }

std::string to_string(Operator op) {
    switch (op) {
    case Operator::Integration:
        return "integration";
    case Operator::Differentiation:
        return "differentiation";
    case Operator::Multiplication:
        return "multiplication";
    }
    return "unknown";
}

// ============================================================================
// SymbolicLayer
// ============================================================================

SymbolicLayer::SymbolicLayer(Scope scope, size_t num_units, size_t arity)
    : scope_(std::move(scope)), num_units_(num_units), arity_(arity) {
    if (scope_.empty())
        throw ValueError("the scope of a layer must not be empty");
    if (num_units_ == 0)
        throw ValueError("a layer must have at least one unit");
    if (arity_ == 0)
        throw ValueError("a layer must have a positive arity");
}

nlohmann::json SymbolicLayer::config() const {
    return {{"num_units", num_units_}, {"arity", arity_}};
}

std::string SymbolicLayer::to_string() const {
    std::ostringstream oss;
    oss << symbolic::to_string(kind()) << "(scope=" << scope_
        << ", num_units=" << num_units_ << ", arity=" << arity_;
    if (operation_)
        oss << ", op=" << symbolic::to_string(operation_->op);
    oss << ")";
    return oss.str();
}

InputLayer::InputLayer(Scope scope, size_t num_units, size_t num_channels)
    : SymbolicLayer(std::move(scope), num_units, 1),
      num_channels_(num_channels) {
    if (num_channels_ == 0)
        throw ValueError("an input layer must have at least one channel");
}

nlohmann::json InputLayer::config() const {
    nlohmann::json cfg = SymbolicLayer::config();
    cfg["num_channels"] = num_channels_;
    return cfg;
}

// ============================================================================
// Input layers
// ============================================================================

CategoricalLayer::CategoricalLayer(Scope scope, size_t num_units,
                                   size_t num_channels, size_t num_categories)
    : InputLayer(std::move(scope), num_units, num_channels),
      num_categories_(num_categories) {
    if (num_categories_ < 2)
        throw ValueError("a categorical layer needs at least two categories");
}

std::unique_ptr<SymbolicLayer> CategoricalLayer::clone() const {
    return std::make_unique<CategoricalLayer>(*this);
}

nlohmann::json CategoricalLayer::config() const {
    nlohmann::json cfg = InputLayer::config();
    cfg["num_categories"] = num_categories_;
    return cfg;
}

GaussianLayer::GaussianLayer(Scope scope, size_t num_units,
                             size_t num_channels)
    : InputLayer(std::move(scope), num_units, num_channels) {}

std::unique_ptr<SymbolicLayer> GaussianLayer::clone() const {
    return std::make_unique<GaussianLayer>(*this);
}

ConstantLayer::ConstantLayer(Scope scope, size_t num_units,
                             size_t num_channels, double value)
    : InputLayer(std::move(scope), num_units, num_channels), value_(value) {}

std::unique_ptr<SymbolicLayer> ConstantLayer::clone() const {
    return std::make_unique<ConstantLayer>(*this);
}

nlohmann::json ConstantLayer::config() const {
    nlohmann::json cfg = InputLayer::config();
    cfg["value"] = value_;
    return cfg;
}

// ============================================================================
// Inner layers
// ============================================================================

DenseLayer::DenseLayer(Scope scope, size_t num_units, size_t arity)
    : SumLayer(std::move(scope), num_units, arity) {}

std::unique_ptr<SymbolicLayer> DenseLayer::clone() const {
    return std::make_unique<DenseLayer>(*this);
}

MixingLayer::MixingLayer(Scope scope, size_t num_units, size_t arity)
    : SumLayer(std::move(scope), num_units, arity) {}

std::unique_ptr<SymbolicLayer> MixingLayer::clone() const {
    return std::make_unique<MixingLayer>(*this);
}

HadamardLayer::HadamardLayer(Scope scope, size_t num_input_units, size_t arity)
    : ProductLayer(std::move(scope), num_input_units, arity) {}

std::unique_ptr<SymbolicLayer> HadamardLayer::clone() const {
    return std::make_unique<HadamardLayer>(*this);
}

KroneckerLayer::KroneckerLayer(Scope scope, size_t num_input_units,
                               size_t arity)
    : ProductLayer(std::move(scope), checked_pow(num_input_units, arity),
                   arity),
      num_input_units_(num_input_units) {}

std::unique_ptr<SymbolicLayer> KroneckerLayer::clone() const {
    return std::make_unique<KroneckerLayer>(*this);
}

// ============================================================================
// Factories
// ============================================================================

InputLayerFactory categorical_factory(size_t num_categories) {
    return [num_categories](const Scope &scope, size_t num_units,
                            size_t num_channels) {
        return std::make_unique<CategoricalLayer>(scope, num_units,
                                                  num_channels, num_categories);
    };
}

InputLayerFactory gaussian_factory() {
    return [](const Scope &scope, size_t num_units, size_t num_channels) {
        return std::make_unique<GaussianLayer>(scope, num_units, num_channels);
    };
}

SumLayerFactory dense_factory() {
    return [](const Scope &scope, size_t num_units, size_t arity) {
        return std::make_unique<DenseLayer>(scope, num_units, arity);
    };
}

SumLayerFactory mixing_factory() {
    return [](const Scope &scope, size_t num_units, size_t arity) {
        return std::make_unique<MixingLayer>(scope, num_units, arity);
    };
}

ProductLayerFactory hadamard_factory() {
    return [](const Scope &scope, size_t num_input_units, size_t arity) {
        return std::make_unique<HadamardLayer>(scope, num_input_units, arity);
    };
}

ProductLayerFactory kronecker_factory() {
    return [](const Scope &scope, size_t num_input_units, size_t arity) {
        return std::make_unique<KroneckerLayer>(scope, num_input_units, arity);
    };
}

} // namespace symbolic
} // namespace pcflow
