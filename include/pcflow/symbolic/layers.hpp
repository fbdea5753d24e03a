#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pcflow/scope.hpp"

namespace pcflow {
namespace symbolic {

// ============================================================================
// Layer kinds
// ============================================================================

// Closed set of layer kinds. The hierarchy is
//
//   Layer
//   ├── Input   : Categorical, Gaussian, Constant
//   ├── Sum     : Dense, Mixing
//   └── Product : Hadamard, Kronecker
//
// Layer, Input, Sum and Product are abstract and only used to match rules
// by subkind.
enum class LayerKind : uint8_t {
    Layer,
    Input,
    Categorical,
    Gaussian,
    Constant,
    Sum,
    Dense,
    Mixing,
    Product,
    Hadamard,
    Kronecker,
};

// Direct parent in the hierarchy (Layer is its own parent)
LayerKind parent_kind(LayerKind kind);

// True if `kind` is `base` or (transitively) derives from it
bool is_subkind(LayerKind kind, LayerKind base);

bool is_abstract(LayerKind kind);

std::string to_string(LayerKind kind);

// ============================================================================
// Provenance
// ============================================================================

enum class Operator : uint8_t { Integration, Differentiation, Multiplication };

std::string to_string(Operator op);

// Index of a layer inside the arena of its circuit
using LayerId = size_t;

// Records that a layer was produced by a structural operator. Operand i is
// a layer of the i-th operand circuit of the owning circuit's operation.
struct LayerOperation {
    Operator op;
    std::vector<LayerId> operands;
    nlohmann::json metadata = nlohmann::json::object();
};

// ============================================================================
// Layers
// ============================================================================

class SymbolicLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Layer;

    virtual ~SymbolicLayer() = default;

    virtual LayerKind kind() const = 0;
    virtual std::unique_ptr<SymbolicLayer> clone() const = 0;

    const Scope &scope() const { return scope_; }
    size_t num_units() const { return num_units_; }
    size_t arity() const { return arity_; }

    const std::optional<LayerOperation> &operation() const {
        return operation_;
    }
    void set_operation(LayerOperation operation) {
        operation_ = std::move(operation);
    }

    bool is_input() const { return is_subkind(kind(), LayerKind::Input); }
    bool is_sum() const { return is_subkind(kind(), LayerKind::Sum); }
    bool is_product() const { return is_subkind(kind(), LayerKind::Product); }

    // Hyperparameters other than scope and units, e.g. num_categories
    virtual nlohmann::json config() const;

    std::string to_string() const;

  protected:
    SymbolicLayer(Scope scope, size_t num_units, size_t arity);
    SymbolicLayer(const SymbolicLayer &) = default;
    SymbolicLayer &operator=(const SymbolicLayer &) = delete;

  private:
    Scope scope_;
    size_t num_units_;
    size_t arity_;
    std::optional<LayerOperation> operation_;
};

// Safe downcast over the kind table; returns nullptr on a kind mismatch
template <typename T> const T *layer_cast(const SymbolicLayer &layer) {
    if (!is_subkind(layer.kind(), T::static_kind))
        return nullptr;
    return static_cast<const T *>(&layer);
}

// Input layers read the variables of their scope and have no layer inputs
class InputLayer : public SymbolicLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Input;

    size_t num_channels() const { return num_channels_; }
    nlohmann::json config() const override;

  protected:
    InputLayer(Scope scope, size_t num_units, size_t num_channels);

  private:
    size_t num_channels_;
};

class CategoricalLayer : public InputLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Categorical;

    CategoricalLayer(Scope scope, size_t num_units, size_t num_channels,
                     size_t num_categories = 2);

    size_t num_categories() const { return num_categories_; }

    LayerKind kind() const override { return static_kind; }
    std::unique_ptr<SymbolicLayer> clone() const override;
    nlohmann::json config() const override;

  private:
    size_t num_categories_;
};

class GaussianLayer : public InputLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Gaussian;

    GaussianLayer(Scope scope, size_t num_units, size_t num_channels);

    LayerKind kind() const override { return static_kind; }
    std::unique_ptr<SymbolicLayer> clone() const override;
};

class ConstantLayer : public InputLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Constant;

    ConstantLayer(Scope scope, size_t num_units, size_t num_channels,
                  double value = 0.0);

    // Log-space value of every unit
    double value() const { return value_; }

    LayerKind kind() const override { return static_kind; }
    std::unique_ptr<SymbolicLayer> clone() const override;
    nlohmann::json config() const override;

  private:
    double value_;
};

class SumLayer : public SymbolicLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Sum;

  protected:
    using SymbolicLayer::SymbolicLayer;
};

// Fully connected sum over the units of a single input
class DenseLayer : public SumLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Dense;

    DenseLayer(Scope scope, size_t num_units, size_t arity = 1);

    LayerKind kind() const override { return static_kind; }
    std::unique_ptr<SymbolicLayer> clone() const override;
};

// Unit-wise mixture of `arity` alternative inputs over the same scope
class MixingLayer : public SumLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Mixing;

    MixingLayer(Scope scope, size_t num_units, size_t arity);

    LayerKind kind() const override { return static_kind; }
    std::unique_ptr<SymbolicLayer> clone() const override;
};

class ProductLayer : public SymbolicLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Product;

  protected:
    using SymbolicLayer::SymbolicLayer;
};

// Element-wise product; keeps the number of units of its inputs
class HadamardLayer : public ProductLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Hadamard;

    HadamardLayer(Scope scope, size_t num_input_units, size_t arity);

    LayerKind kind() const override { return static_kind; }
    std::unique_ptr<SymbolicLayer> clone() const override;
};

// Outer product; has num_input_units ^ arity units
class KroneckerLayer : public ProductLayer {
  public:
    static constexpr LayerKind static_kind = LayerKind::Kronecker;

    KroneckerLayer(Scope scope, size_t num_input_units, size_t arity);

    size_t num_input_units() const { return num_input_units_; }

    LayerKind kind() const override { return static_kind; }
    std::unique_ptr<SymbolicLayer> clone() const override;

  private:
    size_t num_input_units_;
};

// ============================================================================
// Factories
// ============================================================================

using InputLayerFactory = std::function<std::unique_ptr<InputLayer>(
    const Scope &scope, size_t num_units, size_t num_channels)>;
using SumLayerFactory = std::function<std::unique_ptr<SumLayer>(
    const Scope &scope, size_t num_units, size_t arity)>;
using ProductLayerFactory = std::function<std::unique_ptr<ProductLayer>(
    const Scope &scope, size_t num_input_units, size_t arity)>;

InputLayerFactory categorical_factory(size_t num_categories = 2);
InputLayerFactory gaussian_factory();
SumLayerFactory dense_factory();
SumLayerFactory mixing_factory();
ProductLayerFactory hadamard_factory();
ProductLayerFactory kronecker_factory();

} // namespace symbolic
} // namespace pcflow
