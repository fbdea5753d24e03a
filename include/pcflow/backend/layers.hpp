#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "pcflow/backend/reparam.hpp"
#include "pcflow/symbolic/layers.hpp"
#include "pcflow/symbolic/parameters.hpp"

namespace pcflow {
namespace backend {

using symbolic::ParameterPtr;

// Constructor arguments shared by every executable layer
struct LayerArgs {
    size_t num_input_units = 1; // channels, for input layers
    size_t num_output_units = 1;
    size_t arity = 1; // scope size, for input layers

    // Reparameterization of fresh parameters; layers fall back to their
    // own default when null
    ReparamPtr reparam;

    // Parameters to use instead of fresh ones, by name
    std::map<std::string, ParameterPtr> parameters;

    // Operator the symbolic layer was derived by, if any
    std::optional<symbolic::Operator> operation;

    // Layer specific hyperparameters (num_categories, value, ...)
    nlohmann::json kwargs = nlohmann::json::object();
};

// ============================================================================
// Base class
// ============================================================================

// An executable layer: shapes and parameter expressions of one compiled
// symbolic layer. Evaluation is left to the runtime.
class ExecutableLayer {
  public:
    virtual ~ExecutableLayer() = default;

    ExecutableLayer(const ExecutableLayer &) = delete;
    ExecutableLayer &operator=(const ExecutableLayer &) = delete;
    ExecutableLayer(ExecutableLayer &&) = delete;
    ExecutableLayer &operator=(ExecutableLayer &&) = delete;

    virtual symbolic::LayerKind kind() const = 0;
    std::string name() const { return symbolic::to_string(kind()); }

    size_t num_input_units() const { return num_input_units_; }
    size_t num_output_units() const { return num_output_units_; }
    size_t arity() const { return arity_; }

    const ReparamPtr &reparam() const { return reparam_; }
    const std::optional<symbolic::Operator> &operation() const {
        return operation_;
    }

    // Parameter introspection
    std::vector<std::pair<std::string, ParameterPtr>>
    named_parameters(const std::string &prefix = "") const;
    std::vector<ParameterPtr> parameters() const;
    bool has_parameter(const std::string &name) const;
    const ParameterPtr &parameter(const std::string &name) const;

    virtual nlohmann::json config() const;

  protected:
    ExecutableLayer(const LayerArgs &args, ReparamPtr default_reparam);

    void register_parameter(const std::string &name, ParameterPtr param);

    // The parameter supplied in `args` under `name` (its shape must be
    // `shape`), or a fresh one made by `reparam`
    ParameterPtr resolve_parameter(const LayerArgs &args,
                                   const std::string &name, const Shape &shape,
                                   const Reparameterization &reparam) const;

  private:
    size_t num_input_units_;
    size_t num_output_units_;
    size_t arity_;
    ReparamPtr reparam_;
    std::optional<symbolic::Operator> operation_;
    std::vector<std::pair<std::string, ParameterPtr>> params_;
};

// ============================================================================
// Input layers
// ============================================================================

class InputLayer : public ExecutableLayer {
  public:
    size_t num_channels() const { return num_input_units(); }
    size_t num_variables() const { return arity(); }

    // Variables marginalized out by integration
    const std::vector<size_t> &integrated_vars() const {
        return integrated_vars_;
    }

    nlohmann::json config() const override;

  protected:
    InputLayer(const LayerArgs &args, ReparamPtr default_reparam);

  private:
    std::vector<size_t> integrated_vars_;
};

// probs: (variables, units, channels, categories)
class CategoricalLayer : public InputLayer {
  public:
    explicit CategoricalLayer(const LayerArgs &args);

    symbolic::LayerKind kind() const override {
        return symbolic::LayerKind::Categorical;
    }
    size_t num_categories() const { return num_categories_; }
    nlohmann::json config() const override;

  private:
    size_t num_categories_;
};

// mean, stddev: (variables, units, channels); products also carry a
// log_partition of the same shape
class GaussianLayer : public InputLayer {
  public:
    explicit GaussianLayer(const LayerArgs &args);

    symbolic::LayerKind kind() const override {
        return symbolic::LayerKind::Gaussian;
    }
};

class ConstantLayer : public InputLayer {
  public:
    explicit ConstantLayer(const LayerArgs &args);

    symbolic::LayerKind kind() const override {
        return symbolic::LayerKind::Constant;
    }
    double value() const { return value_; }
    nlohmann::json config() const override;

  private:
    double value_;
};

// ============================================================================
// Inner layers
// ============================================================================

// weight: (output units, arity * input units)
class DenseLayer : public ExecutableLayer {
  public:
    explicit DenseLayer(const LayerArgs &args);

    symbolic::LayerKind kind() const override {
        return symbolic::LayerKind::Dense;
    }
};

// Uniform mixture of its inputs, unit by unit
class MixingLayer : public ExecutableLayer {
  public:
    explicit MixingLayer(const LayerArgs &args);

    symbolic::LayerKind kind() const override {
        return symbolic::LayerKind::Mixing;
    }
};

class HadamardLayer : public ExecutableLayer {
  public:
    explicit HadamardLayer(const LayerArgs &args);

    symbolic::LayerKind kind() const override {
        return symbolic::LayerKind::Hadamard;
    }
};

class KroneckerLayer : public ExecutableLayer {
  public:
    explicit KroneckerLayer(const LayerArgs &args);

    symbolic::LayerKind kind() const override {
        return symbolic::LayerKind::Kronecker;
    }
};

// ============================================================================
// Layer registry
// ============================================================================

using LayerConstructor =
    std::function<std::unique_ptr<ExecutableLayer>(const LayerArgs &)>;

// Maps every concrete symbolic layer kind to the constructor of its
// executable layer
class ExecutableLayerRegistry {
  public:
    // Seeded with the built-in layers
    ExecutableLayerRegistry();

    bool has_layer(symbolic::LayerKind kind) const;

    // Replaces the constructor of `kind`; abstract kinds are rejected
    void register_layer(symbolic::LayerKind kind, LayerConstructor ctor);

    // Throws StructuralError if `kind` has no executable layer
    std::unique_ptr<ExecutableLayer> construct(symbolic::LayerKind kind,
                                               const LayerArgs &args) const;

  private:
    std::map<symbolic::LayerKind, LayerConstructor> ctors_;
};

} // namespace backend
} // namespace pcflow
