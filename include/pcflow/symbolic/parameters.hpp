#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pcflow {

using Shape = std::vector<size_t>;

namespace symbolic {

class AbstractParameter;
using ParameterPtr = std::shared_ptr<const AbstractParameter>;

// ============================================================================
// Base class
// ============================================================================

// A node of a symbolic parameter expression.
//
// The shape is computed on first access and cached; it never changes
// afterwards. config() holds the non-tensor hyperparameters used for
// equality and serialization, never for computation.
class AbstractParameter {
  public:
    virtual ~AbstractParameter() = default;

    AbstractParameter(const AbstractParameter &) = delete;
    AbstractParameter &operator=(const AbstractParameter &) = delete;

    const Shape &shape() const;

    virtual std::string name() const = 0;
    virtual nlohmann::json config() const { return nlohmann::json::object(); }

    // Direct operands of this node (empty for leaves)
    virtual std::vector<ParameterPtr> operands() const { return {}; }

  protected:
    AbstractParameter() = default;
    virtual Shape compute_shape() const = 0;

  private:
    mutable std::optional<Shape> shape_;
};

// ============================================================================
// Leaves
// ============================================================================

class Parameter : public AbstractParameter {
  public:
    explicit Parameter(Shape shape, bool learnable = true);

    bool learnable() const { return learnable_; }

    std::string name() const override { return "Parameter"; }
    nlohmann::json config() const override;

  protected:
    Shape compute_shape() const override { return shape_; }

  private:
    Shape shape_;
    bool learnable_;
};

class ConstantParameter : public AbstractParameter {
  public:
    explicit ConstantParameter(Shape shape, double value = 0.0);

    double value() const { return value_; }

    std::string name() const override { return "ConstantParameter"; }
    nlohmann::json config() const override;

  protected:
    Shape compute_shape() const override { return shape_; }

  private:
    Shape shape_;
    double value_;
};

// ============================================================================
// Unary operators
// ============================================================================

class UnaryOpParameter : public AbstractParameter {
  public:
    const ParameterPtr &opd() const { return opd_; }
    std::vector<ParameterPtr> operands() const override { return {opd_}; }

  protected:
    explicit UnaryOpParameter(ParameterPtr opd);

    ParameterPtr opd_;
};

// Elementwise ops keep the operand shape
class EntrywiseOpParameter : public UnaryOpParameter {
  protected:
    using UnaryOpParameter::UnaryOpParameter;
    Shape compute_shape() const override { return opd_->shape(); }
};

class ExpParameter : public EntrywiseOpParameter {
  public:
    explicit ExpParameter(ParameterPtr opd)
        : EntrywiseOpParameter(std::move(opd)) {}
    std::string name() const override { return "ExpParameter"; }
};

class LogParameter : public EntrywiseOpParameter {
  public:
    explicit LogParameter(ParameterPtr opd)
        : EntrywiseOpParameter(std::move(opd)) {}
    std::string name() const override { return "LogParameter"; }
};

class SoftplusParameter : public EntrywiseOpParameter {
  public:
    explicit SoftplusParameter(ParameterPtr opd)
        : EntrywiseOpParameter(std::move(opd)) {}
    std::string name() const override { return "SoftplusParameter"; }
};

class ScaledSigmoidParameter : public EntrywiseOpParameter {
  public:
    ScaledSigmoidParameter(ParameterPtr opd, double vmin, double vmax);

    double vmin() const { return vmin_; }
    double vmax() const { return vmax_; }

    std::string name() const override { return "ScaledSigmoidParameter"; }
    nlohmann::json config() const override;

  private:
    double vmin_;
    double vmax_;
};

// Plain logistic sigmoid, i.e. scaled to [0, 1]
class SigmoidParameter : public ScaledSigmoidParameter {
  public:
    explicit SigmoidParameter(ParameterPtr opd)
        : ScaledSigmoidParameter(std::move(opd), 0.0, 1.0) {}
    std::string name() const override { return "SigmoidParameter"; }
};

// Elementwise ops normalizing along one axis
class EntrywiseReduceOpParameter : public EntrywiseOpParameter {
  public:
    size_t axis() const { return axis_; }
    nlohmann::json config() const override;

  protected:
    EntrywiseReduceOpParameter(ParameterPtr opd, int axis);

    size_t axis_;
};

class SoftmaxParameter : public EntrywiseReduceOpParameter {
  public:
    explicit SoftmaxParameter(ParameterPtr opd, int axis = -1)
        : EntrywiseReduceOpParameter(std::move(opd), axis) {}
    std::string name() const override { return "SoftmaxParameter"; }
};

class LogSoftmaxParameter : public EntrywiseReduceOpParameter {
  public:
    explicit LogSoftmaxParameter(ParameterPtr opd, int axis = -1)
        : EntrywiseReduceOpParameter(std::move(opd), axis) {}
    std::string name() const override { return "LogSoftmaxParameter"; }
};

// Reductions drop the reduced axis
class ReduceOpParameter : public UnaryOpParameter {
  public:
    size_t axis() const { return axis_; }
    nlohmann::json config() const override;

  protected:
    ReduceOpParameter(ParameterPtr opd, int axis);
    Shape compute_shape() const override;

    size_t axis_;
};

class ReduceSumParameter : public ReduceOpParameter {
  public:
    explicit ReduceSumParameter(ParameterPtr opd, int axis = -1)
        : ReduceOpParameter(std::move(opd), axis) {}
    std::string name() const override { return "ReduceSumParameter"; }
};

class ReduceProductParameter : public ReduceOpParameter {
  public:
    explicit ReduceProductParameter(ParameterPtr opd, int axis = -1)
        : ReduceOpParameter(std::move(opd), axis) {}
    std::string name() const override { return "ReduceProductParameter"; }
};

class ReduceLSEParameter : public ReduceOpParameter {
  public:
    explicit ReduceLSEParameter(ParameterPtr opd, int axis = -1)
        : ReduceOpParameter(std::move(opd), axis) {}
    std::string name() const override { return "ReduceLSEParameter"; }
};

// Same elements in row-major order under a new shape
class ReshapeParameter : public UnaryOpParameter {
  public:
    ReshapeParameter(ParameterPtr opd, Shape shape);
    std::string name() const override { return "ReshapeParameter"; }
    nlohmann::json config() const override;

  protected:
    Shape compute_shape() const override { return target_; }

  private:
    Shape target_;
};

// Output axis i is input axis axes()[i]
class PermuteParameter : public UnaryOpParameter {
  public:
    PermuteParameter(ParameterPtr opd, std::vector<size_t> axes);
    std::string name() const override { return "PermuteParameter"; }
    nlohmann::json config() const override;
    const std::vector<size_t> &axes() const { return axes_; }

  protected:
    Shape compute_shape() const override;

  private:
    std::vector<size_t> axes_;
};

// ============================================================================
// Binary and n-ary operators
// ============================================================================

class BinaryOpParameter : public AbstractParameter {
  public:
    const ParameterPtr &opd1() const { return opd1_; }
    const ParameterPtr &opd2() const { return opd2_; }
    std::vector<ParameterPtr> operands() const override {
        return {opd1_, opd2_};
    }

  protected:
    BinaryOpParameter(ParameterPtr opd1, ParameterPtr opd2);

    ParameterPtr opd1_;
    ParameterPtr opd2_;
};

// Requires identical operand shapes
class HadamardParameter : public BinaryOpParameter {
  public:
    HadamardParameter(ParameterPtr opd1, ParameterPtr opd2);
    std::string name() const override { return "HadamardParameter"; }

  protected:
    Shape compute_shape() const override { return opd1_->shape(); }
};

// Requires equal ranks; every axis is multiplied
class KroneckerParameter : public BinaryOpParameter {
  public:
    KroneckerParameter(ParameterPtr opd1, ParameterPtr opd2);
    std::string name() const override { return "KroneckerParameter"; }

  protected:
    Shape compute_shape() const override;
};

// Requires equal ranks and equal sizes outside `axis`; the sizes along
// `axis` are multiplied
class OuterProductParameter : public BinaryOpParameter {
  public:
    OuterProductParameter(ParameterPtr opd1, ParameterPtr opd2, int axis = -1);

    size_t axis() const { return axis_; }
    std::string name() const override { return "OuterProductParameter"; }
    nlohmann::json config() const override;

  protected:
    Shape compute_shape() const override;

  private:
    size_t axis_;
};

class OuterSumParameter : public BinaryOpParameter {
  public:
    OuterSumParameter(ParameterPtr opd1, ParameterPtr opd2, int axis = -1);

    size_t axis() const { return axis_; }
    std::string name() const override { return "OuterSumParameter"; }
    nlohmann::json config() const override;

  protected:
    Shape compute_shape() const override;

  private:
    size_t axis_;
};

// Elementwise sum of same-shaped operands
class EntrywiseSumParameter : public AbstractParameter {
  public:
    explicit EntrywiseSumParameter(std::vector<ParameterPtr> opds);

    std::vector<ParameterPtr> operands() const override { return opds_; }
    std::string name() const override { return "EntrywiseSumParameter"; }

  protected:
    Shape compute_shape() const override { return opds_.front()->shape(); }

  private:
    std::vector<ParameterPtr> opds_;
};

// Stacks same-shaped operands along a new axis
class StackParameter : public AbstractParameter {
  public:
    StackParameter(std::vector<ParameterPtr> opds, int axis = -1);

    size_t axis() const { return axis_; }
    std::vector<ParameterPtr> operands() const override { return opds_; }
    std::string name() const override { return "StackParameter"; }
    nlohmann::json config() const override;

  protected:
    Shape compute_shape() const override;

  private:
    std::vector<ParameterPtr> opds_;
    size_t axis_;
};

// ============================================================================
// Gaussian product closure
// ============================================================================

// Means and standard deviations are shaped (D, K, C): variables, units,
// channels. The product of n Gaussian layers has K_1 * ... * K_n units.

class MeanGaussianProduct : public AbstractParameter {
  public:
    MeanGaussianProduct(std::vector<ParameterPtr> means,
                        std::vector<ParameterPtr> stddevs);

    std::vector<ParameterPtr> operands() const override;
    std::string name() const override { return "MeanGaussianProduct"; }

  protected:
    Shape compute_shape() const override;

  private:
    std::vector<ParameterPtr> means_;
    std::vector<ParameterPtr> stddevs_;
};

class StddevGaussianProduct : public AbstractParameter {
  public:
    explicit StddevGaussianProduct(std::vector<ParameterPtr> stddevs);

    std::vector<ParameterPtr> operands() const override { return stddevs_; }
    std::string name() const override { return "StddevGaussianProduct"; }

  protected:
    Shape compute_shape() const override;

  private:
    std::vector<ParameterPtr> stddevs_;
};

class LogPartitionGaussianProduct : public AbstractParameter {
  public:
    LogPartitionGaussianProduct(std::vector<ParameterPtr> means,
                                std::vector<ParameterPtr> stddevs);

    std::vector<ParameterPtr> operands() const override;
    std::string name() const override { return "LogPartitionGaussianProduct"; }

  protected:
    Shape compute_shape() const override;

  private:
    std::vector<ParameterPtr> means_;
    std::vector<ParameterPtr> stddevs_;
};

// ============================================================================
// Helpers
// ============================================================================

// Learnable leaves reachable from `root`, each listed once, in DFS order
std::vector<std::shared_ptr<const Parameter>>
parameter_leaves(const ParameterPtr &root);

// Structural description of the expression: node names, configs, shapes
nlohmann::json describe(const ParameterPtr &root);

} // namespace symbolic
} // namespace pcflow
