#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "pcflow/symbolic/parameters.hpp"

namespace pcflow {
namespace backend {

// Turns a freshly allocated leaf into the parameter expression a layer
// actually uses, e.g. softmax(leaf) for normalized weights. The compiler
// passes the same object to every layer derived from the same parameters.
class Reparameterization {
  public:
    virtual ~Reparameterization() = default;

    virtual std::string name() const = 0;
    virtual symbolic::ParameterPtr parameterize(const Shape &shape) const = 0;
    virtual nlohmann::json config() const { return {{"name", name()}}; }
};

using ReparamPtr = std::shared_ptr<const Reparameterization>;

// Identity: the leaf itself
class LeafReparameterization : public Reparameterization {
  public:
    std::string name() const override { return "leaf"; }
    symbolic::ParameterPtr parameterize(const Shape &shape) const override;
};

class ExpReparameterization : public Reparameterization {
  public:
    std::string name() const override { return "exp"; }
    symbolic::ParameterPtr parameterize(const Shape &shape) const override;
};

class SoftplusReparameterization : public Reparameterization {
  public:
    std::string name() const override { return "softplus"; }
    symbolic::ParameterPtr parameterize(const Shape &shape) const override;
};

class SigmoidReparameterization : public Reparameterization {
  public:
    std::string name() const override { return "sigmoid"; }
    symbolic::ParameterPtr parameterize(const Shape &shape) const override;
};

// Normalizes along `axis` (the last one by default)
class SoftmaxReparameterization : public Reparameterization {
  public:
    explicit SoftmaxReparameterization(int axis = -1) : axis_(axis) {}

    std::string name() const override { return "softmax"; }
    symbolic::ParameterPtr parameterize(const Shape &shape) const override;
    nlohmann::json config() const override;

  private:
    int axis_;
};

class LogSoftmaxReparameterization : public Reparameterization {
  public:
    explicit LogSoftmaxReparameterization(int axis = -1) : axis_(axis) {}

    std::string name() const override { return "log_softmax"; }
    symbolic::ParameterPtr parameterize(const Shape &shape) const override;
    nlohmann::json config() const override;

  private:
    int axis_;
};

// Looks a reparameterization up by name ("leaf", "exp", "softplus",
// "sigmoid", "softmax", "log_softmax"); throws ValueError otherwise
ReparamPtr make_reparameterization(const std::string &name);

} // namespace backend
} // namespace pcflow
