#include "pcflow/backend/reparam.hpp"

#include "pcflow/error.hpp"

namespace pcflow {
namespace backend {

using symbolic::Parameter;
using symbolic::ParameterPtr;

ParameterPtr LeafReparameterization::parameterize(const Shape &shape) const {
    return std::make_shared<Parameter>(shape);
}

ParameterPtr ExpReparameterization::parameterize(const Shape &shape) const {
    return std::make_shared<symbolic::ExpParameter>(
        std::make_shared<Parameter>(shape));
}

ParameterPtr
SoftplusReparameterization::parameterize(const Shape &shape) const {
    return std::make_shared<symbolic::SoftplusParameter>(
        std::make_shared<Parameter>(shape));
}

ParameterPtr SigmoidReparameterization::parameterize(const Shape &shape) const {
    return std::make_shared<symbolic::SigmoidParameter>(
        std::make_shared<Parameter>(shape));
}

ParameterPtr SoftmaxReparameterization::parameterize(const Shape &shape) const {
    return std::make_shared<symbolic::SoftmaxParameter>(
        std::make_shared<Parameter>(shape), axis_);
}

nlohmann::json SoftmaxReparameterization::config() const {
    return {{"name", name()}, {"axis", axis_}};
}

ParameterPtr
LogSoftmaxReparameterization::parameterize(const Shape &shape) const {
    return std::make_shared<symbolic::LogSoftmaxParameter>(
        std::make_shared<Parameter>(shape), axis_);
}

nlohmann::json LogSoftmaxReparameterization::config() const {
    return {{"name", name()}, {"axis", axis_}};
}

ReparamPtr make_reparameterization(const std::string &name) {
    if (name == "leaf")
        return std::make_shared<LeafReparameterization>();
    if (name == "exp")
        return std::make_shared<ExpReparameterization>();
    if (name == "softplus")
        return std::make_shared<SoftplusReparameterization>();
    if (name == "sigmoid")
        return std::make_shared<SigmoidReparameterization>();
    if (name == "softmax")
        return std::make_shared<SoftmaxReparameterization>();
    if (name == "log_softmax")
        return std::make_shared<LogSoftmaxReparameterization>();
    throw ValueError("unknown reparameterization '" + name + "'");
}

} // namespace backend
} // namespace pcflow
