#include "pcflow/symbolic/parameters.hpp"

#include <functional>
#include <unordered_set>

#include "pcflow/error.hpp"

namespace pcflow {
namespace symbolic {

namespace {

size_t normalize_axis(int axis, size_t ndim) {
    int n = static_cast<int>(ndim);
    int a = axis < 0 ? axis + n : axis;
    if (a < 0 || a >= n)
        throw ShapeError::invalid_axis(axis, ndim);
    return static_cast<size_t>(a);
}

const ParameterPtr &check_operand(const ParameterPtr &p) {
    if (!p)
        throw ValueError("parameter operand must not be null");
    return p;
}

void check_same_shapes(const std::vector<ParameterPtr> &opds,
                       const std::string &what) {
    if (opds.empty())
        throw ValueError(what + " requires at least one operand");
    for (const auto &p : opds) {
        check_operand(p);
        if (p->shape() != opds.front()->shape())
            throw ShapeError::mismatch(opds.front()->shape(), p->shape());
    }
}

// Shared checks of the Gaussian product parameters: every operand is
// (D, K_i, C) with the same D and C; means and stddevs pair up.
Shape gaussian_product_shape(const std::vector<ParameterPtr> &opds) {
    if (opds.size() < 2)
        throw ValueError("a Gaussian product needs at least two operands");
    const Shape &first = check_operand(opds.front())->shape();
    if (first.size() != 3)
        throw ShapeError::rank_mismatch(3, first.size());
    Shape out{first[0], 1, first[2]};
    for (const auto &p : opds) {
        const Shape &s = check_operand(p)->shape();
        if (s.size() != 3)
            throw ShapeError::rank_mismatch(3, s.size());
        if (s[0] != first[0] || s[2] != first[2])
            throw ShapeError::mismatch(first, s);
        out[1] *= s[1];
    }
    return out;
}

void check_gaussian_pairs(const std::vector<ParameterPtr> &means,
                          const std::vector<ParameterPtr> &stddevs) {
    if (means.size() != stddevs.size())
        throw ValueError("a Gaussian product needs one stddev per mean");
    for (size_t i = 0; i < means.size(); ++i) {
        if (check_operand(means[i])->shape() !=
            check_operand(stddevs[i])->shape())
            throw ShapeError::mismatch(means[i]->shape(), stddevs[i]->shape());
    }
}

std::vector<ParameterPtr> concat(const std::vector<ParameterPtr> &a,
                                 const std::vector<ParameterPtr> &b) {
    std::vector<ParameterPtr> out(a);
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

} // namespace

const Shape &AbstractParameter::shape() const {
    if (!shape_)
        shape_ = compute_shape();
    return *shape_;
}

// ============================================================================
// Leaves
// ============================================================================

Parameter::Parameter(Shape shape, bool learnable)
    : shape_(std::move(shape)), learnable_(learnable) {}

nlohmann::json Parameter::config() const {
    return {{"shape", shape_}, {"learnable", learnable_}};
}

ConstantParameter::ConstantParameter(Shape shape, double value)
    : shape_(std::move(shape)), value_(value) {}

nlohmann::json ConstantParameter::config() const {
    return {{"shape", shape_}, {"value", value_}};
}

// ============================================================================
// Unary operators
// ============================================================================

UnaryOpParameter::UnaryOpParameter(ParameterPtr opd)
    : opd_(std::move(opd)) {
    check_operand(opd_);
}

ScaledSigmoidParameter::ScaledSigmoidParameter(ParameterPtr opd, double vmin,
                                               double vmax)
    : EntrywiseOpParameter(std::move(opd)), vmin_(vmin), vmax_(vmax) {
    if (!(vmin_ < vmax_))
        throw ValueError("scaled sigmoid requires vmin < vmax");
}

nlohmann::json ScaledSigmoidParameter::config() const {
    return {{"vmin", vmin_}, {"vmax", vmax_}};
}

EntrywiseReduceOpParameter::EntrywiseReduceOpParameter(ParameterPtr opd,
                                                       int axis)
    : EntrywiseOpParameter(std::move(opd)),
      axis_(normalize_axis(axis, opd_->shape().size())) {}

nlohmann::json EntrywiseReduceOpParameter::config() const {
    return {{"axis", axis_}};
}

ReduceOpParameter::ReduceOpParameter(ParameterPtr opd, int axis)
    : UnaryOpParameter(std::move(opd)),
      axis_(normalize_axis(axis, opd_->shape().size())) {}

nlohmann::json ReduceOpParameter::config() const { return {{"axis", axis_}}; }

Shape ReduceOpParameter::compute_shape() const {
    Shape out = opd_->shape();
    out.erase(out.begin() + static_cast<std::ptrdiff_t>(axis_));
    return out;
}

ReshapeParameter::ReshapeParameter(ParameterPtr opd, Shape shape)
    : UnaryOpParameter(std::move(opd)), target_(std::move(shape)) {
    size_t have = 1, want = 1;
    for (size_t d : opd_->shape())
        have *= d;
    for (size_t d : target_)
        want *= d;
    if (have != want)
        throw ShapeError("cannot reshape " + std::to_string(have) +
                         " elements into " + std::to_string(want));
}

nlohmann::json ReshapeParameter::config() const {
    return {{"shape", target_}};
}

PermuteParameter::PermuteParameter(ParameterPtr opd, std::vector<size_t> axes)
    : UnaryOpParameter(std::move(opd)), axes_(std::move(axes)) {
    size_t ndim = opd_->shape().size();
    if (axes_.size() != ndim)
        throw ShapeError::rank_mismatch(ndim, axes_.size());
    std::vector<bool> seen(ndim, false);
    for (size_t a : axes_) {
        if (a >= ndim)
            throw ShapeError::invalid_axis(static_cast<int>(a), ndim);
        if (seen[a])
            throw ShapeError("axis " + std::to_string(a) +
                             " repeated in permutation");
        seen[a] = true;
    }
}

nlohmann::json PermuteParameter::config() const { return {{"axes", axes_}}; }

Shape PermuteParameter::compute_shape() const {
    const Shape &in = opd_->shape();
    Shape out(axes_.size());
    for (size_t i = 0; i < axes_.size(); ++i)
        out[i] = in[axes_[i]];
    return out;
}

// ============================================================================
// Binary and n-ary operators
// ============================================================================

BinaryOpParameter::BinaryOpParameter(ParameterPtr opd1, ParameterPtr opd2)
    : opd1_(std::move(opd1)), opd2_(std::move(opd2)) {
    check_operand(opd1_);
    check_operand(opd2_);
}

HadamardParameter::HadamardParameter(ParameterPtr opd1, ParameterPtr opd2)
    : BinaryOpParameter(std::move(opd1), std::move(opd2)) {
    if (opd1_->shape() != opd2_->shape())
        throw ShapeError::mismatch(opd1_->shape(), opd2_->shape());
}

KroneckerParameter::KroneckerParameter(ParameterPtr opd1, ParameterPtr opd2)
    : BinaryOpParameter(std::move(opd1), std::move(opd2)) {
    if (opd1_->shape().size() != opd2_->shape().size())
        throw ShapeError::rank_mismatch(opd1_->shape().size(),
                                        opd2_->shape().size());
}

Shape KroneckerParameter::compute_shape() const {
    Shape out = opd1_->shape();
    const Shape &rhs = opd2_->shape();
    for (size_t i = 0; i < out.size(); ++i)
        out[i] *= rhs[i];
    return out;
}

namespace {

// Outer products and sums combine along one axis and agree elsewhere
size_t check_outer_operands(const ParameterPtr &opd1, const ParameterPtr &opd2,
                            int axis) {
    const Shape &s1 = opd1->shape();
    const Shape &s2 = opd2->shape();
    if (s1.size() != s2.size())
        throw ShapeError::rank_mismatch(s1.size(), s2.size());
    size_t a = normalize_axis(axis, s1.size());
    for (size_t i = 0; i < s1.size(); ++i) {
        if (i != a && s1[i] != s2[i])
            throw ShapeError::mismatch(s1, s2);
    }
    return a;
}

} // namespace

OuterProductParameter::OuterProductParameter(ParameterPtr opd1,
                                             ParameterPtr opd2, int axis)
    : BinaryOpParameter(std::move(opd1), std::move(opd2)),
      axis_(check_outer_operands(opd1_, opd2_, axis)) {}

nlohmann::json OuterProductParameter::config() const {
    return {{"axis", axis_}};
}

Shape OuterProductParameter::compute_shape() const {
    Shape out = opd1_->shape();
    out[axis_] *= opd2_->shape()[axis_];
    return out;
}

OuterSumParameter::OuterSumParameter(ParameterPtr opd1, ParameterPtr opd2,
                                     int axis)
    : BinaryOpParameter(std::move(opd1), std::move(opd2)),
      axis_(check_outer_operands(opd1_, opd2_, axis)) {}

nlohmann::json OuterSumParameter::config() const { return {{"axis", axis_}}; }

Shape OuterSumParameter::compute_shape() const {
    Shape out = opd1_->shape();
    out[axis_] *= opd2_->shape()[axis_];
    return out;
}

EntrywiseSumParameter::EntrywiseSumParameter(std::vector<ParameterPtr> opds)
    : opds_(std::move(opds)) {
    check_same_shapes(opds_, "EntrywiseSumParameter");
}

StackParameter::StackParameter(std::vector<ParameterPtr> opds, int axis)
    : opds_(std::move(opds)) {
    check_same_shapes(opds_, "StackParameter");
    // The new axis may be placed anywhere in the output, hence rank + 1
    axis_ = normalize_axis(axis, opds_.front()->shape().size() + 1);
}

nlohmann::json StackParameter::config() const { return {{"axis", axis_}}; }

Shape StackParameter::compute_shape() const {
    Shape out = opds_.front()->shape();
    out.insert(out.begin() + static_cast<std::ptrdiff_t>(axis_), opds_.size());
    return out;
}

// ============================================================================
// Gaussian product closure
// ============================================================================

MeanGaussianProduct::MeanGaussianProduct(std::vector<ParameterPtr> means,
                                         std::vector<ParameterPtr> stddevs)
    : means_(std::move(means)), stddevs_(std::move(stddevs)) {
    check_gaussian_pairs(means_, stddevs_);
    gaussian_product_shape(means_);
}

std::vector<ParameterPtr> MeanGaussianProduct::operands() const {
    return concat(means_, stddevs_);
}

Shape MeanGaussianProduct::compute_shape() const {
    return gaussian_product_shape(means_);
}

StddevGaussianProduct::StddevGaussianProduct(std::vector<ParameterPtr> stddevs)
    : stddevs_(std::move(stddevs)) {
    gaussian_product_shape(stddevs_);
}

Shape StddevGaussianProduct::compute_shape() const {
    return gaussian_product_shape(stddevs_);
}

LogPartitionGaussianProduct::LogPartitionGaussianProduct(
    std::vector<ParameterPtr> means, std::vector<ParameterPtr> stddevs)
    : means_(std::move(means)), stddevs_(std::move(stddevs)) {
    check_gaussian_pairs(means_, stddevs_);
    gaussian_product_shape(means_);
}

std::vector<ParameterPtr> LogPartitionGaussianProduct::operands() const {
    return concat(means_, stddevs_);
}

Shape LogPartitionGaussianProduct::compute_shape() const {
    return gaussian_product_shape(means_);
}

// ============================================================================
// Helpers
// ============================================================================

std::vector<std::shared_ptr<const Parameter>>
parameter_leaves(const ParameterPtr &root) {
    std::vector<std::shared_ptr<const Parameter>> leaves;
    std::unordered_set<const AbstractParameter *> visited;
    std::function<void(const ParameterPtr &)> visit =
        [&](const ParameterPtr &p) {
            if (!p || !visited.insert(p.get()).second)
                return;
            if (auto leaf = std::dynamic_pointer_cast<const Parameter>(p)) {
                leaves.push_back(std::move(leaf));
                return;
            }
            for (const auto &opd : p->operands())
                visit(opd);
        };
    visit(root);
    return leaves;
}

nlohmann::json describe(const ParameterPtr &root) {
    if (!root)
        return nullptr;
    nlohmann::json node = {{"name", root->name()},
                           {"shape", root->shape()},
                           {"config", root->config()}};
    nlohmann::json opds = nlohmann::json::array();
    for (const auto &opd : root->operands())
        opds.push_back(describe(opd));
    if (!opds.empty())
        node["operands"] = std::move(opds);
    return node;
}

} // namespace symbolic
} // namespace pcflow
