#pragma once

#include <array>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "pcflow/error.hpp"
#include "pcflow/symbolic/circuit_block.hpp"
#include "pcflow/symbolic/layers.hpp"

namespace pcflow {
namespace symbolic {

// Layer kinds of the operands of a rule, in order
using Signature = std::vector<LayerKind>;

// Type-erased rewrite rule: takes the operand layers (matching the
// signature the rule was retrieved for) and the operator keyword arguments
using LayerOperatorFunc = std::function<CircuitBlock(
    const std::vector<const SymbolicLayer *> &operands,
    const nlohmann::json &kwargs)>;

struct OperatorRule {
    Signature signature;
    LayerOperatorFunc func;

    CircuitBlock operator()(const std::vector<const SymbolicLayer *> &operands,
                            const nlohmann::json &kwargs = {}) const {
        return func(operands, kwargs);
    }
};

using RulePtr = std::shared_ptr<const OperatorRule>;

Signature signature_of(const std::vector<const SymbolicLayer *> &layers);
std::vector<std::string> signature_names(const Signature &signature);

namespace detail {

template <typename Arg>
constexpr bool is_const_or_value_v =
    !std::is_lvalue_reference_v<Arg> ||
    std::is_const_v<std::remove_reference_t<Arg>>;

template <typename Arg>
constexpr bool is_layer_arg_v =
    std::is_base_of_v<SymbolicLayer, std::remove_cvref_t<Arg>> &&
    is_const_or_value_v<Arg>;

template <typename Arg>
constexpr bool is_kwargs_arg_v =
    std::is_same_v<std::remove_cvref_t<Arg>, nlohmann::json> &&
    is_const_or_value_v<Arg>;

template <typename Arg, size_t I>
decltype(auto) rule_argument(const std::vector<const SymbolicLayer *> &ops,
                             const nlohmann::json &kwargs) {
    using T = std::remove_cvref_t<Arg>;
    if constexpr (is_layer_arg_v<Arg>) {
        const T *layer = layer_cast<T>(*ops.at(I));
        if (!layer)
            throw RuntimeError::internal("operand " + std::to_string(I) +
                                         " is not a " +
                                         to_string(T::static_kind));
        return static_cast<const T &>(*layer);
    } else {
        return static_cast<const nlohmann::json &>(kwargs);
    }
}

template <typename R, typename... Args, size_t... I>
CircuitBlock call_rule(const std::function<R(Args...)> &fn,
                       const std::vector<const SymbolicLayer *> &ops,
                       const nlohmann::json &kwargs,
                       std::index_sequence<I...>) {
    return fn(rule_argument<Args, I>(ops, kwargs)...);
}

} // namespace detail

// Table of rewrite rules, keyed by operator and operand signature.
//
// A rule registered for a signature also applies to every signature whose
// kinds are subkinds of it, position by position. Lookups that resolve
// through a subkind are cached under the queried signature.
class OperatorRegistry {
  public:
    OperatorRegistry() = default;

    // A registry holding the built-in integration, differentiation and
    // multiplication rules (multiplication is commutative)
    static OperatorRegistry from_default_rules();

    std::vector<Operator> operators() const;

    bool has_rule(Operator op, const Signature &signature) const;

    // Throws OperatorNotFound or OperatorSignatureNotFound
    RulePtr retrieve_rule(Operator op, const Signature &signature);

    // Registers a typed rule. Its leading parameters must be const
    // references to layer classes and form the signature; they may be
    // followed by one `const nlohmann::json &` receiving the keyword
    // arguments. The rule must return a CircuitBlock.
    template <typename F>
    void register_rule(Operator op, F &&fn, bool commutative = false) {
        auto typed = std::function{std::forward<F>(fn)};
        register_typed_rule(op, std::move(typed), commutative);
    }

    // Registers a type-erased rule under an explicit signature
    void add_rule(Operator op, const Signature &signature,
                  LayerOperatorFunc fn, bool commutative = false);

    size_t num_rules(Operator op) const;

  private:
    struct OperatorRules {
        // Declared rules in registration order
        std::vector<RulePtr> declared;
        std::map<Signature, RulePtr> exact;
        // Subkind resolutions
        std::map<Signature, RulePtr> cache;
    };

    template <typename R, typename... Args>
    void register_typed_rule(Operator op, std::function<R(Args...)> fn,
                             bool commutative) {
        if constexpr (!std::is_same_v<R, CircuitBlock>) {
            throw ValueError::invalid_rule("it must return a CircuitBlock");
        } else if constexpr (!((detail::is_layer_arg_v<Args> ||
                                detail::is_kwargs_arg_v<Args>) &&
                               ...)) {
            throw ValueError::invalid_rule(
                "its parameters must be layers or keyword arguments");
        } else {
            constexpr std::array<bool, sizeof...(Args)> is_layer = {
                detail::is_layer_arg_v<Args>...};
            size_t num_layers = 0;
            for (bool b : is_layer) {
                if (!b)
                    break;
                ++num_layers;
            }
            for (size_t i = num_layers; i < is_layer.size(); ++i) {
                if (is_layer[i])
                    throw ValueError::operands_not_first();
            }
            if (num_layers == 0)
                throw ValueError::invalid_rule("it has no layer operands");

            Signature signature;
            (
                [&] {
                    if constexpr (detail::is_layer_arg_v<Args>)
                        signature.push_back(
                            std::remove_cvref_t<Args>::static_kind);
                }(),
                ...);

            LayerOperatorFunc erased =
                [fn = std::move(fn)](
                    const std::vector<const SymbolicLayer *> &ops,
                    const nlohmann::json &kwargs) -> CircuitBlock {
                return detail::call_rule(fn, ops, kwargs,
                                         std::index_sequence_for<Args...>{});
            };
            add_rule(op, signature, std::move(erased), commutative);
        }
    }

    void insert_rule(OperatorRules &rules, RulePtr rule);
    RulePtr find_rule(Operator op, const Signature &signature) const;

    std::map<Operator, OperatorRules> rules_;
};

} // namespace symbolic
} // namespace pcflow
