#include "pcflow/symbolic/registry.hpp"

#include <algorithm>

#include "pcflow/symbolic/rules.hpp"

namespace pcflow {
namespace symbolic {

namespace {

bool matches(const Signature &signature, const Signature &declared) {
    if (signature.size() != declared.size())
        return false;
    for (size_t i = 0; i < signature.size(); ++i) {
        if (!is_subkind(signature[i], declared[i]))
            return false;
    }
    return true;
}

} // namespace

Signature signature_of(const std::vector<const SymbolicLayer *> &layers) {
    Signature signature;
    signature.reserve(layers.size());
    for (const SymbolicLayer *layer : layers) {
        if (!layer)
            throw ValueError("operator operands must not be null");
        signature.push_back(layer->kind());
    }
    return signature;
}

std::vector<std::string> signature_names(const Signature &signature) {
    std::vector<std::string> names;
    names.reserve(signature.size());
    for (LayerKind kind : signature)
        names.push_back(to_string(kind));
    return names;
}

// ============================================================================
// OperatorRegistry
// ============================================================================

OperatorRegistry OperatorRegistry::from_default_rules() {
    OperatorRegistry registry;
    register_default_rules(registry);
    return registry;
}

std::vector<Operator> OperatorRegistry::operators() const {
    std::vector<Operator> ops;
    for (const auto &[op, rules] : rules_)
        ops.push_back(op);
    return ops;
}

size_t OperatorRegistry::num_rules(Operator op) const {
    auto it = rules_.find(op);
    return it == rules_.end() ? 0 : it->second.declared.size();
}

RulePtr OperatorRegistry::find_rule(Operator op,
                                    const Signature &signature) const {
    const OperatorRules &rules = rules_.at(op);
    if (auto it = rules.exact.find(signature); it != rules.exact.end())
        return it->second;
    if (auto it = rules.cache.find(signature); it != rules.cache.end())
        return it->second;
    for (const RulePtr &rule : rules.declared) {
        if (matches(signature, rule->signature))
            return rule;
    }
    return nullptr;
}

bool OperatorRegistry::has_rule(Operator op,
                                const Signature &signature) const {
    if (rules_.find(op) == rules_.end())
        return false;
    return find_rule(op, signature) != nullptr;
}

RulePtr OperatorRegistry::retrieve_rule(Operator op,
                                        const Signature &signature) {
    auto it = rules_.find(op);
    if (it == rules_.end())
        throw OperatorNotFound(to_string(op));
    RulePtr rule = find_rule(op, signature);
    if (!rule)
        throw OperatorSignatureNotFound(signature_names(signature));
    if (rule->signature != signature)
        it->second.cache.emplace(signature, rule);
    return rule;
}

void OperatorRegistry::insert_rule(OperatorRules &rules, RulePtr rule) {
    // Re-registering a signature replaces the rule in place
    auto it = std::find_if(rules.declared.begin(), rules.declared.end(),
                           [&](const RulePtr &r) {
                               return r->signature == rule->signature;
                           });
    if (it != rules.declared.end())
        *it = rule;
    else
        rules.declared.push_back(rule);
    Signature signature = rule->signature;
    rules.exact[signature] = std::move(rule);
}

void OperatorRegistry::add_rule(Operator op, const Signature &signature,
                                LayerOperatorFunc fn, bool commutative) {
    if (signature.empty())
        throw ValueError::invalid_rule("it has no layer operands");
    if (!fn)
        throw ValueError::invalid_rule("it is empty");

    OperatorRules &rules = rules_[op];
    // Earlier subkind resolutions may now resolve differently
    rules.cache.clear();

    auto rule = std::make_shared<OperatorRule>(
        OperatorRule{signature, fn});
    insert_rule(rules, rule);

    if (commutative && signature.size() == 2 && signature[0] != signature[1]) {
        LayerOperatorFunc mirrored =
            [fn](const std::vector<const SymbolicLayer *> &ops,
                 const nlohmann::json &kwargs) {
                return fn({ops.at(1), ops.at(0)}, kwargs);
            };
        insert_rule(rules,
                    std::make_shared<OperatorRule>(OperatorRule{
                        {signature[1], signature[0]}, std::move(mirrored)}));
    }
}

} // namespace symbolic
} // namespace pcflow
