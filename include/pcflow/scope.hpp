#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

namespace pcflow {

// An immutable set of variable indices, stored sorted and deduplicated.
//
// Scopes are ordered by size first and then lexicographically, so that a
// strict subset always compares smaller than its superset.
class Scope {
  public:
    using const_iterator = std::vector<size_t>::const_iterator;

    Scope() = default;
    Scope(std::initializer_list<size_t> vars);
    explicit Scope(std::vector<size_t> vars);

    // Scope {0, 1, ..., n - 1}
    static Scope range(size_t n);

    size_t size() const { return vars_.size(); }
    bool empty() const { return vars_.empty(); }
    const std::vector<size_t> &vars() const { return vars_; }

    const_iterator begin() const { return vars_.begin(); }
    const_iterator end() const { return vars_.end(); }

    bool contains(size_t var) const;
    bool is_subset_of(const Scope &other) const;
    bool is_disjoint(const Scope &other) const;

    Scope operator|(const Scope &other) const;
    Scope operator&(const Scope &other) const;
    Scope operator-(const Scope &other) const;

    bool operator==(const Scope &other) const { return vars_ == other.vars_; }
    bool operator!=(const Scope &other) const { return vars_ != other.vars_; }
    bool operator<(const Scope &other) const;

    std::string to_string() const;

  private:
    std::vector<size_t> vars_;
};

std::ostream &operator<<(std::ostream &os, const Scope &scope);

struct ScopeHash {
    size_t operator()(const Scope &scope) const;
};

} // namespace pcflow
