#include "pcflow/scope.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <sstream>

namespace pcflow {

Scope::Scope(std::initializer_list<size_t> vars)
    : Scope(std::vector<size_t>(vars)) {}

Scope::Scope(std::vector<size_t> vars) : vars_(std::move(vars)) {
    std::sort(vars_.begin(), vars_.end());
    vars_.erase(std::unique(vars_.begin(), vars_.end()), vars_.end());
}

Scope Scope::range(size_t n) {
    std::vector<size_t> vars(n);
    for (size_t i = 0; i < n; ++i)
        vars[i] = i;
    return Scope(std::move(vars));
}

bool Scope::contains(size_t var) const {
    return std::binary_search(vars_.begin(), vars_.end(), var);
}

bool Scope::is_subset_of(const Scope &other) const {
    return std::includes(other.vars_.begin(), other.vars_.end(),
                         vars_.begin(), vars_.end());
}

bool Scope::is_disjoint(const Scope &other) const {
    auto a = vars_.begin();
    auto b = other.vars_.begin();
    while (a != vars_.end() && b != other.vars_.end()) {
        if (*a == *b)
            return false;
        if (*a < *b)
            ++a;
        else
            ++b;
    }
    return true;
}

Scope Scope::operator|(const Scope &other) const {
    std::vector<size_t> out;
    std::set_union(vars_.begin(), vars_.end(), other.vars_.begin(),
                   other.vars_.end(), std::back_inserter(out));
    return Scope(std::move(out));
}

Scope Scope::operator&(const Scope &other) const {
    std::vector<size_t> out;
    std::set_intersection(vars_.begin(), vars_.end(), other.vars_.begin(),
                          other.vars_.end(), std::back_inserter(out));
    return Scope(std::move(out));
}

Scope Scope::operator-(const Scope &other) const {
    std::vector<size_t> out;
    std::set_difference(vars_.begin(), vars_.end(), other.vars_.begin(),
                        other.vars_.end(), std::back_inserter(out));
    return Scope(std::move(out));
}

bool Scope::operator<(const Scope &other) const {
    if (vars_.size() != other.vars_.size())
        return vars_.size() < other.vars_.size();
    return vars_ < other.vars_;
}

std::string Scope::to_string() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

std::ostream &operator<<(std::ostream &os, const Scope &scope) {
    os << "{";
    for (size_t i = 0; i < scope.size(); ++i) {
        if (i > 0)
            os << ", ";
        os << scope.vars()[i];
    }
    return os << "}";
}

size_t ScopeHash::operator()(const Scope &scope) const {
    // FNV-1a over the sorted variable ids
    uint64_t h = 14695981039346656037ULL;
    for (size_t v : scope) {
        h ^= static_cast<uint64_t>(v);
        h *= 1099511628211ULL;
    }
    return static_cast<size_t>(h);
}

} // namespace pcflow
