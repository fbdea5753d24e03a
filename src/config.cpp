#include "pcflow/config.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

namespace pcflow {
namespace config {

namespace {

size_t arity_from_env() {
    const char *env = std::getenv("PCFLOW_MAX_PARTITION_ARITY");
    if (env == nullptr)
        return 2;
    char *end = nullptr;
    unsigned long value = std::strtoul(env, &end, 10);
    if (end == env || value < 2)
        return 2;
    return static_cast<size_t>(value);
}

// Zero means "not yet initialized from the environment"
std::atomic<size_t> g_max_partition_arity{0};

} // namespace

bool trace_from_env() {
    // Check environment variable once (thread-safe static init per C++11)
    static const bool env_trace = [] {
        const char *env = std::getenv("PCFLOW_TRACE");
        return env != nullptr && std::string(env) == "1";
    }();
    return env_trace;
}

size_t max_partition_arity() {
    size_t value = g_max_partition_arity.load(std::memory_order_relaxed);
    if (value == 0) {
        value = arity_from_env();
        g_max_partition_arity.store(value, std::memory_order_relaxed);
    }
    return value;
}

void set_max_partition_arity(size_t arity) {
    g_max_partition_arity.store(arity < 2 ? 2 : arity,
                                std::memory_order_relaxed);
}

PartitionArityScope::PartitionArityScope(size_t arity)
    : previous_(max_partition_arity()) {
    set_max_partition_arity(arity);
}

PartitionArityScope::~PartitionArityScope() {
    set_max_partition_arity(previous_);
}

} // namespace config
} // namespace pcflow
