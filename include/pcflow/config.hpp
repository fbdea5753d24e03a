#pragma once

#include <cstddef>

namespace pcflow {
namespace config {

// Environment variable to enable the tracer at startup
// Set PCFLOW_TRACE=1 to record compilation events
bool trace_from_env();

// Largest partition arity accepted by the compiled backend. Symbolic
// circuits accept any arity; executable product layers do not.
// Read once from PCFLOW_MAX_PARTITION_ARITY (default 2).
size_t max_partition_arity();
void set_max_partition_arity(size_t arity);

// RAII helper to temporarily override the partition arity bound in a scope
class PartitionArityScope {
  public:
    explicit PartitionArityScope(size_t arity);
    ~PartitionArityScope();

    PartitionArityScope(const PartitionArityScope &) = delete;
    PartitionArityScope &operator=(const PartitionArityScope &) = delete;

  private:
    size_t previous_;
};

} // namespace config
} // namespace pcflow
