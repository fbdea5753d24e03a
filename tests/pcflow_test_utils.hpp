#pragma once

#include <gtest/gtest.h>
#include <pcflow/pcflow.hpp>

#include <algorithm>
#include <memory>
#include <vector>

namespace pcflow {
namespace testing {

// ============================================================================
// Global environment: every test starts with a clean tracer
// ============================================================================

class PcflowEnvironment : public ::testing::Environment {
  public:
    void SetUp() override {
        trace::clear();
        trace::disable();
    }
};

// ============================================================================
// Circuit builders
// ============================================================================

// CP circuit over a quad graph, as used by most compiler tests
inline symbolic::CircuitPtr
make_cp_circuit(const RegionGraph &rg, size_t num_input_units = 3,
                size_t num_sum_units = 2, size_t num_categories = 2) {
    symbolic::CircuitOptions options;
    options.num_input_units = num_input_units;
    options.num_sum_units = num_sum_units;
    return symbolic::SymbolicCircuit::from_region_graph(
        rg, symbolic::SumProduct::CP,
        symbolic::categorical_factory(num_categories),
        symbolic::mixing_factory(), options);
}

inline symbolic::CircuitPtr make_gaussian_circuit(const RegionGraph &rg,
                                                  size_t num_input_units = 2,
                                                  size_t num_sum_units = 2) {
    symbolic::CircuitOptions options;
    options.num_input_units = num_input_units;
    options.num_sum_units = num_sum_units;
    return symbolic::SymbolicCircuit::from_region_graph(
        rg, symbolic::SumProduct::CP, symbolic::gaussian_factory(),
        symbolic::mixing_factory(), options);
}

// Region graph {0, 1} = {0} x {1}
inline RegionGraph make_two_variable_rg() {
    RegionGraphBuilder builder;
    NodeId root = builder.add_region(Scope{0, 1});
    NodeId a = builder.add_region(Scope{0});
    NodeId b = builder.add_region(Scope{1});
    builder.add_partitioning(root, {a, b});
    return builder.build();
}

// ============================================================================
// Structural checks
// ============================================================================

inline size_t position_of(const std::vector<symbolic::LayerId> &ordering,
                          symbolic::LayerId id) {
    auto it = std::find(ordering.begin(), ordering.end(), id);
    return static_cast<size_t>(it - ordering.begin());
}

// Every producer comes strictly before its consumers
inline void ExpectTopological(const symbolic::SymbolicCircuit &sc,
                              const std::vector<symbolic::LayerId> &ordering) {
    for (symbolic::LayerId id : ordering) {
        size_t pos = position_of(ordering, id);
        for (symbolic::LayerId in : sc.layer_inputs(id)) {
            size_t in_pos = position_of(ordering, in);
            ASSERT_LT(in_pos, ordering.size())
                << "layer " << in << " is missing from the ordering";
            EXPECT_LT(in_pos, pos)
                << "layer " << in << " must precede layer " << id;
        }
    }
}

// One entry per layer plus the outputs entry; entries only refer to
// layers materialized before them
inline void ExpectBookkeepingValid(const backend::CompiledCircuit &cc) {
    const auto &bookkeeping = cc.bookkeeping();
    ASSERT_EQ(bookkeeping.size(), cc.num_layers() + 1);
    for (size_t i = 0; i < cc.num_layers(); ++i) {
        for (size_t in : bookkeeping[i].inputs)
            EXPECT_LT(in, i) << "entry " << i << " refers to " << in;
        if (bookkeeping[i].inputs.empty())
            EXPECT_TRUE(bookkeeping[i].scope_indices.has_value());
    }
    EXPECT_EQ(cc.output_indices().size(),
              cc.symbolic_circuit()->output_layers().size());
    for (size_t out : cc.output_indices())
        EXPECT_LT(out, cc.num_layers());
}

} // namespace testing
} // namespace pcflow
