#include "pcflow_test_utils.hpp"

using namespace pcflow;

namespace {

std::vector<trace::TraceEvent> events_named(const std::string &name) {
    std::vector<trace::TraceEvent> result;
    for (const auto &event : trace::Tracer::instance().events()) {
        if (event.op_name == name)
            result.push_back(event);
    }
    return result;
}

} // namespace

class TraceTest : public ::testing::Test {
  protected:
    void SetUp() override {
        trace::clear();
        trace::enable();
    }
    void TearDown() override {
        trace::disable();
        trace::clear();
    }
};

TEST_F(TraceTest, DisabledRecordsNothing) {
    trace::disable();
    pcflow::testing::make_cp_circuit(templates::quad_graph(2, 2));
    EXPECT_TRUE(trace::Tracer::instance().events().empty());
}

TEST_F(TraceTest, CircuitConstruction) {
    auto sc = pcflow::testing::make_cp_circuit(templates::quad_graph(3, 3));
    auto events = events_named("from_region_graph");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].num_layers, sc->num_layers());
}

TEST_F(TraceTest, Compilation) {
    auto sc = pcflow::testing::make_cp_circuit(templates::quad_graph(3, 3));
    backend::PipelineContext ctx;
    auto cc = ctx.compile(sc);
    ctx.integrate(cc);

    auto circuits = events_named("compile_circuit");
    ASSERT_EQ(circuits.size(), 2u);
    EXPECT_EQ(circuits[0].num_layers, sc->num_layers());
    EXPECT_EQ(circuits[0].description, "");
    EXPECT_EQ(circuits[1].description, "integration");

    auto pipelines = events_named("compile_pipeline");
    ASSERT_EQ(pipelines.size(), 2u);
    EXPECT_EQ(pipelines[0].num_layers, sc->num_layers());

    auto integrals = events_named("integrate");
    ASSERT_EQ(integrals.size(), 1u);
    EXPECT_EQ(integrals[0].num_layers, sc->num_layers());
}

TEST_F(TraceTest, NestedStepsEndFirst) {
    auto sc = pcflow::testing::make_cp_circuit(templates::quad_graph(2, 2));
    backend::compile_pipeline({sc});

    auto events = trace::Tracer::instance().events();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[events.size() - 2].op_name, "compile_circuit");
    EXPECT_EQ(events.back().op_name, "compile_pipeline");
}

TEST_F(TraceTest, FailedStepsAreStillRecorded) {
    auto sc = pcflow::testing::make_cp_circuit(templates::fully_factorized(3));
    backend::PipelineContext ctx;
    EXPECT_THROW(ctx.compile(sc), StructuralError);
    EXPECT_EQ(events_named("compile_circuit").size(), 1u);
    EXPECT_EQ(events_named("compile_circuit")[0].num_layers, 0u);
}

TEST_F(TraceTest, Dump) {
    auto sc = pcflow::testing::make_cp_circuit(templates::quad_graph(2, 2));
    backend::compile_pipeline({sc});
    std::string dump = trace::dump();
    EXPECT_NE(dump.find("compile_circuit"), std::string::npos);
    EXPECT_NE(dump.find("Total layers"), std::string::npos);

    trace::clear();
    EXPECT_TRUE(trace::Tracer::instance().events().empty());
}
