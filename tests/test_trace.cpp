// Tests for filter invocation tracing

#include "ndfourier_test_utils.hpp"

using namespace ndfourier;
using namespace ndfourier::testing;

class TraceTest : public ::testing::Test {
  protected:
    void SetUp() override {
        trace::enable();
        trace::clear();
    }
    void TearDown() override {
        trace::disable();
        trace::clear();
    }
};

TEST_F(TraceTest, RecordsMaterializedCall) {
    auto input = Tensor::ones({4, 4});
    auto result = fourier::fourier_gaussian(input, 1.0);
    ASSERT_TRUE(result.has_value());

    auto events = trace::Tracer::instance().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].op_name, "fourier_gaussian");
    EXPECT_TRUE(events[0].materialized);
    EXPECT_EQ(events[0].memory_bytes, 16 * sizeof(double));
    EXPECT_EQ(events[0].description, "[4, 4] float64 -> float64");
}

TEST_F(TraceTest, RecordsInPlaceCall) {
    auto spectrum = Tensor::ones({6}, DType::Complex64);
    fourier::fourier_shift(spectrum, 1.0, 10, 0, spectrum);

    auto events = trace::Tracer::instance().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].op_name, "fourier_shift");
    EXPECT_FALSE(events[0].materialized);
    EXPECT_EQ(events[0].memory_bytes, 0u);
    EXPECT_EQ(events[0].description,
              "[6] complex64 -> complex64 (in place) n=10 axis=0");
}

TEST_F(TraceTest, FailedCallsAreNotRecorded) {
    auto input = Tensor::ones({2, 2, 2, 2});
    EXPECT_THROW(fourier::fourier_ellipsoid(input, 1.0), ShapeError);
    EXPECT_THROW(fourier::fourier_uniform(input, 1.0, -1, 7), IndexError);
    EXPECT_TRUE(trace::Tracer::instance().events().empty());
}

TEST_F(TraceTest, RecordsEveryOperationInOrder) {
    auto input = Tensor::ones({3, 3});
    fourier::fourier_gaussian(input, 1.0);
    fourier::fourier_uniform(input, 1.0);
    fourier::fourier_ellipsoid(input, 1.0);
    fourier::fourier_shift(input, 1.0);

    auto events = trace::Tracer::instance().events();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].op_name, "fourier_gaussian");
    EXPECT_EQ(events[1].op_name, "fourier_uniform");
    EXPECT_EQ(events[2].op_name, "fourier_ellipsoid");
    EXPECT_EQ(events[3].op_name, "fourier_shift");
    EXPECT_EQ(events[3].description, "[3, 3] float64 -> complex128");
}

TEST_F(TraceTest, DumpSummarizesEvents) {
    auto input = Tensor::ones({4});
    fourier::fourier_uniform(input, 2.0);
    fourier::fourier_uniform(input, 2.0, -1, -1, input);

    std::string report = trace::dump();
    EXPECT_NE(report.find("=== ndfourier Trace (2 events) ==="),
              std::string::npos);
    EXPECT_NE(report.find("fourier_uniform"), std::string::npos);
    EXPECT_NE(report.find("Materialized ops: 1 / 2"), std::string::npos);
}

TEST_F(TraceTest, DisabledTracerRecordsNothing) {
    trace::disable();
    EXPECT_FALSE(trace::is_enabled());

    auto input = Tensor::ones({4});
    fourier::fourier_gaussian(input, 1.0);
    EXPECT_TRUE(trace::Tracer::instance().events().empty());
}
