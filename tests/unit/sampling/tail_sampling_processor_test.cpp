/// @file tail_sampling_processor_test.cpp
/// @brief Unit tests for the tail-sampling span processor

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "src/sampling/adaptive_sampler.h"
#include "src/sampling/tail_sampling_processor.h"

namespace tracekeep::sampling {
namespace {

using ::testing::_;
using ::testing::Return;

/// Downstream processor recording everything it receives
class RecordingProcessor : public trace::SpanProcessor {
public:
    void OnStart(trace::Span& span, const trace::SpanContext& parent_context) override {
        started.push_back(span.name);
    }

    void OnEnd(trace::Span&& span) override { ended.push_back(std::move(span)); }

    absl::Status ForceFlush() override {
        ++flushes;
        return absl::OkStatus();
    }

    absl::Status Shutdown() override {
        ++shutdowns;
        return absl::OkStatus();
    }

    std::vector<std::string> started;
    std::vector<trace::Span> ended;
    int flushes = 0;
    int shutdowns = 0;
};

class MockSpanProcessor : public trace::SpanProcessor {
public:
    MOCK_METHOD(void, OnStart, (trace::Span&, const trace::SpanContext&), (override));
    MOCK_METHOD(void, OnEnd, (trace::Span &&), (override));
    MOCK_METHOD(absl::Status, ForceFlush, (), (override));
    MOCK_METHOD(absl::Status, Shutdown, (), (override));
};

class TailSamplingProcessorTest : public ::testing::Test {
protected:
    void SetUp() override { downstream_ = std::make_shared<RecordingProcessor>(); }

    std::shared_ptr<AdaptiveSampler> MakeAdaptive(double baseline) {
        AdaptiveSamplerOptions options;
        options.baseline_sample_rate = baseline;
        options.slow_threshold_ms = 100.0;
        auto sampler = AdaptiveSampler::Create(options);
        EXPECT_TRUE(sampler.ok());
        return std::move(*sampler);
    }

    /// Build a finished span that went through head sampling on `sampler`
    trace::Span FinishedSpan(Sampler& sampler, const std::string& name, bool failed,
                             double duration_ms) {
        trace::SamplingContext context;
        context.operation_name = name;
        context.invocation_id = trace::InvocationId::Next();
        sampler.ShouldSample(context);

        trace::Span span;
        span.name = name;
        span.context.trace_id = trace::GenerateTraceId();
        span.context.span_id = trace::GenerateSpanId();
        span.context.trace_flags = trace::kTraceFlagsSampled;
        span.start_time_ns = 1'000'000'000;
        span.end_time_ns = span.start_time_ns + static_cast<uint64_t>(duration_ms * 1e6);
        span.status.code = failed ? trace::StatusCode::kError : trace::StatusCode::kOk;
        span.sampling = context;
        return span;
    }

    std::shared_ptr<RecordingProcessor> downstream_;
};

TEST_F(TailSamplingProcessorTest, OnStartAlwaysForwarded) {
    auto sampler = MakeAdaptive(0.0);
    TailSamplingProcessor processor(sampler, downstream_);

    trace::Span span;
    span.name = "root";
    processor.OnStart(span, trace::SpanContext{});

    ASSERT_EQ(downstream_->started.size(), 1);
    EXPECT_EQ(downstream_->started[0], "root");
    EXPECT_EQ(processor.GetStats().spans_started.load(), 1);
}

TEST_F(TailSamplingProcessorTest, DropsFastSuccessWithZeroBaseline) {
    auto sampler = MakeAdaptive(0.0);
    TailSamplingProcessor processor(sampler, downstream_);

    processor.OnEnd(FinishedSpan(*sampler, "fast", false, 5.0));

    EXPECT_TRUE(downstream_->ended.empty());
    EXPECT_EQ(processor.GetStats().spans_dropped.load(), 1);
    EXPECT_EQ(sampler->PendingCount(), 0);
}

TEST_F(TailSamplingProcessorTest, KeepsErrorsAndMarksSpan) {
    auto sampler = MakeAdaptive(0.0);
    TailSamplingProcessor processor(sampler, downstream_);

    processor.OnEnd(FinishedSpan(*sampler, "failing", true, 5.0));

    ASSERT_EQ(downstream_->ended.size(), 1);
    const auto& attributes = downstream_->ended[0].attributes;
    ASSERT_EQ(attributes.count(kTailEvaluatedAttribute), 1);
    EXPECT_EQ(std::get<bool>(attributes.at(kTailEvaluatedAttribute)), true);
    EXPECT_EQ(std::get<bool>(attributes.at(kTailKeepAttribute)), true);
    EXPECT_EQ(processor.GetStats().spans_forwarded.load(), 1);
}

TEST_F(TailSamplingProcessorTest, KeepsSlowSpans) {
    auto sampler = MakeAdaptive(0.0);
    TailSamplingProcessor processor(sampler, downstream_);

    processor.OnEnd(FinishedSpan(*sampler, "slow", false, 150.0));
    processor.OnEnd(FinishedSpan(*sampler, "fast", false, 50.0));

    ASSERT_EQ(downstream_->ended.size(), 1);
    EXPECT_EQ(downstream_->ended[0].name, "slow");
}

TEST_F(TailSamplingProcessorTest, HeadOnlySamplerForwardsUnchanged) {
    auto sampler = std::make_shared<AlwaysOnSampler>();
    TailSamplingProcessor processor(sampler, downstream_);

    processor.OnEnd(FinishedSpan(*sampler, "plain", false, 5.0));

    ASSERT_EQ(downstream_->ended.size(), 1);
    EXPECT_EQ(downstream_->ended[0].attributes.count(kTailEvaluatedAttribute), 0);
}

TEST_F(TailSamplingProcessorTest, SpanWithoutSamplingContextIsForwarded) {
    auto sampler = MakeAdaptive(0.0);
    TailSamplingProcessor processor(sampler, downstream_);

    trace::Span span;
    span.name = "foreign";
    processor.OnEnd(std::move(span));

    ASSERT_EQ(downstream_->ended.size(), 1);
    EXPECT_EQ(processor.GetStats().spans_without_context.load(), 1);
}

TEST_F(TailSamplingProcessorTest, NullSamplerBehavesAsAlwaysOn) {
    TailSamplingProcessor processor(nullptr, downstream_);

    trace::Span span;
    span.name = "any";
    processor.OnEnd(std::move(span));

    EXPECT_EQ(downstream_->ended.size(), 1);
}

TEST_F(TailSamplingProcessorTest, FlushAndShutdownPassThrough) {
    TailSamplingProcessor processor(MakeAdaptive(0.1), downstream_);

    EXPECT_TRUE(processor.ForceFlush().ok());
    EXPECT_TRUE(processor.Shutdown().ok());
    EXPECT_EQ(downstream_->flushes, 1);
    EXPECT_EQ(downstream_->shutdowns, 1);
}

TEST_F(TailSamplingProcessorTest, DownstreamErrorsPropagate) {
    auto mock = std::make_shared<MockSpanProcessor>();
    EXPECT_CALL(*mock, ForceFlush()).WillOnce(Return(absl::UnavailableError("exporter down")));
    EXPECT_CALL(*mock, Shutdown()).WillOnce(Return(absl::OkStatus()));
    EXPECT_CALL(*mock, OnEnd(_)).Times(0);

    auto sampler = MakeAdaptive(0.0);
    TailSamplingProcessor processor(sampler, mock);

    processor.OnEnd(FinishedSpan(*sampler, "dropped", false, 1.0));
    EXPECT_EQ(processor.ForceFlush().code(), absl::StatusCode::kUnavailable);
    EXPECT_TRUE(processor.Shutdown().ok());
}

TEST_F(TailSamplingProcessorTest, NoDownstreamIsHarmless) {
    auto sampler = MakeAdaptive(1.0);
    TailSamplingProcessor processor(sampler, nullptr);

    processor.OnEnd(FinishedSpan(*sampler, "kept", false, 1.0));
    EXPECT_EQ(processor.GetStats().spans_forwarded.load(), 1);
    EXPECT_TRUE(processor.ForceFlush().ok());
    EXPECT_TRUE(processor.Shutdown().ok());
}

}  // namespace
}  // namespace tracekeep::sampling
