/// @file pipeline_test.cpp
/// @brief Integration tests for the tracer, sampling and propagation pipeline

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "src/common/config.h"
#include "src/propagation/batch_links.h"
#include "src/propagation/extractor.h"
#include "src/sampling/adaptive_sampler.h"
#include "src/sampling/sampler_factory.h"
#include "src/sampling/tail_sampling_processor.h"
#include "src/trace/tracer.h"

namespace tracekeep {
namespace {

// =============================================================================
// Test Exporter
// =============================================================================

/// Terminal processor collecting exported spans
class CollectingExporter : public trace::SpanProcessor {
public:
    void OnStart(trace::Span&, const trace::SpanContext&) override {}

    void OnEnd(trace::Span&& span) override {
        std::lock_guard<std::mutex> lock(mutex_);
        spans_.push_back(std::move(span));
    }

    absl::Status ForceFlush() override { return absl::OkStatus(); }
    absl::Status Shutdown() override { return absl::OkStatus(); }

    std::vector<trace::Span> Spans() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spans_;
    }

private:
    std::vector<trace::Span> spans_;
    mutable std::mutex mutex_;
};

class PipelineTest : public ::testing::Test {
protected:
    void Build(std::shared_ptr<sampling::Sampler> sampler) {
        exporter_ = std::make_shared<CollectingExporter>();
        processor_ = std::make_shared<sampling::TailSamplingProcessor>(sampler, exporter_);
        tracer_ = std::make_unique<trace::Tracer>(sampler, processor_);
    }

    std::shared_ptr<sampling::AdaptiveSampler> MakeAdaptive(
        sampling::AdaptiveSamplerOptions options) {
        auto sampler = sampling::AdaptiveSampler::Create(options);
        EXPECT_TRUE(sampler.ok()) << sampler.status();
        return std::shared_ptr<sampling::AdaptiveSampler>(std::move(*sampler));
    }

    std::shared_ptr<CollectingExporter> exporter_;
    std::shared_ptr<sampling::TailSamplingProcessor> processor_;
    std::unique_ptr<trace::Tracer> tracer_;
};

// =============================================================================
// Tail sampling end to end
// =============================================================================

TEST_F(PipelineTest, FailedOperationExportedFastSuccessDropped) {
    sampling::AdaptiveSamplerOptions options;
    options.baseline_sample_rate = 0.0;
    options.always_sample_errors = true;
    auto adaptive = MakeAdaptive(options);
    Build(adaptive);

    trace::OperationOptions failing;
    failing.name = "checkout";
    EXPECT_THROW(tracer_
                     ->Trace(failing,
                             [](trace::Span&) -> absl::Status {
                                 throw std::runtime_error("card declined");
                             })
                     .IgnoreError(),
                 std::runtime_error);

    trace::OperationOptions fast;
    fast.name = "healthcheck";
    EXPECT_TRUE(tracer_->Trace(fast, [](trace::Span&) { return absl::OkStatus(); }).ok());

    auto spans = exporter_->Spans();
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].name, "checkout");
    EXPECT_EQ(spans[0].status.code, trace::StatusCode::kError);
    EXPECT_EQ(spans[0].status.message, "card declined");
    EXPECT_TRUE(std::get<bool>(spans[0].attributes.at(sampling::kTailKeepAttribute)));

    const auto& stats = processor_->GetStats();
    EXPECT_EQ(stats.spans_forwarded.load(), 1);
    EXPECT_EQ(stats.spans_dropped.load(), 1);
    EXPECT_EQ(adaptive->PendingCount(), 0);
}

TEST_F(PipelineTest, NonStandardThrowStillCompletes) {
    sampling::AdaptiveSamplerOptions options;
    options.baseline_sample_rate = 0.0;
    auto adaptive = MakeAdaptive(options);
    Build(adaptive);

    trace::OperationOptions op;
    op.name = "legacy-call";
    EXPECT_THROW(
        tracer_->Trace(op, [](trace::Span&) -> absl::Status { throw 42; }).IgnoreError(), int);

    auto spans = exporter_->Spans();
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].status.code, trace::StatusCode::kError);
    EXPECT_EQ(adaptive->PendingCount(), 0);
    EXPECT_EQ(processor_->GetStats().spans_forwarded.load(), 1);
}

TEST_F(PipelineTest, ErrorStatusCountsAsFailure) {
    sampling::AdaptiveSamplerOptions options;
    options.baseline_sample_rate = 0.0;
    Build(MakeAdaptive(options));

    trace::OperationOptions op;
    op.name = "lookup";
    absl::Status status =
        tracer_->Trace(op, [](trace::Span&) { return absl::NotFoundError("no such user"); });

    EXPECT_EQ(status.code(), absl::StatusCode::kNotFound);
    auto spans = exporter_->Spans();
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].status.message, "no such user");
}

TEST_F(PipelineTest, ConfiguredSamplerDrivesPipeline) {
    auto config = Config::LoadFromString(R"(
sampling:
  strategy: adaptive
  sample_rate: 0.0
  fail_open: true
  adaptive:
    always_sample_errors: false
    always_sample_slow: true
    slow_threshold_ms: 1000
)");
    ASSERT_TRUE(config.ok()) << config.status();

    auto sampler_config = sampling::SamplerConfig::FromConfig(*config);
    ASSERT_TRUE(sampler_config.ok()) << sampler_config.status();
    auto sampler = sampling::CreateSampler(*sampler_config);
    ASSERT_TRUE(sampler.ok()) << sampler.status();
    EXPECT_TRUE((*sampler)->NeedsTailSampling());
    Build(*sampler);

    trace::OperationOptions op;
    op.name = "fails-quietly";
    EXPECT_FALSE(
        tracer_->Trace(op, [](trace::Span&) { return absl::InternalError("boom"); }).ok());

    // Errors are not kept and the baseline keeps nothing
    EXPECT_TRUE(exporter_->Spans().empty());
    EXPECT_EQ(processor_->GetStats().spans_dropped.load(), 1);
}

// =============================================================================
// Propagation into the tracer
// =============================================================================

TEST_F(PipelineTest, ExtractedParentContinuesTrace) {
    Build(std::make_shared<sampling::AlwaysOnSampler>());

    auto extractor = propagation::CreateExtractor(propagation::PropagationConfig{{"b3", "w3c"}});
    ASSERT_TRUE(extractor.ok()) << extractor.status();

    trace::OperationOptions op;
    op.name = "handle-request";
    op.kind = trace::SpanKind::kServer;
    op.parent = (*extractor)->Extract(
        {{"traceparent", "00-0af7651916cd43dd8448eb211c80319c-b7ad6b7169203331-01"}});
    ASSERT_TRUE(op.parent.has_value());

    EXPECT_TRUE(tracer_->Trace(op, [](trace::Span&) { return absl::OkStatus(); }).ok());

    auto spans = exporter_->Spans();
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].context.trace_id, "0af7651916cd43dd8448eb211c80319c");
    EXPECT_EQ(spans[0].parent_span_id, "b7ad6b7169203331");
    EXPECT_NE(spans[0].context.span_id, "b7ad6b7169203331");
    EXPECT_FALSE(spans[0].context.is_remote);
}

TEST_F(PipelineTest, BatchLinksKeepConsumerSpan) {
    sampling::AdaptiveSamplerOptions options;
    options.baseline_sample_rate = 0.0;
    options.links_based = true;
    options.links_sample_rate = 1.0;
    Build(MakeAdaptive(options));

    std::vector<propagation::HeaderMap> batch = {
        {{"traceparent", "00-0af7651916cd43dd8448eb211c80319c-b7ad6b7169203331-01"}},
        {},
        {{"traceparent", "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01"}},
    };

    trace::OperationOptions op;
    op.name = "consume-batch";
    op.kind = trace::SpanKind::kConsumer;
    op.links = propagation::ExtractLinksFromHeaderBatch(batch);
    op.attributes = propagation::BatchLinkAttributes(batch.size());
    ASSERT_EQ(op.links.size(), 2);

    EXPECT_TRUE(tracer_->Trace(op, [](trace::Span&) { return absl::OkStatus(); }).ok());

    trace::OperationOptions unlinked;
    unlinked.name = "consume-empty";
    EXPECT_TRUE(tracer_->Trace(unlinked, [](trace::Span&) { return absl::OkStatus(); }).ok());

    auto spans = exporter_->Spans();
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].name, "consume-batch");
    ASSERT_EQ(spans[0].links.size(), 2);
    EXPECT_EQ(spans[0].links[1].context.trace_id, "4bf92f3577b34da6a3ce929d0e0e4736");
    EXPECT_EQ(std::get<int64_t>(
                  spans[0].attributes.at(propagation::kBatchMessageCountAttribute)),
              3);
}

}  // namespace
}  // namespace tracekeep
