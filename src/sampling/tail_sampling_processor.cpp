/// @file tail_sampling_processor.cpp
/// @brief Tail-sampling span processor

#include "tail_sampling_processor.h"

#include <utility>

#include "src/common/logging.h"

namespace tracekeep::sampling {

TailSamplingProcessor::TailSamplingProcessor(
    std::shared_ptr<Sampler> sampler,
    std::shared_ptr<trace::SpanProcessor> downstream)
    : sampler_(std::move(sampler)), downstream_(std::move(downstream)) {
    if (!sampler_) {
        sampler_ = std::make_shared<AlwaysOnSampler>();
    }
}

void TailSamplingProcessor::OnStart(trace::Span& span,
                                    const trace::SpanContext& parent_context) {
    stats_.spans_started++;
    if (downstream_) {
        downstream_->OnStart(span, parent_context);
    }
}

void TailSamplingProcessor::OnEnd(trace::Span&& span) {
    if (sampler_->NeedsTailSampling()) {
        if (!span.sampling.has_value()) {
            // No per-call handle to resolve against; export rather than lose it
            stats_.spans_without_context++;
            TRACEKEEP_LOG_DEBUG("Tail sampling: span '{}' has no sampling context, forwarding",
                                span.name);
        } else {
            const bool keep =
                sampler_->ShouldKeepTrace(trace::SamplingContextOf(span), trace::ResultOf(span));
            if (!keep) {
                stats_.spans_dropped++;
                TRACEKEEP_LOG_TRACE("Tail sampling: dropped span '{}' trace_id={}",
                                    span.name, span.context.trace_id);
                return;
            }
            span.attributes[kTailEvaluatedAttribute] = true;
            span.attributes[kTailKeepAttribute] = true;
        }
    }

    stats_.spans_forwarded++;
    if (downstream_) {
        downstream_->OnEnd(std::move(span));
    }
}

absl::Status TailSamplingProcessor::ForceFlush() {
    if (!downstream_) {
        return absl::OkStatus();
    }
    return downstream_->ForceFlush();
}

absl::Status TailSamplingProcessor::Shutdown() {
    TRACEKEEP_LOG_INFO("Tail sampling processor shutting down. Stats: started={}, "
                       "forwarded={}, dropped={}",
                       stats_.spans_started.load(), stats_.spans_forwarded.load(),
                       stats_.spans_dropped.load());
    if (!downstream_) {
        return absl::OkStatus();
    }
    return downstream_->Shutdown();
}

}  // namespace tracekeep::sampling
