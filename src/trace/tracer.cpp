/// @file tracer.cpp
/// @brief Instrumentation entry point

#include "tracer.h"

#include <exception>
#include <utility>

#include "src/common/logging.h"

namespace tracekeep::trace {

Tracer::Tracer(std::shared_ptr<sampling::Sampler> sampler,
               std::shared_ptr<SpanProcessor> processor)
    : sampler_(std::move(sampler)), processor_(std::move(processor)) {
    if (!sampler_) {
        sampler_ = std::make_shared<sampling::AlwaysOnSampler>();
    }
}

absl::Status Tracer::Trace(const OperationOptions& options, const Operation& operation) {
    SamplingContext sampling_context;
    sampling_context.operation_name = options.name;
    sampling_context.invocation_id = InvocationId::Next();
    sampling_context.metadata = options.metadata;
    sampling_context.links = options.links;

    const bool sampled = sampler_->ShouldSample(sampling_context);

    if (!sampled) {
        if (sampler_->NeedsTailSampling()) {
            sampler_->Discard(sampling_context);
        }
        // Non-recording span: callers may still propagate its context
        Span span = StartSpan(options, sampling_context, false);
        return operation(span);
    }

    Span span = StartSpan(options, sampling_context, true);
    if (processor_) {
        processor_->OnStart(span, options.parent.value_or(SpanContext{}));
    }

    absl::Status status;
    try {
        status = operation(span);
    } catch (const std::exception& e) {
        span.status.code = StatusCode::kError;
        span.status.message = e.what();
        EndSpan(std::move(span));
        throw;
    } catch (...) {
        span.status.code = StatusCode::kError;
        span.status.message = "unknown exception";
        EndSpan(std::move(span));
        throw;
    }

    if (status.ok()) {
        span.status.code = StatusCode::kOk;
    } else {
        span.status.code = StatusCode::kError;
        span.status.message = std::string(status.message());
    }
    EndSpan(std::move(span));
    return status;
}

Span Tracer::StartSpan(const OperationOptions& options,
                       const SamplingContext& sampling_context,
                       bool recording) const {
    Span span;
    span.name = options.name;
    span.kind = options.kind;
    span.attributes = options.attributes;
    span.links = options.links;

    if (options.parent.has_value() && options.parent->IsValid()) {
        span.context.trace_id = options.parent->trace_id;
        span.context.trace_state = options.parent->trace_state;
        span.parent_span_id = options.parent->span_id;
    } else {
        span.context.trace_id = GenerateTraceId();
    }
    span.context.span_id = GenerateSpanId();
    span.context.trace_flags = recording ? kTraceFlagsSampled : kTraceFlagsNone;
    span.context.is_remote = false;

    if (recording) {
        span.sampling = sampling_context;
    }
    span.start_time_ns = NowNanos();
    return span;
}

void Tracer::EndSpan(Span&& span) {
    span.end_time_ns = NowNanos();
    if (processor_) {
        processor_->OnEnd(std::move(span));
    } else {
        TRACEKEEP_LOG_DEBUG("No span processor configured, span '{}' not exported", span.name);
    }
}

}  // namespace tracekeep::trace
