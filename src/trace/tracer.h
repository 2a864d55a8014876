#pragma once

/// @file tracer.h
/// @brief Instrumentation entry point tying head and tail sampling to span export

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "src/sampling/sampler.h"
#include "types.h"

namespace tracekeep::trace {

/// Options describing one traced operation
struct OperationOptions {
    std::string name;
    SpanKind kind = SpanKind::kInternal;

    /// Sampling metadata (user id, feature flags, ...)
    Attributes metadata;

    /// Initial span attributes
    Attributes attributes;

    /// Causal links, e.g. from ExtractLinksFromBatch()
    std::vector<Link> links;

    /// Parent context; a new trace is started when absent or invalid
    std::optional<SpanContext> parent;
};

/// Runs operations under a span.
///
/// The sampler and the span processor are injected; nothing is looked up from
/// global state. For each call the tracer allocates an InvocationId, asks the
/// sampler for the head decision, and when tracing reports the outcome through
/// the processor, which applies the tail decision.
class Tracer {
public:
    using Operation = std::function<absl::Status(Span&)>;

    Tracer(std::shared_ptr<sampling::Sampler> sampler,
           std::shared_ptr<SpanProcessor> processor);

    /// Run `operation` under a span.
    ///
    /// A non-OK status or an exception marks the span as failed. Exceptions
    /// are rethrown after the span has been ended.
    /// @return The operation's status
    absl::Status Trace(const OperationOptions& options, const Operation& operation);

    const std::shared_ptr<sampling::Sampler>& GetSampler() const { return sampler_; }

private:
    Span StartSpan(const OperationOptions& options, const SamplingContext& sampling_context,
                   bool recording) const;
    void EndSpan(Span&& span);

    std::shared_ptr<sampling::Sampler> sampler_;
    std::shared_ptr<SpanProcessor> processor_;
};

}  // namespace tracekeep::trace
