#pragma once

/// @file tail_sampling_processor.h
/// @brief Span processor that defers export until the tail decision is known

#include <atomic>
#include <cstdint>
#include <memory>

#include <absl/status/status.h>

#include "sampler.h"
#include "src/trace/types.h"

namespace tracekeep::sampling {

/// Attributes set on spans kept by a tail decision
inline constexpr const char* kTailEvaluatedAttribute = "sampling.tail.evaluated";
inline constexpr const char* kTailKeepAttribute = "sampling.tail.keep";

/// Statistics for the tail-sampling processor
struct TailSamplingStats {
    std::atomic<uint64_t> spans_started{0};
    std::atomic<uint64_t> spans_forwarded{0};
    std::atomic<uint64_t> spans_dropped{0};
    std::atomic<uint64_t> spans_without_context{0};
};

/// Wraps a downstream span processor and filters finished spans through the
/// sampler's tail decision.
///
/// OnStart is always forwarded so trace topology is never altered; only export
/// is affected. Dropped spans are discarded entirely. The processor buffers
/// nothing of its own.
class TailSamplingProcessor : public trace::SpanProcessor {
public:
    TailSamplingProcessor(std::shared_ptr<Sampler> sampler,
                          std::shared_ptr<trace::SpanProcessor> downstream);

    // Non-copyable, non-movable
    TailSamplingProcessor(const TailSamplingProcessor&) = delete;
    TailSamplingProcessor& operator=(const TailSamplingProcessor&) = delete;

    void OnStart(trace::Span& span, const trace::SpanContext& parent_context) override;
    void OnEnd(trace::Span&& span) override;
    absl::Status ForceFlush() override;
    absl::Status Shutdown() override;

    const TailSamplingStats& GetStats() const { return stats_; }

private:
    std::shared_ptr<Sampler> sampler_;
    std::shared_ptr<trace::SpanProcessor> downstream_;
    TailSamplingStats stats_;
};

}  // namespace tracekeep::sampling
