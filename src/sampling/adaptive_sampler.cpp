/// @file adaptive_sampler.cpp
/// @brief Adaptive tail sampler implementation

#include "adaptive_sampler.h"

#include <algorithm>

#include <absl/memory/memory.h>

#include "src/common/error.h"
#include "src/common/logging.h"

namespace tracekeep::sampling {

absl::StatusOr<std::unique_ptr<AdaptiveSampler>> AdaptiveSampler::Create(
    AdaptiveSamplerOptions options) {
    TRACEKEEP_RETURN_IF_ERROR(
        ValidateRate("Baseline sample rate", options.baseline_sample_rate));
    TRACEKEEP_RETURN_IF_ERROR(ValidateRate("Links sample rate", options.links_sample_rate));
    if (options.slow_threshold_ms < 0.0) {
        return absl::InvalidArgumentError("Slow threshold must not be negative");
    }
    return absl::WrapUnique(new AdaptiveSampler(options));
}

bool AdaptiveSampler::ShouldSample(const SamplingContext& context) {
    const bool baseline = RandomUnit() < options_.baseline_sample_rate;

    if (context.invocation_id.IsSet()) {
        std::lock_guard<std::mutex> lock(mutex_);
        baseline_decisions_[context.invocation_id] = baseline;
    } else {
        TRACEKEEP_LOG_WARN("Adaptive sampling: '{}' has no invocation id, baseline not stored",
                           context.operation_name);
    }

    // Creation is never blocked; the decision is made in ShouldKeepTrace()
    return true;
}

bool AdaptiveSampler::ShouldKeepTrace(const SamplingContext& context,
                                      const OperationResult& result) {
    const bool baseline = TakeBaselineDecision(context.invocation_id);

    if (options_.always_sample_errors && !result.success) {
        if (!baseline) {
            TRACEKEEP_LOG_DEBUG("Adaptive sampling: keeping error trace: operation={} error={}",
                                context.operation_name, result.error.value_or(""));
        }
        return true;
    }

    if (options_.always_sample_slow && result.duration_ms >= options_.slow_threshold_ms) {
        if (!baseline) {
            TRACEKEEP_LOG_DEBUG("Adaptive sampling: keeping slow trace: operation={} duration={}ms",
                                context.operation_name, result.duration_ms);
        }
        return true;
    }

    if (options_.links_based && HasSampledLink(context)) {
        // Independent draw; the stored baseline does not apply here
        const bool keep = RandomUnit() < options_.links_sample_rate;
        TRACEKEEP_LOG_DEBUG("Adaptive sampling: trace linked to sampled upstream: "
                            "operation={} links={} keep={}",
                            context.operation_name, context.links.size(), keep);
        return keep;
    }

    return baseline;
}

void AdaptiveSampler::Discard(const SamplingContext& context) {
    TakeBaselineDecision(context.invocation_id);
}

size_t AdaptiveSampler::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return baseline_decisions_.size();
}

bool AdaptiveSampler::TakeBaselineDecision(InvocationId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = baseline_decisions_.find(id);
    if (it == baseline_decisions_.end()) {
        return false;
    }
    const bool decision = it->second;
    baseline_decisions_.erase(it);
    return decision;
}

bool AdaptiveSampler::HasSampledLink(const SamplingContext& context) {
    return std::any_of(context.links.begin(), context.links.end(),
                       [](const trace::Link& link) { return link.context.IsSampled(); });
}

}  // namespace tracekeep::sampling
