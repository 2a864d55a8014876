#pragma once

/// @file adaptive_sampler.h
/// @brief Tail-sampling policy that always keeps errors and slow operations

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <absl/status/statusor.h>

#include "sampler.h"

namespace tracekeep::sampling {

/// Adaptive sampler configuration
struct AdaptiveSamplerOptions {
    /// Rate applied to successful, fast operations
    double baseline_sample_rate = 0.1;

    /// Operations at or above this duration are "slow"
    double slow_threshold_ms = 1000.0;

    bool always_sample_errors = true;
    bool always_sample_slow = true;

    /// Keep operations linked to a sampled upstream trace at links_sample_rate
    bool links_based = false;
    double links_sample_rate = 1.0;
};

/// Adaptive tail sampler.
///
/// ShouldSample() never blocks span creation; it draws the baseline decision
/// and stores it under the call's InvocationId. ShouldKeepTrace() resolves in
/// priority order:
///   1. failed operation and always_sample_errors -> keep
///   2. duration >= slow_threshold_ms and always_sample_slow -> keep
///   3. links_based and a link is sampled -> keep with probability
///      links_sample_rate (independent draw)
///   4. otherwise the stored baseline decision
/// The stored entry is consumed by ShouldKeepTrace() whichever rule decides.
///
/// Must be paired with TailSamplingProcessor; without it every span is
/// exported.
class AdaptiveSampler : public Sampler {
public:
    static absl::StatusOr<std::unique_ptr<AdaptiveSampler>> Create(
        AdaptiveSamplerOptions options = {});

    bool ShouldSample(const SamplingContext& context) override;
    bool NeedsTailSampling() const override { return true; }
    bool ShouldKeepTrace(const SamplingContext& context,
                         const OperationResult& result) override;
    void Discard(const SamplingContext& context) override;
    std::string Name() const override { return "adaptive"; }

    const AdaptiveSamplerOptions& GetOptions() const { return options_; }

    /// Number of calls with a stored baseline decision not yet consumed
    size_t PendingCount() const;

private:
    explicit AdaptiveSampler(AdaptiveSamplerOptions options) : options_(options) {}

    /// Remove and return the stored baseline decision (false when absent)
    bool TakeBaselineDecision(InvocationId id);

    static bool HasSampledLink(const SamplingContext& context);

    const AdaptiveSamplerOptions options_;

    std::unordered_map<InvocationId, bool, InvocationId::Hash> baseline_decisions_;
    mutable std::mutex mutex_;
};

}  // namespace tracekeep::sampling
