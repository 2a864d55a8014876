#pragma once

/// @file sampler.h
/// @brief Sampling policies deciding which operations are traced and exported

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <absl/status/statusor.h>

#include "src/trace/types.h"

namespace tracekeep::sampling {

using trace::InvocationId;
using trace::OperationResult;
using trace::SamplingContext;

/// Base sampler interface.
///
/// Call sites invoke ShouldSample() before doing work. When NeedsTailSampling()
/// is true the span is always created, and ShouldKeepTrace() must be invoked
/// exactly once after completion before the finished span is exported.
class Sampler {
public:
    virtual ~Sampler() = default;

    /// Head decision: trace this operation?
    virtual bool ShouldSample(const SamplingContext& context) = 0;

    /// Whether the final keep/drop decision is deferred until completion
    virtual bool NeedsTailSampling() const { return false; }

    /// Tail decision, only consulted when NeedsTailSampling() is true
    virtual bool ShouldKeepTrace(const SamplingContext& context,
                                 const OperationResult& result) {
        return true;
    }

    /// Release per-call state for a call that will never report completion
    /// (for example when the head decision rejected it)
    virtual void Discard(const SamplingContext& context) {}

    /// Get the sampler name
    virtual std::string Name() const = 0;
};

/// Uniform draw in [0, 1) from a thread-local generator
double RandomUnit();

/// Always sample
class AlwaysOnSampler : public Sampler {
public:
    bool ShouldSample(const SamplingContext& context) override { return true; }
    std::string Name() const override { return "always_on"; }
};

/// Never sample
class AlwaysOffSampler : public Sampler {
public:
    bool ShouldSample(const SamplingContext& context) override { return false; }
    std::string Name() const override { return "always_off"; }
};

/// Independent random sampling at a fixed rate
class RandomSampler : public Sampler {
public:
    /// @param sample_rate Probability in [0, 1]
    static absl::StatusOr<std::unique_ptr<RandomSampler>> Create(double sample_rate);

    bool ShouldSample(const SamplingContext& context) override;
    std::string Name() const override { return "random"; }

    double GetSampleRate() const { return sample_rate_; }

private:
    explicit RandomSampler(double sample_rate) : sample_rate_(sample_rate) {}

    const double sample_rate_;
};

/// Extracts a sampling key (user id, tenant, ...) from a sampling context
using KeyExtractor = std::function<std::optional<std::string>(const SamplingContext&)>;

struct PerKeySamplerOptions {
    double baseline_sample_rate = 0.1;
    std::vector<std::string> always_sample_keys;
    KeyExtractor extract_key;
};

/// Consistent per-key sampling.
///
/// Keys on the always-sample list are accepted. Other keys are accepted iff
/// their normalized FNV-1a hash is below the baseline rate, so a key gets the
/// same outcome in every process. Calls without a key fall back to random
/// sampling at the baseline rate.
class PerKeySampler : public Sampler {
public:
    static absl::StatusOr<std::unique_ptr<PerKeySampler>> Create(PerKeySamplerOptions options);

    bool ShouldSample(const SamplingContext& context) override;
    std::string Name() const override { return "per_key"; }

    void AddAlwaysSampleKeys(const std::vector<std::string>& keys);
    void RemoveAlwaysSampleKeys(const std::vector<std::string>& keys);
    bool IsAlwaysSampled(const std::string& key) const;

    /// FNV-1a hash of the key, finalized and mapped to [0, 1)
    static double NormalizedKeyHash(std::string_view key);

private:
    explicit PerKeySampler(PerKeySamplerOptions options);

    const double baseline_sample_rate_;
    const KeyExtractor extract_key_;

    std::unordered_set<std::string> always_sample_keys_;
    mutable std::mutex mutex_;
};

/// Extracts the feature flags active for a call
using FlagExtractor = std::function<std::vector<std::string>(const SamplingContext&)>;

struct FeatureFlagSamplerOptions {
    double baseline_sample_rate = 0.1;
    std::vector<std::string> always_sample_flags;
    FlagExtractor extract_flags;
};

/// Always samples calls with a monitored feature flag, random otherwise
class FeatureFlagSampler : public Sampler {
public:
    static absl::StatusOr<std::unique_ptr<FeatureFlagSampler>> Create(
        FeatureFlagSamplerOptions options);

    bool ShouldSample(const SamplingContext& context) override;
    std::string Name() const override { return "feature_flag"; }

    void AddAlwaysSampleFlags(const std::vector<std::string>& flags);
    void RemoveAlwaysSampleFlags(const std::vector<std::string>& flags);

private:
    explicit FeatureFlagSampler(FeatureFlagSamplerOptions options);

    const double baseline_sample_rate_;
    const FlagExtractor extract_flags_;

    std::unordered_set<std::string> always_sample_flags_;
    mutable std::mutex mutex_;
};

/// Samples if ANY child samples.
///
/// Children may mix head-only and tail-sampling policies. Tail children are
/// consulted on every call, so their per-call state is always created and
/// always consumed. When any child needs tail sampling the composite does
/// too: a call is kept if a head-only child accepted it at start, or if any
/// tail child keeps it at completion.
class CompositeSampler : public Sampler {
public:
    static absl::StatusOr<std::unique_ptr<CompositeSampler>> Create(
        std::vector<std::shared_ptr<Sampler>> samplers);

    bool ShouldSample(const SamplingContext& context) override;
    bool NeedsTailSampling() const override { return needs_tail_sampling_; }
    bool ShouldKeepTrace(const SamplingContext& context,
                         const OperationResult& result) override;
    void Discard(const SamplingContext& context) override;
    std::string Name() const override { return "composite"; }

    /// Number of calls awaiting a tail decision
    size_t PendingCount() const;

private:
    explicit CompositeSampler(std::vector<std::shared_ptr<Sampler>> samplers);

    std::vector<std::shared_ptr<Sampler>> samplers_;
    bool needs_tail_sampling_ = false;

    // Whether a head-only child accepted the call, keyed by invocation
    std::unordered_map<InvocationId, bool, InvocationId::Hash> head_accepts_;
    mutable std::mutex mutex_;
};

/// Decorator that keeps data when the wrapped policy throws.
///
/// A sampling bug then produces extra telemetry instead of silently losing it.
class FailOpenSampler : public Sampler {
public:
    static absl::StatusOr<std::unique_ptr<FailOpenSampler>> Create(
        std::shared_ptr<Sampler> inner);

    bool ShouldSample(const SamplingContext& context) override;
    bool NeedsTailSampling() const override { return inner_->NeedsTailSampling(); }
    bool ShouldKeepTrace(const SamplingContext& context,
                         const OperationResult& result) override;
    void Discard(const SamplingContext& context) override;
    std::string Name() const override;

private:
    explicit FailOpenSampler(std::shared_ptr<Sampler> inner) : inner_(std::move(inner)) {}

    std::shared_ptr<Sampler> inner_;
};

}  // namespace tracekeep::sampling
