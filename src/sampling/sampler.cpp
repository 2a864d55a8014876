/// @file sampler.cpp
/// @brief Sampling strategy implementations

#include "sampler.h"

#include <algorithm>
#include <exception>
#include <random>

#include <absl/memory/memory.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "src/common/error.h"
#include "src/common/logging.h"

namespace tracekeep::sampling {

namespace {

// FNV-1a hash constants
constexpr uint64_t kFnvPrime = 0x100000001b3;
constexpr uint64_t kFnvOffset = 0xcbf29ce484222325;

// 2^-53: scales the top 53 bits of a hash into [0, 1)
constexpr double kUnitScale = 1.0 / 9007199254740992.0;

// MurmurHash3 fmix64 finalizer; FNV-1a alone leaves the high bits nearly
// unchanged for keys differing only in their last characters
uint64_t Avalanche(uint64_t h) {
    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdULL;
    h ^= h >> 33;
    h *= 0xc4ceb9fe1a85ec53ULL;
    h ^= h >> 33;
    return h;
}

}  // namespace

double RandomUnit() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    static thread_local std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(gen);
}

// ============================================================================
// RandomSampler
// ============================================================================

absl::StatusOr<std::unique_ptr<RandomSampler>> RandomSampler::Create(double sample_rate) {
    TRACEKEEP_RETURN_IF_ERROR(ValidateRate("Sample rate", sample_rate));
    return absl::WrapUnique(new RandomSampler(sample_rate));
}

bool RandomSampler::ShouldSample(const SamplingContext& context) {
    return RandomUnit() < sample_rate_;
}

// ============================================================================
// PerKeySampler
// ============================================================================

absl::StatusOr<std::unique_ptr<PerKeySampler>> PerKeySampler::Create(
    PerKeySamplerOptions options) {
    TRACEKEEP_RETURN_IF_ERROR(
        ValidateRate("Baseline sample rate", options.baseline_sample_rate));
    if (!options.extract_key) {
        return absl::InvalidArgumentError("PerKeySampler requires a key extractor");
    }
    return absl::WrapUnique(new PerKeySampler(std::move(options)));
}

PerKeySampler::PerKeySampler(PerKeySamplerOptions options)
    : baseline_sample_rate_(options.baseline_sample_rate),
      extract_key_(std::move(options.extract_key)),
      always_sample_keys_(options.always_sample_keys.begin(),
                          options.always_sample_keys.end()) {}

double PerKeySampler::NormalizedKeyHash(std::string_view key) {
    uint64_t hash = kFnvOffset;
    for (char c : key) {
        hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
        hash *= kFnvPrime;
    }
    return static_cast<double>(Avalanche(hash) >> 11) * kUnitScale;
}

bool PerKeySampler::ShouldSample(const SamplingContext& context) {
    std::optional<std::string> key = extract_key_(context);

    if (!key.has_value() || key->empty()) {
        return RandomUnit() < baseline_sample_rate_;
    }

    if (IsAlwaysSampled(*key)) {
        TRACEKEEP_LOG_DEBUG("Sampling keyed request: operation={} key={}",
                            context.operation_name, *key);
        return true;
    }

    return NormalizedKeyHash(*key) < baseline_sample_rate_;
}

void PerKeySampler::AddAlwaysSampleKeys(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    always_sample_keys_.insert(keys.begin(), keys.end());
}

void PerKeySampler::RemoveAlwaysSampleKeys(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& key : keys) {
        always_sample_keys_.erase(key);
    }
}

bool PerKeySampler::IsAlwaysSampled(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return always_sample_keys_.count(key) > 0;
}

// ============================================================================
// FeatureFlagSampler
// ============================================================================

absl::StatusOr<std::unique_ptr<FeatureFlagSampler>> FeatureFlagSampler::Create(
    FeatureFlagSamplerOptions options) {
    TRACEKEEP_RETURN_IF_ERROR(
        ValidateRate("Baseline sample rate", options.baseline_sample_rate));
    if (!options.extract_flags) {
        return absl::InvalidArgumentError("FeatureFlagSampler requires a flag extractor");
    }
    return absl::WrapUnique(new FeatureFlagSampler(std::move(options)));
}

FeatureFlagSampler::FeatureFlagSampler(FeatureFlagSamplerOptions options)
    : baseline_sample_rate_(options.baseline_sample_rate),
      extract_flags_(std::move(options.extract_flags)),
      always_sample_flags_(options.always_sample_flags.begin(),
                           options.always_sample_flags.end()) {}

bool FeatureFlagSampler::ShouldSample(const SamplingContext& context) {
    const std::vector<std::string> flags = extract_flags_(context);

    bool monitored = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitored = std::any_of(flags.begin(), flags.end(), [this](const std::string& flag) {
            return always_sample_flags_.count(flag) > 0;
        });
    }

    if (monitored) {
        TRACEKEEP_LOG_DEBUG("Sampling feature flag request: operation={} flags=[{}]",
                            context.operation_name, absl::StrJoin(flags, ","));
        return true;
    }

    return RandomUnit() < baseline_sample_rate_;
}

void FeatureFlagSampler::AddAlwaysSampleFlags(const std::vector<std::string>& flags) {
    std::lock_guard<std::mutex> lock(mutex_);
    always_sample_flags_.insert(flags.begin(), flags.end());
}

void FeatureFlagSampler::RemoveAlwaysSampleFlags(const std::vector<std::string>& flags) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& flag : flags) {
        always_sample_flags_.erase(flag);
    }
}

// ============================================================================
// CompositeSampler
// ============================================================================

absl::StatusOr<std::unique_ptr<CompositeSampler>> CompositeSampler::Create(
    std::vector<std::shared_ptr<Sampler>> samplers) {
    if (samplers.empty()) {
        return absl::InvalidArgumentError(
            "CompositeSampler requires at least one child sampler");
    }
    for (const auto& sampler : samplers) {
        if (!sampler) {
            return absl::InvalidArgumentError("CompositeSampler child must not be null");
        }
    }
    return absl::WrapUnique(new CompositeSampler(std::move(samplers)));
}

CompositeSampler::CompositeSampler(std::vector<std::shared_ptr<Sampler>> samplers)
    : samplers_(std::move(samplers)) {
    needs_tail_sampling_ = std::any_of(
        samplers_.begin(), samplers_.end(),
        [](const std::shared_ptr<Sampler>& sampler) { return sampler->NeedsTailSampling(); });
}

bool CompositeSampler::ShouldSample(const SamplingContext& context) {
    bool head_accepted = false;
    bool tail_accepted = false;

    for (const auto& sampler : samplers_) {
        if (sampler->NeedsTailSampling()) {
            // Never short-circuit: the child records per-call state here
            tail_accepted = sampler->ShouldSample(context) || tail_accepted;
        } else if (!head_accepted) {
            head_accepted = sampler->ShouldSample(context);
        }
    }

    if (needs_tail_sampling_) {
        std::lock_guard<std::mutex> lock(mutex_);
        head_accepts_[context.invocation_id] = head_accepted;
    }

    return head_accepted || tail_accepted;
}

bool CompositeSampler::ShouldKeepTrace(const SamplingContext& context,
                                       const OperationResult& result) {
    if (!needs_tail_sampling_) {
        return true;
    }

    bool keep = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = head_accepts_.find(context.invocation_id);
        if (it != head_accepts_.end()) {
            keep = it->second;
            head_accepts_.erase(it);
        }
    }

    // Every tail child is consulted exactly once to consume its own state
    for (const auto& sampler : samplers_) {
        if (sampler->NeedsTailSampling()) {
            keep = sampler->ShouldKeepTrace(context, result) || keep;
        }
    }
    return keep;
}

void CompositeSampler::Discard(const SamplingContext& context) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        head_accepts_.erase(context.invocation_id);
    }
    for (const auto& sampler : samplers_) {
        sampler->Discard(context);
    }
}

size_t CompositeSampler::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return head_accepts_.size();
}

// ============================================================================
// FailOpenSampler
// ============================================================================

absl::StatusOr<std::unique_ptr<FailOpenSampler>> FailOpenSampler::Create(
    std::shared_ptr<Sampler> inner) {
    if (!inner) {
        return absl::InvalidArgumentError("FailOpenSampler requires a sampler to wrap");
    }
    return absl::WrapUnique(new FailOpenSampler(std::move(inner)));
}

bool FailOpenSampler::ShouldSample(const SamplingContext& context) {
    try {
        return inner_->ShouldSample(context);
    } catch (const std::exception& e) {
        TRACEKEEP_LOG_ERROR("Sampler '{}' failed in ShouldSample for '{}', keeping: {}",
                            inner_->Name(), context.operation_name, e.what());
        return true;
    }
}

bool FailOpenSampler::ShouldKeepTrace(const SamplingContext& context,
                                      const OperationResult& result) {
    try {
        return inner_->ShouldKeepTrace(context, result);
    } catch (const std::exception& e) {
        TRACEKEEP_LOG_ERROR("Sampler '{}' failed in ShouldKeepTrace for '{}', keeping: {}",
                            inner_->Name(), context.operation_name, e.what());
        return true;
    }
}

void FailOpenSampler::Discard(const SamplingContext& context) {
    try {
        inner_->Discard(context);
    } catch (const std::exception& e) {
        TRACEKEEP_LOG_ERROR("Sampler '{}' failed in Discard for '{}': {}",
                            inner_->Name(), context.operation_name, e.what());
    }
}

std::string FailOpenSampler::Name() const {
    return absl::StrCat("fail_open(", inner_->Name(), ")");
}

}  // namespace tracekeep::sampling
