#pragma once

/// @file sampler_factory.h
/// @brief Build sampling policies from configuration

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "adaptive_sampler.h"
#include "sampler.h"
#include "src/common/config.h"

namespace tracekeep::sampling {

/// Sampler configuration (the `sampling` section)
struct SamplerConfig {
    enum class Strategy {
        kAlwaysOn,      ///< Always sample
        kAlwaysOff,     ///< Never sample
        kRandom,        ///< Independent random sampling
        kAdaptive,      ///< Tail sampling keeping errors and slow calls
        kPerKey,        ///< Consistent sampling by a metadata key
        kFeatureFlag    ///< Always sample monitored feature flags
    };

    Strategy strategy = Strategy::kAdaptive;

    /// Rate for kRandom, baseline rate for the other probabilistic strategies
    double sample_rate = 0.1;

    /// For kAdaptive (baseline_sample_rate is taken from sample_rate)
    AdaptiveSamplerOptions adaptive;

    /// For kPerKey: metadata attribute holding the key
    std::string key_attribute = "user.id";
    std::vector<std::string> always_sample_keys;

    /// For kFeatureFlag: metadata attribute holding comma-separated flags
    std::string flags_attribute = "feature_flags";
    std::vector<std::string> always_sample_flags;

    /// Wrap the policy so that exceptions keep data
    bool fail_open = true;

    /// Read the `sampling.*` keys; absent keys keep their defaults
    static absl::StatusOr<SamplerConfig> FromConfig(const Config& config);
};

/// Parse a strategy name such as "adaptive" or "per_key"
absl::StatusOr<SamplerConfig::Strategy> ParseStrategy(std::string_view name);

/// Name of a strategy as used in configuration
std::string_view StrategyName(SamplerConfig::Strategy strategy);

/// Factory function to create a sampler from configuration
absl::StatusOr<std::shared_ptr<Sampler>> CreateSampler(const SamplerConfig& config);

}  // namespace tracekeep::sampling
