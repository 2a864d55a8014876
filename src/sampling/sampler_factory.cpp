/// @file sampler_factory.cpp
/// @brief Build sampling policies from configuration

#include "sampler_factory.h"

#include <optional>
#include <type_traits>
#include <variant>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "src/common/error.h"
#include "src/common/logging.h"

namespace tracekeep::sampling {

namespace {

/// Render a scalar metadata value as a string key
std::optional<std::string> MetadataString(const SamplingContext& context,
                                          const std::string& attribute) {
    auto it = context.metadata.find(attribute);
    if (it == context.metadata.end()) {
        return std::nullopt;
    }
    return std::visit([](auto&& value) -> std::optional<std::string> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(value ? "true" : "false");
        } else {
            return absl::StrCat(value);
        }
    }, it->second);
}

}  // namespace

absl::StatusOr<SamplerConfig::Strategy> ParseStrategy(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::StripAsciiWhitespace(absl::string_view(name.data(), name.size())));
    if (lowered == "always_on" || lowered == "always") return SamplerConfig::Strategy::kAlwaysOn;
    if (lowered == "always_off" || lowered == "never") return SamplerConfig::Strategy::kAlwaysOff;
    if (lowered == "random") return SamplerConfig::Strategy::kRandom;
    if (lowered == "adaptive") return SamplerConfig::Strategy::kAdaptive;
    if (lowered == "per_key") return SamplerConfig::Strategy::kPerKey;
    if (lowered == "feature_flag") return SamplerConfig::Strategy::kFeatureFlag;
    return MakeError(ErrorCode::kInvalidArgument,
                     absl::StrCat("Unknown sampling strategy: ", absl::string_view(name.data(), name.size())));
}

std::string_view StrategyName(SamplerConfig::Strategy strategy) {
    switch (strategy) {
        case SamplerConfig::Strategy::kAlwaysOn:
            return "always_on";
        case SamplerConfig::Strategy::kAlwaysOff:
            return "always_off";
        case SamplerConfig::Strategy::kRandom:
            return "random";
        case SamplerConfig::Strategy::kAdaptive:
            return "adaptive";
        case SamplerConfig::Strategy::kPerKey:
            return "per_key";
        case SamplerConfig::Strategy::kFeatureFlag:
            return "feature_flag";
    }
    return "unknown";
}

absl::StatusOr<SamplerConfig> SamplerConfig::FromConfig(const Config& config) {
    SamplerConfig result;

    if (config.HasKey("sampling.strategy")) {
        TRACEKEEP_ASSIGN_OR_RETURN(result.strategy,
                                   ParseStrategy(config.GetString("sampling.strategy")));
    }
    result.sample_rate = config.GetDouble("sampling.sample_rate", result.sample_rate);
    result.fail_open = config.GetBool("sampling.fail_open", result.fail_open);

    auto& adaptive = result.adaptive;
    adaptive.slow_threshold_ms =
        config.GetDouble("sampling.adaptive.slow_threshold_ms", adaptive.slow_threshold_ms);
    adaptive.always_sample_errors =
        config.GetBool("sampling.adaptive.always_sample_errors", adaptive.always_sample_errors);
    adaptive.always_sample_slow =
        config.GetBool("sampling.adaptive.always_sample_slow", adaptive.always_sample_slow);
    adaptive.links_based = config.GetBool("sampling.adaptive.links_based", adaptive.links_based);
    adaptive.links_sample_rate =
        config.GetDouble("sampling.adaptive.links_sample_rate", adaptive.links_sample_rate);

    result.key_attribute =
        config.GetString("sampling.per_key.key_attribute", result.key_attribute);
    result.always_sample_keys = config.GetStringList("sampling.per_key.always_sample");

    result.flags_attribute =
        config.GetString("sampling.feature_flag.flags_attribute", result.flags_attribute);
    result.always_sample_flags = config.GetStringList("sampling.feature_flag.always_sample");

    return result;
}

absl::StatusOr<std::shared_ptr<Sampler>> CreateSampler(const SamplerConfig& config) {
    std::shared_ptr<Sampler> sampler;

    switch (config.strategy) {
        case SamplerConfig::Strategy::kAlwaysOn:
            sampler = std::make_shared<AlwaysOnSampler>();
            break;

        case SamplerConfig::Strategy::kAlwaysOff:
            sampler = std::make_shared<AlwaysOffSampler>();
            break;

        case SamplerConfig::Strategy::kRandom: {
            TRACEKEEP_ASSIGN_OR_RETURN(sampler, RandomSampler::Create(config.sample_rate));
            break;
        }

        case SamplerConfig::Strategy::kAdaptive: {
            AdaptiveSamplerOptions options = config.adaptive;
            options.baseline_sample_rate = config.sample_rate;
            TRACEKEEP_ASSIGN_OR_RETURN(sampler, AdaptiveSampler::Create(options));
            break;
        }

        case SamplerConfig::Strategy::kPerKey: {
            PerKeySamplerOptions options;
            options.baseline_sample_rate = config.sample_rate;
            options.always_sample_keys = config.always_sample_keys;
            options.extract_key = [attribute = config.key_attribute](
                                      const SamplingContext& context) {
                return MetadataString(context, attribute);
            };
            TRACEKEEP_ASSIGN_OR_RETURN(sampler, PerKeySampler::Create(std::move(options)));
            break;
        }

        case SamplerConfig::Strategy::kFeatureFlag: {
            FeatureFlagSamplerOptions options;
            options.baseline_sample_rate = config.sample_rate;
            options.always_sample_flags = config.always_sample_flags;
            options.extract_flags = [attribute = config.flags_attribute](
                                        const SamplingContext& context) {
                std::vector<std::string> flags;
                if (auto value = MetadataString(context, attribute)) {
                    for (absl::string_view flag :
                         absl::StrSplit(*value, ',', absl::SkipWhitespace())) {
                        flags.emplace_back(absl::StripAsciiWhitespace(flag));
                    }
                }
                return flags;
            };
            TRACEKEEP_ASSIGN_OR_RETURN(sampler,
                                       FeatureFlagSampler::Create(std::move(options)));
            break;
        }
    }

    if (!sampler) {
        return absl::InternalError("Sampler strategy produced no sampler");
    }

    TRACEKEEP_LOG_INFO("Created {} sampler (rate={}, fail_open={})",
                       StrategyName(config.strategy), config.sample_rate, config.fail_open);

    if (config.fail_open) {
        TRACEKEEP_ASSIGN_OR_RETURN(sampler, FailOpenSampler::Create(std::move(sampler)));
    }
    return sampler;
}

}  // namespace tracekeep::sampling
