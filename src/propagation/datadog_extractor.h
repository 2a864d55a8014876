#pragma once

/// @file datadog_extractor.h
/// @brief Datadog `x-datadog-*` header extraction

#include "extractor.h"

namespace tracekeep::propagation {

constexpr const char* kDatadogTraceIdHeader = "x-datadog-trace-id";
constexpr const char* kDatadogParentIdHeader = "x-datadog-parent-id";
constexpr const char* kDatadogSamplingPriorityHeader = "x-datadog-sampling-priority";

/// Converts Datadog's decimal ids to zero-padded lowercase hex.
///
/// Trace ids up to 128 bits are accepted; the parent id must fit in 64 bits.
/// A sampling priority above zero is sampled, an absent priority defaults to
/// sampled, and a non-numeric priority is treated as not sampled.
class DatadogExtractor : public TraceContextExtractor {
public:
    std::optional<SpanContext> Extract(const HeaderMap& headers) const override;
    std::string Name() const override { return "datadog"; }
};

}  // namespace tracekeep::propagation
