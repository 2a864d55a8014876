#pragma once

/// @file xray_extractor.h
/// @brief AWS X-Ray `X-Amzn-Trace-Id` extraction

#include "extractor.h"

namespace tracekeep::propagation {

constexpr const char* kXRayHeader = "x-amzn-trace-id";

/// Parses `Root=1-<8 hex>-<24 hex>;Parent=<16 hex>;Sampled=0|1`.
///
/// The trace id is the two Root groups concatenated. Root and Parent are
/// required; an absent Sampled field defaults to sampled.
class XRayExtractor : public TraceContextExtractor {
public:
    std::optional<SpanContext> Extract(const HeaderMap& headers) const override;
    std::string Name() const override { return "xray"; }
};

}  // namespace tracekeep::propagation
