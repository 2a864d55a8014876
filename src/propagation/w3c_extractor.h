#pragma once

/// @file w3c_extractor.h
/// @brief W3C Trace Context (`traceparent` / `tracestate`) extraction

#include "extractor.h"

namespace tracekeep::propagation {

constexpr const char* kTraceParentHeader = "traceparent";
constexpr const char* kTraceStateHeader = "tracestate";

/// Parses `traceparent: vv-<32 hex>-<16 hex>-<2 hex>`.
///
/// Version `ff` is invalid. The `tracestate` header, when present, is carried
/// through unchanged.
class W3CTraceContextExtractor : public TraceContextExtractor {
public:
    std::optional<SpanContext> Extract(const HeaderMap& headers) const override;
    std::string Name() const override { return "w3c"; }

    /// Parse a bare traceparent value
    static std::optional<SpanContext> ParseTraceParent(std::string_view value);
};

}  // namespace tracekeep::propagation
