#pragma once

/// @file b3_extractor.h
/// @brief B3 (Zipkin) single- and multi-header extraction

#include "extractor.h"

namespace tracekeep::propagation {

constexpr const char* kB3SingleHeader = "b3";
constexpr const char* kB3TraceIdHeader = "x-b3-traceid";
constexpr const char* kB3SpanIdHeader = "x-b3-spanid";
constexpr const char* kB3SampledHeader = "x-b3-sampled";
constexpr const char* kB3FlagsHeader = "x-b3-flags";

/// Parses `b3: {trace}-{span}[-{sampled}[-{parent}]]`, falling back to the
/// `x-b3-*` headers when the single header is absent or unusable.
///
/// 64-bit trace ids are left-padded to 128 bits. A sampling state of `1` or
/// `d` (debug) is sampled; an absent state defaults to sampled. `b3: 0` means
/// no trace.
class B3Extractor : public TraceContextExtractor {
public:
    std::optional<SpanContext> Extract(const HeaderMap& headers) const override;
    std::string Name() const override { return "b3"; }

private:
    static std::optional<SpanContext> ExtractSingle(std::string_view value);
    static std::optional<SpanContext> ExtractMulti(const HeaderMap& headers);
};

}  // namespace tracekeep::propagation
