/// @file b3_extractor.cpp
/// @brief B3 extraction

#include "b3_extractor.h"

#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>

#include "src/common/logging.h"

namespace tracekeep::propagation {

namespace {

/// Lowercase, validate and left-pad an id. Accepts `width` or `short_width`
/// hex chars (B3 allows 64-bit trace ids).
std::optional<std::string> NormalizeId(std::string_view raw, size_t width, size_t short_width) {
    std::string id = absl::AsciiStrToLower(absl::StripAsciiWhitespace(absl::string_view(raw.data(), raw.size())));
    if (id.size() != width && id.size() != short_width) {
        return std::nullopt;
    }
    if (!trace::IsLowerHex(id) || trace::IsAllZeros(id)) {
        return std::nullopt;
    }
    if (id.size() < width) {
        id.insert(0, width - id.size(), '0');
    }
    return id;
}

std::optional<SpanContext> MakeContext(std::string_view trace_id, std::string_view span_id,
                                       bool sampled) {
    auto normalized_trace = NormalizeId(trace_id, trace::kTraceIdHexLength, 16);
    auto normalized_span = NormalizeId(span_id, trace::kSpanIdHexLength, trace::kSpanIdHexLength);
    if (!normalized_trace || !normalized_span) {
        return std::nullopt;
    }

    SpanContext context;
    context.trace_id = std::move(*normalized_trace);
    context.span_id = std::move(*normalized_span);
    context.trace_flags = sampled ? trace::kTraceFlagsSampled : trace::kTraceFlagsNone;
    context.is_remote = true;
    return context;
}

}  // namespace

std::optional<SpanContext> B3Extractor::Extract(const HeaderMap& headers) const {
    if (const std::string* single = trace::FindHeader(headers, kB3SingleHeader)) {
        if (absl::StripAsciiWhitespace(*single) == "0") {
            return std::nullopt;
        }
        if (auto context = ExtractSingle(*single)) {
            return context;
        }
        TRACEKEEP_LOG_TRACE("Unusable b3 header '{}', trying multi-header form", *single);
    }
    return ExtractMulti(headers);
}

std::optional<SpanContext> B3Extractor::ExtractSingle(std::string_view value) {
    std::vector<absl::string_view> parts = absl::StrSplit(absl::string_view(value.data(), value.size()), '-');
    if (parts.size() < 2 || parts.size() > 4) {
        return std::nullopt;
    }

    bool sampled = true;
    if (parts.size() >= 3) {
        const absl::string_view state = absl::StripAsciiWhitespace(parts[2]);
        if (state == "0") {
            sampled = false;
        } else if (state != "1" && state != "d") {
            return std::nullopt;
        }
    }
    return MakeContext(std::string_view(parts[0].data(), parts[0].size()),
                       std::string_view(parts[1].data(), parts[1].size()), sampled);
}

std::optional<SpanContext> B3Extractor::ExtractMulti(const HeaderMap& headers) {
    const std::string* trace_id = trace::FindHeader(headers, kB3TraceIdHeader);
    const std::string* span_id = trace::FindHeader(headers, kB3SpanIdHeader);
    if (trace_id == nullptr || span_id == nullptr) {
        return std::nullopt;
    }

    bool sampled = true;
    const std::string* flags = trace::FindHeader(headers, kB3FlagsHeader);
    const std::string* sampled_header = trace::FindHeader(headers, kB3SampledHeader);
    if (flags != nullptr && absl::StripAsciiWhitespace(*flags) == "1") {
        sampled = true;
    } else if (sampled_header != nullptr) {
        const std::string state = absl::AsciiStrToLower(absl::StripAsciiWhitespace(*sampled_header));
        sampled = state == "1" || state == "true";
    }
    return MakeContext(*trace_id, *span_id, sampled);
}

}  // namespace tracekeep::propagation
