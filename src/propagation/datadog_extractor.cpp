/// @file datadog_extractor.cpp
/// @brief Datadog extraction

#include "datadog_extractor.h"

#include <absl/numeric/int128.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

namespace tracekeep::propagation {

namespace {

bool IsDecimal(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<SpanContext> DatadogExtractor::Extract(const HeaderMap& headers) const {
    const std::string* trace_header = trace::FindHeader(headers, kDatadogTraceIdHeader);
    const std::string* parent_header = trace::FindHeader(headers, kDatadogParentIdHeader);
    if (trace_header == nullptr || parent_header == nullptr) {
        return std::nullopt;
    }

    const absl::string_view trace_decimal = absl::StripAsciiWhitespace(*trace_header);
    const absl::string_view parent_decimal = absl::StripAsciiWhitespace(*parent_header);
    if (!IsDecimal(std::string_view(trace_decimal.data(), trace_decimal.size())) ||
        !IsDecimal(std::string_view(parent_decimal.data(), parent_decimal.size()))) {
        return std::nullopt;
    }

    absl::uint128 trace_value;
    uint64_t parent_value;
    if (!absl::SimpleAtoi(trace_decimal, &trace_value) ||
        !absl::SimpleAtoi(parent_decimal, &parent_value)) {
        return std::nullopt;
    }
    if (trace_value == 0 || parent_value == 0) {
        return std::nullopt;
    }

    bool sampled = true;
    if (const std::string* priority = trace::FindHeader(headers, kDatadogSamplingPriorityHeader)) {
        int priority_value = 0;
        sampled = absl::SimpleAtoi(*priority, &priority_value) && priority_value > 0;
    }

    SpanContext context;
    context.trace_id = absl::StrCat(
        absl::Hex(absl::Uint128High64(trace_value), absl::kZeroPad16),
        absl::Hex(absl::Uint128Low64(trace_value), absl::kZeroPad16));
    context.span_id = absl::StrCat(absl::Hex(parent_value, absl::kZeroPad16));
    context.trace_flags = sampled ? trace::kTraceFlagsSampled : trace::kTraceFlagsNone;
    context.is_remote = true;
    return context;
}

}  // namespace tracekeep::propagation
