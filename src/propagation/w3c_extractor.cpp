/// @file w3c_extractor.cpp
/// @brief W3C Trace Context extraction

#include "w3c_extractor.h"

#include <regex>

#include <absl/strings/ascii.h>

namespace tracekeep::propagation {

std::optional<SpanContext> W3CTraceContextExtractor::ParseTraceParent(std::string_view value) {
    static const std::regex traceparent_regex(
        "^([0-9a-f]{2})-([0-9a-f]{32})-([0-9a-f]{16})-([0-9a-f]{2})$");

    const std::string trimmed(absl::StripAsciiWhitespace(absl::string_view(value.data(), value.size())));
    std::smatch match;
    if (!std::regex_match(trimmed, match, traceparent_regex)) {
        return std::nullopt;
    }

    if (match[1].str() == "ff") {
        return std::nullopt;
    }

    SpanContext context;
    context.trace_id = match[2].str();
    context.span_id = match[3].str();
    if (trace::IsAllZeros(context.trace_id) || trace::IsAllZeros(context.span_id)) {
        return std::nullopt;
    }
    context.trace_flags = static_cast<uint8_t>(std::stoi(match[4].str(), nullptr, 16));
    context.is_remote = true;
    return context;
}

std::optional<SpanContext> W3CTraceContextExtractor::Extract(const HeaderMap& headers) const {
    const std::string* traceparent = trace::FindHeader(headers, kTraceParentHeader);
    if (traceparent == nullptr) {
        return std::nullopt;
    }

    auto context = ParseTraceParent(*traceparent);
    if (!context) {
        return std::nullopt;
    }

    if (const std::string* tracestate = trace::FindHeader(headers, kTraceStateHeader)) {
        context->trace_state = *tracestate;
    }
    return context;
}

}  // namespace tracekeep::propagation
