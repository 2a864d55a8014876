/// @file xray_extractor.cpp
/// @brief AWS X-Ray extraction

#include "xray_extractor.h"

#include <regex>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace tracekeep::propagation {

std::optional<SpanContext> XRayExtractor::Extract(const HeaderMap& headers) const {
    const std::string* header = trace::FindHeader(headers, kXRayHeader);
    if (header == nullptr) {
        return std::nullopt;
    }

    static const std::regex root_regex("Root=1-([a-f0-9]{8})-([a-f0-9]{24})",
                                       std::regex::icase | std::regex::optimize);
    static const std::regex parent_regex("Parent=([a-f0-9]{16})",
                                         std::regex::icase | std::regex::optimize);
    static const std::regex sampled_regex("Sampled=([01])");

    std::smatch root_match;
    std::smatch parent_match;
    if (!std::regex_search(*header, root_match, root_regex) ||
        !std::regex_search(*header, parent_match, parent_regex)) {
        return std::nullopt;
    }

    SpanContext context;
    context.trace_id = absl::AsciiStrToLower(absl::StrCat(root_match[1].str(), root_match[2].str()));
    context.span_id = absl::AsciiStrToLower(parent_match[1].str());
    if (trace::IsAllZeros(context.trace_id) || trace::IsAllZeros(context.span_id)) {
        return std::nullopt;
    }

    bool sampled = true;
    std::smatch sampled_match;
    if (std::regex_search(*header, sampled_match, sampled_regex)) {
        sampled = sampled_match[1].str() == "1";
    }
    context.trace_flags = sampled ? trace::kTraceFlagsSampled : trace::kTraceFlagsNone;
    context.is_remote = true;
    return context;
}

}  // namespace tracekeep::propagation
