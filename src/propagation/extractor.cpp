/// @file extractor.cpp
/// @brief Extractor composition and construction from configuration

#include "extractor.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "b3_extractor.h"
#include "datadog_extractor.h"
#include "src/common/error.h"
#include "src/common/logging.h"
#include "w3c_extractor.h"
#include "xray_extractor.h"

namespace tracekeep::propagation {

CompositeExtractor::CompositeExtractor(
    std::vector<std::unique_ptr<TraceContextExtractor>> extractors) {
    for (auto& extractor : extractors) {
        Add(std::move(extractor));
    }
}

void CompositeExtractor::Add(std::unique_ptr<TraceContextExtractor> extractor) {
    if (extractor) {
        extractors_.push_back(std::move(extractor));
    }
}

std::optional<SpanContext> CompositeExtractor::Extract(const HeaderMap& headers) const {
    for (const auto& extractor : extractors_) {
        if (auto context = extractor->Extract(headers)) {
            return context;
        }
    }
    return std::nullopt;
}

std::string CompositeExtractor::Name() const {
    std::vector<std::string> names;
    names.reserve(extractors_.size());
    for (const auto& extractor : extractors_) {
        names.push_back(extractor->Name());
    }
    return absl::StrCat("composite(", absl::StrJoin(names, ","), ")");
}

PropagationConfig PropagationConfig::FromConfig(const Config& config) {
    PropagationConfig result;
    std::vector<std::string> formats = config.GetStringList("propagation.formats");
    if (!formats.empty()) {
        result.formats = std::move(formats);
    }
    return result;
}

absl::StatusOr<std::unique_ptr<TraceContextExtractor>> CreateExtractor(std::string_view format) {
    const std::string name = absl::AsciiStrToLower(absl::string_view(format.data(), format.size()));
    if (name == "w3c" || name == "tracecontext") {
        return std::make_unique<W3CTraceContextExtractor>();
    }
    if (name == "b3" || name == "zipkin") {
        return std::make_unique<B3Extractor>();
    }
    if (name == "datadog") {
        return std::make_unique<DatadogExtractor>();
    }
    if (name == "xray" || name == "aws") {
        return std::make_unique<XRayExtractor>();
    }
    return MakeError(ErrorCode::kInvalidArgument,
                     absl::StrCat("Unknown propagation format: ", absl::string_view(format.data(), format.size())));
}

absl::StatusOr<std::unique_ptr<TraceContextExtractor>> CreateExtractor(
    const PropagationConfig& config) {
    if (config.formats.empty()) {
        return MakeError(ErrorCode::kInvalidArgument, "At least one propagation format is required");
    }

    auto composite = std::make_unique<CompositeExtractor>();
    for (const auto& format : config.formats) {
        TRACEKEEP_ASSIGN_OR_RETURN(auto extractor, CreateExtractor(format));
        composite->Add(std::move(extractor));
    }

    TRACEKEEP_LOG_DEBUG("Created extractor {}", composite->Name());
    return std::unique_ptr<TraceContextExtractor>(std::move(composite));
}

const TraceContextExtractor& DefaultExtractor() {
    static const W3CTraceContextExtractor extractor;
    return extractor;
}

}  // namespace tracekeep::propagation
