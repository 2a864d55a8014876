/// @file batch_links.cpp
/// @brief Batch link aggregation

#include "batch_links.h"

namespace tracekeep::propagation {

std::optional<trace::Link> CreateLinkFromHeaders(const HeaderMap& headers,
                                                 const TraceContextExtractor& extractor) {
    auto context = extractor.Extract(headers);
    if (!context) {
        return std::nullopt;
    }
    trace::Link link;
    link.context = std::move(*context);
    return link;
}

std::vector<trace::Link> ExtractLinksFromHeaderBatch(const std::vector<HeaderMap>& batch,
                                                     const TraceContextExtractor& extractor) {
    return ExtractLinksFromBatch(
        batch, [](const HeaderMap& headers) { return &headers; }, extractor);
}

trace::Attributes BatchLinkAttributes(size_t message_count) {
    trace::Attributes attributes;
    attributes[kBatchMessageCountAttribute] = static_cast<int64_t>(message_count);
    return attributes;
}

}  // namespace tracekeep::propagation
