#pragma once

/// @file batch_links.h
/// @brief Span links for messages consumed in a batch

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "extractor.h"

namespace tracekeep::propagation {

/// Link attribute: position among the links produced for one batch
constexpr const char* kBatchLinkIndexAttribute = "messaging.batch.link_index";

/// Consuming-span attribute: number of messages in the batch
constexpr const char* kBatchMessageCountAttribute = "messaging.batch.message_count";

/// Link to the context carried by one message's headers
std::optional<trace::Link> CreateLinkFromHeaders(
    const HeaderMap& headers, const TraceContextExtractor& extractor = DefaultExtractor());

/// Links for a batch of messages.
///
/// `accessor(message)` returns the message's headers, or nullptr when it has
/// none. Messages without a resolvable context are skipped. Produced links
/// keep input order and are numbered 0, 1, 2, ... in
/// `messaging.batch.link_index`.
template <typename Message, typename HeaderAccessor>
std::vector<trace::Link> ExtractLinksFromBatch(
    const std::vector<Message>& messages, HeaderAccessor&& accessor,
    const TraceContextExtractor& extractor = DefaultExtractor()) {
    std::vector<trace::Link> links;
    links.reserve(messages.size());
    for (const auto& message : messages) {
        const HeaderMap* headers = accessor(message);
        if (headers == nullptr) {
            continue;
        }
        auto context = extractor.Extract(*headers);
        if (!context) {
            continue;
        }
        trace::Link link;
        link.context = std::move(*context);
        link.attributes[kBatchLinkIndexAttribute] = static_cast<int64_t>(links.size());
        links.push_back(std::move(link));
    }
    return links;
}

/// Links for a batch given directly as header maps
std::vector<trace::Link> ExtractLinksFromHeaderBatch(
    const std::vector<HeaderMap>& batch,
    const TraceContextExtractor& extractor = DefaultExtractor());

/// Attributes for the span consuming a batch of `message_count` messages
trace::Attributes BatchLinkAttributes(size_t message_count);

}  // namespace tracekeep::propagation
