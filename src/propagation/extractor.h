#pragma once

/// @file extractor.h
/// @brief Trace-context extraction from wire-format headers

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "src/common/config.h"
#include "src/trace/types.h"

namespace tracekeep::propagation {

using trace::HeaderMap;
using trace::SpanContext;

/// Parses one wire format into a normalized span context.
///
/// Malformed or partial headers are an expected outcome and yield
/// std::nullopt. A returned context is always valid: lowercase hex, exact
/// lengths, no all-zero id, and is_remote set.
class TraceContextExtractor {
public:
    virtual ~TraceContextExtractor() = default;

    virtual std::optional<SpanContext> Extract(const HeaderMap& headers) const = 0;

    /// Format name ("w3c", "b3", "datadog", "xray", ...)
    virtual std::string Name() const = 0;
};

/// Tries registered extractors in order; the first context found wins
class CompositeExtractor : public TraceContextExtractor {
public:
    CompositeExtractor() = default;
    explicit CompositeExtractor(std::vector<std::unique_ptr<TraceContextExtractor>> extractors);

    /// Register another format
    void Add(std::unique_ptr<TraceContextExtractor> extractor);

    std::optional<SpanContext> Extract(const HeaderMap& headers) const override;
    std::string Name() const override;

    size_t Size() const { return extractors_.size(); }

private:
    std::vector<std::unique_ptr<TraceContextExtractor>> extractors_;
};

/// Propagation configuration (the `propagation` section)
struct PropagationConfig {
    /// Formats tried in order
    std::vector<std::string> formats = {"w3c"};

    /// Read `propagation.formats` (list or comma-separated string)
    static PropagationConfig FromConfig(const Config& config);
};

/// Create the extractor for a single format name
absl::StatusOr<std::unique_ptr<TraceContextExtractor>> CreateExtractor(std::string_view format);

/// Create a composite extractor for all configured formats
absl::StatusOr<std::unique_ptr<TraceContextExtractor>> CreateExtractor(
    const PropagationConfig& config);

/// Shared W3C extractor used when callers do not choose one
const TraceContextExtractor& DefaultExtractor();

}  // namespace tracekeep::propagation
