#pragma once

/// @file types.h
/// @brief Span context, link and finished-span records shared by sampling and
/// propagation

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/status.h>

namespace tracekeep::trace {

/// Attribute value type (primitives only)
using AttributeValue = std::variant<std::string, bool, int64_t, double>;

/// Attribute map
using Attributes = std::map<std::string, AttributeValue>;

/// Wire-format carrier as received from a message or request
using HeaderMap = std::map<std::string, std::string>;

/// W3C trace flag bit meaning "sampled"
constexpr uint8_t kTraceFlagsNone = 0x00;
constexpr uint8_t kTraceFlagsSampled = 0x01;

constexpr size_t kTraceIdHexLength = 32;
constexpr size_t kSpanIdHexLength = 16;

/// Normalized trace/span identifiers of one unit of work
struct SpanContext {
    std::string trace_id;      // 16 bytes, 32 lowercase hex chars
    std::string span_id;       // 8 bytes, 16 lowercase hex chars
    uint8_t trace_flags = kTraceFlagsNone;
    bool is_remote = false;
    std::string trace_state;   // opaque vendor state (W3C tracestate)

    /// Lengths are exact, characters are lowercase hex, neither id is all zeros
    bool IsValid() const;

    bool IsSampled() const { return (trace_flags & kTraceFlagsSampled) != 0; }
};

/// Non-hierarchical causal reference to another span
struct Link {
    SpanContext context;
    Attributes attributes;
};

/// Span kind
enum class SpanKind {
    kInternal = 0,
    kServer,
    kClient,
    kProducer,
    kConsumer
};

/// Status code
enum class StatusCode {
    kUnset = 0,
    kOk,
    kError
};

/// Span status
struct SpanStatus {
    StatusCode code = StatusCode::kUnset;
    std::string message;
};

/// Explicit per-call handle. Allocated once per instrumented call and threaded
/// through head and tail sampling; never reused.
class InvocationId {
public:
    constexpr InvocationId() = default;
    constexpr explicit InvocationId(uint64_t value) : value_(value) {}

    /// Allocate a process-unique id (never 0)
    static InvocationId Next();

    constexpr uint64_t value() const { return value_; }
    constexpr bool IsSet() const { return value_ != 0; }

    friend constexpr bool operator==(InvocationId a, InvocationId b) {
        return a.value_ == b.value_;
    }
    friend constexpr bool operator!=(InvocationId a, InvocationId b) {
        return a.value_ != b.value_;
    }

    struct Hash {
        size_t operator()(InvocationId id) const {
            return std::hash<uint64_t>{}(id.value_);
        }
    };

private:
    uint64_t value_ = 0;
};

/// Context for a sampling decision
struct SamplingContext {
    std::string operation_name;
    InvocationId invocation_id;
    Attributes metadata;
    std::vector<Link> links;
};

/// Outcome of a completed operation, reported for tail sampling
struct OperationResult {
    bool success = true;
    double duration_ms = 0.0;
    std::optional<std::string> error;
};

/// Span record passed through span processors
struct Span {
    SpanContext context;
    std::string parent_span_id;

    std::string name;
    SpanKind kind = SpanKind::kInternal;

    // Timing (nanoseconds since Unix epoch)
    uint64_t start_time_ns = 0;
    uint64_t end_time_ns = 0;

    Attributes attributes;
    std::vector<Link> links;
    SpanStatus status;

    /// Context the span was sampled under; set by the tracer
    std::optional<SamplingContext> sampling;

    /// Get duration in milliseconds
    double DurationMs() const {
        return end_time_ns > start_time_ns
                   ? static_cast<double>(end_time_ns - start_time_ns) / 1e6
                   : 0.0;
    }
};

/// Sampling context a finished span was created under. Spans without one get
/// a context built from their name and links.
SamplingContext SamplingContextOf(const Span& span);

/// Operation outcome derived from a finished span's status and timing
OperationResult ResultOf(const Span& span);

/// Export pipeline stage receiving span lifecycle events
class SpanProcessor {
public:
    virtual ~SpanProcessor() = default;

    /// Called when a span starts
    /// @param span The started span
    /// @param parent_context Parent context (invalid for root spans)
    virtual void OnStart(Span& span, const SpanContext& parent_context) = 0;

    /// Called with a finished span
    virtual void OnEnd(Span&& span) = 0;

    /// Export anything buffered
    virtual absl::Status ForceFlush() = 0;

    /// Flush and release resources
    virtual absl::Status Shutdown() = 0;
};

// Identifier helpers

/// True if every character is 0-9 or a-f
bool IsLowerHex(std::string_view s);

/// True if the string is non-empty and consists only of '0'
bool IsAllZeros(std::string_view s);

/// Random 32-hex-char trace id, never all zeros
std::string GenerateTraceId();

/// Random 16-hex-char span id, never all zeros
std::string GenerateSpanId();

/// Look up a header, exact name first, then ASCII case-insensitively
/// @return Pointer into the map, or nullptr when absent
const std::string* FindHeader(const HeaderMap& headers, std::string_view name);

/// Current wall-clock time in nanoseconds since Unix epoch
uint64_t NowNanos();

}  // namespace tracekeep::trace
