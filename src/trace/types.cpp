/// @file types.cpp
/// @brief Identifier helpers and span-record accessors

#include "types.h"

#include <atomic>
#include <chrono>
#include <random>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace tracekeep::trace {

namespace {

std::atomic<uint64_t> g_next_invocation{1};

uint64_t RandomWord() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    return gen();
}

std::string RandomHex(size_t words) {
    std::string result;
    result.reserve(words * 16);
    for (size_t i = 0; i < words; ++i) {
        absl::StrAppend(&result, absl::Hex(RandomWord(), absl::kZeroPad16));
    }
    return result;
}

}  // namespace

InvocationId InvocationId::Next() {
    return InvocationId(g_next_invocation.fetch_add(1, std::memory_order_relaxed));
}

bool SpanContext::IsValid() const {
    return trace_id.size() == kTraceIdHexLength && IsLowerHex(trace_id) &&
           !IsAllZeros(trace_id) && span_id.size() == kSpanIdHexLength &&
           IsLowerHex(span_id) && !IsAllZeros(span_id);
}

SamplingContext SamplingContextOf(const Span& span) {
    if (span.sampling.has_value()) {
        return *span.sampling;
    }
    SamplingContext ctx;
    ctx.operation_name = span.name;
    ctx.links = span.links;
    return ctx;
}

OperationResult ResultOf(const Span& span) {
    OperationResult result;
    result.success = span.status.code != StatusCode::kError;
    result.duration_ms = span.DurationMs();
    if (!result.success && !span.status.message.empty()) {
        result.error = span.status.message;
    }
    return result;
}

bool IsLowerHex(std::string_view s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

bool IsAllZeros(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (c != '0') return false;
    }
    return true;
}

std::string GenerateTraceId() {
    std::string id;
    do {
        id = RandomHex(2);
    } while (IsAllZeros(id));
    return id;
}

std::string GenerateSpanId() {
    std::string id;
    do {
        id = RandomHex(1);
    } while (IsAllZeros(id));
    return id;
}

const std::string* FindHeader(const HeaderMap& headers, std::string_view name) {
    auto it = headers.find(std::string(name));
    if (it != headers.end()) {
        return &it->second;
    }
    for (const auto& [key, value] : headers) {
        if (absl::EqualsIgnoreCase(key, absl::string_view(name.data(), name.size()))) {
            return &value;
        }
    }
    return nullptr;
}

uint64_t NowNanos() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

}  // namespace tracekeep::trace
