#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace chandb::trace {

// W3C traceparent layout: 00-<trace-id>-<span-id>-00
static constexpr std::size_t kTraceIdHexLength = 32;
static constexpr std::size_t kSpanIdHexLength  = 16;
static constexpr std::size_t kTraceparentLength =
    2 + 1 + kTraceIdHexLength + 1 + kSpanIdHexLength + 1 + 2;   // 55

// Generate a new random traceparent value, e.g.
//   00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00
// Uses the OpenSSL CSPRNG. Throws CryptoError if it fails.
[[nodiscard]] std::string new_trace_id();

// True if `s` has the exact shape produced by new_trace_id():
// four hyphen-separated lowercase hex segments of width 2, 32, 16 and 2.
[[nodiscard]] bool is_valid_trace_id(std::string_view s);

// ── TraceContext ─────────────────────────────────────────────────────────────
//
// Carries the trace identifier of one operation explicitly through the call
// chain. Cheap to copy.

class TraceContext {
public:
    // Start a new trace with a freshly generated identifier.
    [[nodiscard]] static TraceContext make();

    // Wrap an existing traceparent value. Throws std::invalid_argument if it
    // is not well-formed.
    explicit TraceContext(std::string traceparent);

    // Full traceparent value (suitable for a `traceparent` header).
    [[nodiscard]] const std::string& traceparent() const noexcept { return traceparent_; }

    // The 32-hex trace-id segment.
    [[nodiscard]] std::string_view trace_id() const noexcept {
        return std::string_view(traceparent_).substr(3, kTraceIdHexLength);
    }

    // The 16-hex span-id segment.
    [[nodiscard]] std::string_view span_id() const noexcept {
        return std::string_view(traceparent_).substr(4 + kTraceIdHexLength,
                                                     kSpanIdHexLength);
    }

private:
    std::string traceparent_;
};

} // namespace chandb::trace
