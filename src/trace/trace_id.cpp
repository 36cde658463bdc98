#include "trace/trace_id.hpp"

#include "common/errors.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <openssl/rand.h>

namespace chandb::trace {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

void append_hex(std::string& out, const uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
}

bool is_lower_hex(std::string_view s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string new_trace_id() {
    std::array<uint8_t, (kTraceIdHexLength + kSpanIdHexLength) / 2> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw CryptoError("failed to generate random trace id");
    }

    std::string out;
    out.reserve(kTraceparentLength);
    out += "00-";
    append_hex(out, bytes.data(), kTraceIdHexLength / 2);
    out += '-';
    append_hex(out, bytes.data() + kTraceIdHexLength / 2, kSpanIdHexLength / 2);
    out += "-00";
    return out;
}

bool is_valid_trace_id(std::string_view s) {
    if (s.size() != kTraceparentLength) {
        return false;
    }

    const std::size_t trace_pos = 3;
    const std::size_t span_pos  = trace_pos + kTraceIdHexLength + 1;
    const std::size_t flags_pos = span_pos + kSpanIdHexLength + 1;

    if (s[2] != '-' || s[span_pos - 1] != '-' || s[flags_pos - 1] != '-') {
        return false;
    }

    return is_lower_hex(s.substr(0, 2)) &&
           is_lower_hex(s.substr(trace_pos, kTraceIdHexLength)) &&
           is_lower_hex(s.substr(span_pos, kSpanIdHexLength)) &&
           is_lower_hex(s.substr(flags_pos, 2));
}

// ── TraceContext ─────────────────────────────────────────────────────────────

TraceContext TraceContext::make() {
    return TraceContext{new_trace_id()};
}

TraceContext::TraceContext(std::string traceparent)
    : traceparent_{std::move(traceparent)}
{
    if (!is_valid_trace_id(traceparent_)) {
        throw std::invalid_argument("malformed traceparent: '" + traceparent_ + "'");
    }
}

} // namespace chandb::trace
