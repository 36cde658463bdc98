#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chandb::catalog {

// ── Preconditions ────────────────────────────────────────────────────────────
//
// Conditional-request checks (RFC 9110 §13) evaluated against the current
// state of a resource before a write. ETag values may be given quoted or
// weak ("W/\"...\""); comparison uses the bare value. "*" matches any
// existing resource.

struct Preconditions {
    using time_point = std::chrono::system_clock::time_point;

    std::vector<std::string> if_match;
    std::vector<std::string> if_none_match;
    std::optional<time_point> if_modified_since;
    std::optional<time_point> if_unmodified_since;

    // True when no check is set.
    [[nodiscard]] bool empty() const noexcept;

    // Evaluate against the resource's current ETag and last-modified time.
    // An empty `etag` means the resource does not exist.
    // Returns one message per failed check; empty when all checks pass.
    [[nodiscard]] std::vector<std::string> evaluate(std::string_view etag,
                                                    time_point modified) const;
};

// Split an If-Match / If-None-Match header value on commas, trimming blanks.
[[nodiscard]] std::vector<std::string> parse_etag_list(std::string_view header);

} // namespace chandb::catalog
