#include "catalog/preconditions.hpp"

#include <fmt/format.h>

namespace chandb::catalog {

namespace {

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Strip the weak prefix and surrounding quotes from an entity tag.
std::string_view bare_etag(std::string_view tag) {
    tag = trim(tag);
    if (tag.substr(0, 2) == "W/") {
        tag.remove_prefix(2);
    }
    if (tag.size() >= 2 && tag.front() == '"' && tag.back() == '"') {
        tag = tag.substr(1, tag.size() - 2);
    }
    return tag;
}

bool matches(const std::vector<std::string>& tags, std::string_view current) {
    for (const auto& tag : tags) {
        const auto bare = bare_etag(tag);
        if (bare.empty()) {
            continue;
        }
        if (bare == "*") {
            if (!current.empty()) {
                return true;
            }
            continue;
        }
        if (bare == current) {
            return true;
        }
    }
    return false;
}

std::string join(const std::vector<std::string>& tags) {
    std::string out;
    for (const auto& tag : tags) {
        if (!out.empty()) {
            out += ", ";
        }
        out += tag;
    }
    return out;
}

} // anonymous namespace

bool Preconditions::empty() const noexcept {
    return if_match.empty() && if_none_match.empty() &&
           !if_modified_since && !if_unmodified_since;
}

std::vector<std::string> Preconditions::evaluate(std::string_view etag,
                                                 time_point modified) const {
    std::vector<std::string> failures;

    const std::string found = etag.empty()
        ? std::string("found no existing resource")
        : fmt::format("found resource with ETag {}", etag);

    if (!if_match.empty() && !matches(if_match, etag)) {
        failures.push_back(fmt::format("If-Match: {}; {}", join(if_match), found));
    }

    if (!if_none_match.empty() && matches(if_none_match, etag)) {
        failures.push_back(fmt::format("If-None-Match: {}; {}", join(if_none_match), found));
    }

    if (if_modified_since && !(modified > *if_modified_since)) {
        failures.push_back("If-Modified-Since: resource not modified since the given time");
    }

    if (if_unmodified_since && modified > *if_unmodified_since) {
        failures.push_back("If-Unmodified-Since: resource modified after the given time");
    }

    return failures;
}

std::vector<std::string> parse_etag_list(std::string_view header) {
    std::vector<std::string> result;
    while (!header.empty()) {
        const auto comma = header.find(',');
        const auto item = trim(header.substr(0, comma));
        if (!item.empty()) {
            result.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        header.remove_prefix(comma + 1);
    }
    return result;
}

} // namespace chandb::catalog
