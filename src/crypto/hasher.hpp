#pragma once

#include "common/errors.hpp"
#include "storage/value_codec.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace chandb::crypto {

// Length of a digest string: base64 of a 20-byte SHA-1, with padding.
static constexpr std::size_t kDigestLength = 28;

// SHA-1 of `bytes`, rendered as URL-safe base64 (alphabet A-Z a-z 0-9 - _,
// '=' padding). The result is safe to embed in an HTTP ETag header.
// Throws CryptoError if the digest backend fails.
[[nodiscard]] std::string hash_bytes(std::string_view bytes);

// Content hash of `value` over its canonical ValueCodec encoding. Values
// with equal contents hash equal regardless of how they were built (map
// entries are encoded in key order).
template <typename V>
[[nodiscard]] std::string hash(const V& value) {
    std::string encoded;
    if (!ValueCodec<V>::encode(value, encoded)) {
        throw CryptoError("failed to encode " + ValueCodec<V>::type_name() +
                          " for hashing");
    }
    return hash_bytes(encoded);
}

} // namespace chandb::crypto
