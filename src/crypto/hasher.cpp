#include "crypto/hasher.hpp"

#include <algorithm>
#include <memory>

#include <openssl/evp.h>

namespace chandb::crypto {

namespace {

// ── RAII wrapper for the digest context ──────────────────────────────────────

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

// Standard base64 → URL-safe alphabet.
void to_url_alphabet(std::string& s) {
    std::replace(s.begin(), s.end(), '+', '-');
    std::replace(s.begin(), s.end(), '/', '_');
}

} // anonymous namespace

std::string hash_bytes(std::string_view bytes) {
    DigestContext ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        throw CryptoError("failed to create digest context");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        throw CryptoError("failed to initialize SHA-1");
    }

    if (EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
        throw CryptoError("failed to update SHA-1");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw CryptoError("failed to finalize SHA-1");
    }

    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL.
    std::string out(4 * ((digest_len + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  digest, static_cast<int>(digest_len));
    if (n < 0) {
        throw CryptoError("failed to base64-encode digest");
    }
    out.resize(static_cast<std::size_t>(n));
    to_url_alphabet(out);
    return out;
}

} // namespace chandb::crypto
