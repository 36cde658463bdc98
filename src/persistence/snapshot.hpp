#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

namespace chandb::persistence {

// ── Snapshot header constants ────────────────────────────────────────────────

static constexpr char kSnapshotMagic[] = "CDSS";          // 4 bytes (no NUL)
static constexpr std::size_t kSnapshotMagicSize = 4;
static constexpr uint16_t kSnapshotVersion = 1;
static constexpr std::size_t kSnapshotHeaderSize =
    kSnapshotMagicSize + sizeof(uint16_t);                // 6 bytes

// ── Snapshot load result ─────────────────────────────────────────────────────

struct SnapshotLoadResult {
    std::string value_type;
    std::unordered_map<std::string, std::string> data;    // key -> encoded value
};

// ── Snapshot ─────────────────────────────────────────────────────────────────
//
// Full image of a store's mapping, values already encoded to bytes.
// Binary format:
//
//   [magic: "CDSS" (4B)][version: u16 LE = 1]
//   [value_type_length: u16 LE][value_type]
//   [entry_count: u32 LE]
//     [key_length: u32 LE][key][value_length: u32 LE][value]  × entry_count
//   [crc32: u32 LE]     // CRC of everything from magic through last value
//
// Entries are written sorted by key, so equal mappings produce equal files.
// Atomic write: write to <path>.tmp, fsync, then rename over <path>.
//
// Thread-safety: static methods, no mutable state. Callers serialise writers
// to the same path.

class Snapshot {
public:
    // Save a snapshot atomically to `path`. Failures are returned, not
    // logged above debug level; the caller owns error reporting.
    [[nodiscard]] static std::error_code save(
        const std::filesystem::path& path,
        std::string_view value_type,
        const std::unordered_map<std::string, std::string>& data);

    // Load a snapshot from `path`.
    // Validates magic, version, framing and CRC32. A missing file yields
    // std::errc::no_such_file_or_directory; any malformed content yields
    // std::errc::invalid_argument.
    [[nodiscard]] static std::error_code load(
        const std::filesystem::path& path,
        SnapshotLoadResult& result);
};

} // namespace chandb::persistence
