#include "persistence/snapshot.hpp"
#include "persistence/crc32.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace chandb::persistence {

namespace {

// ── Little-endian serialisation helpers ──────────────────────────────────────

void append_raw(std::vector<uint8_t>& buf, const void* data, std::size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

void append_u16(std::vector<uint8_t>& buf, uint16_t v) {
    uint8_t b[2];
    b[0] = static_cast<uint8_t>(v);
    b[1] = static_cast<uint8_t>(v >> 8);
    buf.insert(buf.end(), b, b + 2);
}

void append_u32(std::vector<uint8_t>& buf, uint32_t v) {
    uint8_t b[4];
    b[0] = static_cast<uint8_t>(v);
    b[1] = static_cast<uint8_t>(v >> 8);
    b[2] = static_cast<uint8_t>(v >> 16);
    b[3] = static_cast<uint8_t>(v >> 24);
    buf.insert(buf.end(), b, b + 4);
}

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0]) |
           (static_cast<uint16_t>(p[1]) << 8);
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

// Bytes remaining between `p` and `end`.
std::size_t remaining(const uint8_t* p, const uint8_t* end) {
    return static_cast<std::size_t>(end - p);
}

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const uint8_t* data,
                                        std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Read exactly `len` bytes from fd into `buf`. Returns error_code on failure.
[[nodiscard]] std::error_code read_all(int fd, uint8_t* buf, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        auto n = ::read(fd, buf + total, len - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        if (n == 0) {
            return std::make_error_code(std::errc::io_error);  // unexpected EOF
        }
        total += static_cast<std::size_t>(n);
    }
    return {};
}

} // anonymous namespace

// ── Snapshot::save ───────────────────────────────────────────────────────────

std::error_code Snapshot::save(
    const std::filesystem::path& path,
    std::string_view value_type,
    const std::unordered_map<std::string, std::string>& data) {

    if (value_type.size() > std::numeric_limits<uint16_t>::max() ||
        data.size() > std::numeric_limits<uint32_t>::max()) {
        return std::make_error_code(std::errc::value_too_large);
    }

    // Build the binary payload (everything except the trailing CRC).
    std::vector<uint8_t> buf;
    buf.reserve(kSnapshotHeaderSize + 2 + value_type.size() + 4 +
                data.size() * 64 + 4);

    append_raw(buf, kSnapshotMagic, kSnapshotMagicSize);
    append_u16(buf, kSnapshotVersion);

    append_u16(buf, static_cast<uint16_t>(value_type.size()));
    append_raw(buf, value_type.data(), value_type.size());

    append_u32(buf, static_cast<uint32_t>(data.size()));

    // Entries: sorted by key for deterministic output.
    std::vector<const std::pair<const std::string, std::string>*> sorted;
    sorted.reserve(data.size());
    for (const auto& entry : data) {
        sorted.push_back(&entry);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const auto* a, const auto* b) { return a->first < b->first; });

    for (const auto* entry : sorted) {
        const auto& [key, value] = *entry;
        if (key.size() > std::numeric_limits<uint32_t>::max() ||
            value.size() > std::numeric_limits<uint32_t>::max()) {
            return std::make_error_code(std::errc::value_too_large);
        }
        append_u32(buf, static_cast<uint32_t>(key.size()));
        append_raw(buf, key.data(), key.size());
        append_u32(buf, static_cast<uint32_t>(value.size()));
        append_raw(buf, value.data(), value.size());
    }

    uint32_t checksum = crc32(buf.data(), buf.size());
    append_u32(buf, checksum);

    // Atomic write: write to .tmp, fsync, rename.
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::debug("Snapshot: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    auto ec = write_all(fd, buf.data(), buf.size());
    if (ec) {
        spdlog::debug("Snapshot: write failed: {}", ec.message());
        ::close(fd);
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    if (::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::debug("Snapshot: fsync failed: {}", ec.message());
        ::close(fd);
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    if (::close(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::debug("Snapshot: close failed: {}", ec.message());
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        spdlog::debug("Snapshot: rename failed: {}", rename_ec.message());
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return rename_ec;
    }

    spdlog::debug("Snapshot: saved {} entries of {} to {}",
                  data.size(), value_type, path.string());

    return {};
}

// ── Snapshot::load ───────────────────────────────────────────────────────────

std::error_code Snapshot::load(
    const std::filesystem::path& path,
    SnapshotLoadResult& result) {

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        if (ec == std::errc::no_such_file_or_directory) {
            spdlog::debug("Snapshot: no file at {}", path.string());
        } else {
            spdlog::error("Snapshot: failed to open {}: {}", path.string(),
                          ec.message());
        }
        return ec;
    }

    auto file_size = ::lseek(fd, 0, SEEK_END);
    if (file_size < 0 || ::lseek(fd, 0, SEEK_SET) < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        ::close(fd);
        return ec;
    }

    // Minimum valid snapshot: header(6) + type_len(2) + entry_count(4) + crc(4)
    static constexpr std::size_t kMinSize = kSnapshotHeaderSize + 2 + 4 + 4;

    if (static_cast<std::size_t>(file_size) < kMinSize) {
        ::close(fd);
        spdlog::error("Snapshot: file too small ({} bytes)", file_size);
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::vector<uint8_t> buf(static_cast<std::size_t>(file_size));
    auto ec = read_all(fd, buf.data(), buf.size());
    ::close(fd);
    if (ec) {
        spdlog::error("Snapshot: read failed: {}", ec.message());
        return ec;
    }

    // Verify the CRC before trusting any length field.
    const std::size_t data_len = buf.size() - 4;
    const uint32_t stored_crc = read_u32(buf.data() + data_len);
    const uint32_t computed_crc = crc32(buf.data(), data_len);
    if (stored_crc != computed_crc) {
        spdlog::error("Snapshot: CRC mismatch (stored={:#010x}, computed={:#010x})",
                      stored_crc, computed_crc);
        return std::make_error_code(std::errc::invalid_argument);
    }

    const uint8_t* p = buf.data();
    const uint8_t* end = buf.data() + data_len;

    if (std::memcmp(p, kSnapshotMagic, kSnapshotMagicSize) != 0) {
        spdlog::error("Snapshot: invalid magic");
        return std::make_error_code(std::errc::invalid_argument);
    }
    p += kSnapshotMagicSize;

    uint16_t version = read_u16(p);
    p += 2;
    if (version != kSnapshotVersion) {
        spdlog::error("Snapshot: unsupported version {}", version);
        return std::make_error_code(std::errc::invalid_argument);
    }

    uint16_t type_len = read_u16(p);
    p += 2;
    if (remaining(p, end) < type_len) {
        spdlog::error("Snapshot: truncated at value type");
        return std::make_error_code(std::errc::invalid_argument);
    }
    result.value_type.assign(reinterpret_cast<const char*>(p), type_len);
    p += type_len;

    if (remaining(p, end) < 4) {
        spdlog::error("Snapshot: truncated at entry count");
        return std::make_error_code(std::errc::invalid_argument);
    }
    uint32_t entry_count = read_u32(p);
    p += 4;

    result.data.clear();

    for (uint32_t i = 0; i < entry_count; ++i) {
        if (remaining(p, end) < 4) {
            spdlog::error("Snapshot: truncated at entry {} key_length", i);
            return std::make_error_code(std::errc::invalid_argument);
        }
        uint32_t key_len = read_u32(p);
        p += 4;

        if (remaining(p, end) < key_len) {
            spdlog::error("Snapshot: truncated at entry {} key", i);
            return std::make_error_code(std::errc::invalid_argument);
        }
        std::string key(reinterpret_cast<const char*>(p), key_len);
        p += key_len;

        if (remaining(p, end) < 4) {
            spdlog::error("Snapshot: truncated at entry {} value_length", i);
            return std::make_error_code(std::errc::invalid_argument);
        }
        uint32_t val_len = read_u32(p);
        p += 4;

        if (remaining(p, end) < val_len) {
            spdlog::error("Snapshot: truncated at entry {} value", i);
            return std::make_error_code(std::errc::invalid_argument);
        }
        std::string value(reinterpret_cast<const char*>(p), val_len);
        p += val_len;

        if (!result.data.emplace(std::move(key), std::move(value)).second) {
            spdlog::error("Snapshot: duplicate key at entry {}", i);
            return std::make_error_code(std::errc::invalid_argument);
        }
    }

    if (p != end) {
        spdlog::error("Snapshot: {} trailing bytes after last entry",
                      remaining(p, end));
        return std::make_error_code(std::errc::invalid_argument);
    }

    spdlog::debug("Snapshot: loaded {} entries of {} from {}",
                  result.data.size(), result.value_type, path.string());

    return {};
}

} // namespace chandb::persistence
