#pragma once

#include <cstddef>
#include <cstdint>

namespace chandb::persistence {

// CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320) of `length` bytes,
// the same checksum zlib and PNG use.
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

} // namespace chandb::persistence
