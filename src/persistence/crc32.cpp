#include "persistence/crc32.hpp"

#include <boost/crc.hpp>

namespace chandb::persistence {

uint32_t crc32(const uint8_t* data, std::size_t length) {
    boost::crc_32_type crc;
    crc.process_bytes(data, length);
    return crc.checksum();
}

} // namespace chandb::persistence
