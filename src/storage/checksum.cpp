#include "storage/checksum.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstdio>

namespace FIN {
namespace Storage {

uint32_t crc32Of(const std::vector<uint8_t>& bytes) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // EN: zlib takes uInt lengths, feed large buffers in chunks.
    // FR: zlib prend des longueurs uInt, on découpe les gros tampons.
    const size_t chunk = 1u << 30;
    for (size_t offset = 0; offset < bytes.size(); offset += chunk) {
        size_t len = std::min(chunk, bytes.size() - offset);
        crc = crc32(crc, bytes.data() + offset, static_cast<uInt>(len));
    }
    return static_cast<uint32_t>(crc);
}

std::string crc32Hex(const std::vector<uint8_t>& bytes) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(crc32Of(bytes)));
    return buf;
}

} // namespace Storage
} // namespace FIN
