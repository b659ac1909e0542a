// EN: CRC-32 fingerprint of uploaded statement bytes.
// FR: Empreinte CRC-32 des octets d'un relevé importé.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace FIN {
namespace Storage {

uint32_t crc32Of(const std::vector<uint8_t>& bytes);

// EN: 8 lowercase hex digits.
// FR: 8 chiffres hexadécimaux minuscules.
std::string crc32Hex(const std::vector<uint8_t>& bytes);

} // namespace Storage
} // namespace FIN
