// EN: Container sniffing from leading magic bytes. No decryption is performed.
// FR: Détection du conteneur par les octets magiques initiaux. Aucun déchiffrement n'est effectué.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace FIN {
namespace Ingest {

enum class ContainerFormat {
    COMPOUND_DOCUMENT, // EN: D0 CF 11 E0, encrypted workbook / FR: D0 CF 11 E0, classeur chiffré
    ZIP,               // EN: 50 4B 03 04, plain workbook / FR: 50 4B 03 04, classeur en clair
    UNKNOWN
};

struct FormatValidation {
    bool is_valid{false};
    bool is_encrypted{false};
    bool requires_password{false};
    ContainerFormat format{ContainerFormat::UNKNOWN};
};

std::string containerFormatToString(ContainerFormat format);

ContainerFormat detectContainer(const std::vector<uint8_t>& bytes);
bool isEncrypted(const std::vector<uint8_t>& bytes);
bool isValidFormat(const std::vector<uint8_t>& bytes);
FormatValidation validateFormat(const std::vector<uint8_t>& bytes);

} // namespace Ingest
} // namespace FIN
