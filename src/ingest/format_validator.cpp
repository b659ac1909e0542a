#include "ingest/format_validator.hpp"

#include <array>

namespace FIN {
namespace Ingest {

namespace {

constexpr std::array<uint8_t, 4> kCompoundMagic = {0xD0, 0xCF, 0x11, 0xE0};
constexpr std::array<uint8_t, 4> kZipMagic = {0x50, 0x4B, 0x03, 0x04};

bool startsWith(const std::vector<uint8_t>& bytes, const std::array<uint8_t, 4>& magic) {
    if (bytes.size() < magic.size()) {
        return false;
    }
    for (size_t i = 0; i < magic.size(); ++i) {
        if (bytes[i] != magic[i]) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string containerFormatToString(ContainerFormat format) {
    switch (format) {
        case ContainerFormat::COMPOUND_DOCUMENT: return "compound-document";
        case ContainerFormat::ZIP: return "zip";
        case ContainerFormat::UNKNOWN: return "unknown";
    }
    return "unknown";
}

ContainerFormat detectContainer(const std::vector<uint8_t>& bytes) {
    if (startsWith(bytes, kCompoundMagic)) {
        return ContainerFormat::COMPOUND_DOCUMENT;
    }
    if (startsWith(bytes, kZipMagic)) {
        return ContainerFormat::ZIP;
    }
    return ContainerFormat::UNKNOWN;
}

bool isEncrypted(const std::vector<uint8_t>& bytes) {
    return detectContainer(bytes) == ContainerFormat::COMPOUND_DOCUMENT;
}

bool isValidFormat(const std::vector<uint8_t>& bytes) {
    return detectContainer(bytes) != ContainerFormat::UNKNOWN;
}

FormatValidation validateFormat(const std::vector<uint8_t>& bytes) {
    FormatValidation result;
    result.format = detectContainer(bytes);
    result.is_valid = result.format != ContainerFormat::UNKNOWN;
    result.is_encrypted = result.format == ContainerFormat::COMPOUND_DOCUMENT;
    result.requires_password = result.is_encrypted;
    return result;
}

} // namespace Ingest
} // namespace FIN
