// EN: GridDecoder for plain Office Open XML workbooks (ZIP container, first worksheet).
// FR: GridDecoder pour classeurs Office Open XML en clair (conteneur ZIP, première feuille).

#pragma once

#include "ingest/grid_decoder.hpp"

#include <map>
#include <string>
#include <vector>

namespace FIN {
namespace Ingest {

// EN: Minimal ZIP reader over an in-memory archive. Entries are inflated with zlib and their
//     CRC-32 verified. Throws DecodeError(CORRUPT_CONTAINER) on any structural problem.
// FR: Lecteur ZIP minimal sur une archive en mémoire. Les entrées sont décompressées avec zlib
//     et leur CRC-32 vérifié. Lance DecodeError(CORRUPT_CONTAINER) sur tout problème structurel.
class ZipArchive {
public:
    explicit ZipArchive(const std::vector<uint8_t>& bytes);

    bool contains(const std::string& name) const;
    std::string read(const std::string& name) const;
    std::vector<std::string> entryNames() const;

private:
    struct Entry {
        uint16_t method{0};
        uint32_t crc{0};
        uint32_t compressed_size{0};
        uint32_t uncompressed_size{0};
        uint32_t local_header_offset{0};
    };

    const std::vector<uint8_t>& bytes_;
    std::map<std::string, Entry> entries_;
};

class XlsxGridDecoder : public GridDecoder {
public:
    CellGrid decode(const std::vector<uint8_t>& bytes,
                    const std::optional<std::string>& password) const override;

    // EN: Exposed for tests. Both parsers throw DecodeError(CORRUPT_CONTAINER) on malformed XML.
    // FR: Exposés pour les tests. Les deux parseurs lancent DecodeError(CORRUPT_CONTAINER) si le XML est invalide.
    static std::vector<std::string> parseSharedStrings(const std::string& xml);
    static CellGrid parseWorksheet(const std::string& xml, const std::vector<std::string>& shared_strings);
    static int columnIndexFromReference(const std::string& cell_reference);

private:
    static std::string firstWorksheetPath(const ZipArchive& archive);
};

} // namespace Ingest
} // namespace FIN
