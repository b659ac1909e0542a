// EN: ZIP container walking with zlib inflate; workbook XML parts are parsed with libxml2.
// FR: Parcours du conteneur ZIP avec décompression zlib ; les parties XML sont parsées avec libxml2.

#include "ingest/xlsx_grid_decoder.hpp"
#include "ingest/format_validator.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <zlib.h>

namespace FIN {
namespace Ingest {

namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr size_t kEndOfCentralDirSize = 22;
constexpr uint32_t kMaxEntrySize = 256u * 1024u * 1024u;

[[noreturn]] void corrupt(const std::string& message) {
    throw DecodeError(DecodeErrorCode::CORRUPT_CONTAINER, message);
}

uint16_t readU16(const std::vector<uint8_t>& bytes, size_t offset) {
    if (offset + 2 > bytes.size()) {
        corrupt("Unexpected end of archive");
    }
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

uint32_t readU32(const std::vector<uint8_t>& bytes, size_t offset) {
    if (offset + 4 > bytes.size()) {
        corrupt("Unexpected end of archive");
    }
    return static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

std::string inflateRaw(const uint8_t* data, size_t size, uint32_t expected_size) {
    std::string output(expected_size, '\0');

    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        corrupt("zlib initialisation failed");
    }

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    stream.avail_in = static_cast<uInt>(size);
    stream.next_out = reinterpret_cast<Bytef*>(&output[0]);
    stream.avail_out = static_cast<uInt>(output.size());

    int status = inflate(&stream, Z_FINISH);
    uLong produced = stream.total_out;
    inflateEnd(&stream);

    // EN: An empty entry deflates to a single final block; Z_BUF_ERROR is fine when nothing was expected.
    // FR: Une entrée vide donne un seul bloc final ; Z_BUF_ERROR est acceptable si rien n'était attendu.
    if (status != Z_STREAM_END && !(expected_size == 0 && status == Z_BUF_ERROR)) {
        corrupt("Deflate stream is invalid");
    }
    if (produced != expected_size) {
        corrupt("Inflated size does not match directory");
    }
    return output;
}

// EN: Owns a parsed libxml2 document.
// FR: Possède un document libxml2 parsé.
struct XmlDocFree {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocFree>;

// EN: Parse one workbook part. Network access and libxml2's stderr reporting are disabled.
// FR: Parse une partie du classeur. L'accès réseau et les messages libxml2 sur stderr sont désactivés.
XmlDocPtr parseXml(const std::string& xml, const std::string& part) {
    static std::once_flag init_flag;
    std::call_once(init_flag, []() { xmlInitParser(); });

    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), part.c_str(), nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc || !xmlDocGetRootElement(doc.get())) {
        corrupt("Malformed XML in " + part);
    }
    return doc;
}

// EN: Element test by local name, so "x:row" and "row" both match "row".
// FR: Test d'élément par nom local : "x:row" et "row" correspondent tous deux à "row".
bool isElement(const xmlNode* node, const char* local_name) {
    return node != nullptr && node->type == XML_ELEMENT_NODE &&
           xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(local_name)) == 0;
}

std::vector<const xmlNode*> childElements(const xmlNode* parent, const char* local_name) {
    std::vector<const xmlNode*> children;
    for (const xmlNode* child = parent ? parent->children : nullptr; child; child = child->next) {
        if (isElement(child, local_name)) {
            children.push_back(child);
        }
    }
    return children;
}

const xmlNode* firstChild(const xmlNode* parent, const char* local_name) {
    for (const xmlNode* child = parent ? parent->children : nullptr; child; child = child->next) {
        if (isElement(child, local_name)) {
            return child;
        }
    }
    return nullptr;
}

// EN: xmlGetProp ignores namespaces, so "id" also finds r:id.
// FR: xmlGetProp ignore les espaces de noms, donc "id" trouve aussi r:id.
std::string attribute(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (value == nullptr) {
        return "";
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string textContent(const xmlNode* node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return "";
    }
    std::string result(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return result;
}

// EN: Text of a string item (<si> or <is>): the plain <t> plus every rich-text run <r><t>.
//     Phonetic runs (<rPh>) are annotations and never part of the cell value.
// FR: Texte d'un élément de chaîne (<si> ou <is>) : le <t> simple plus chaque run enrichi <r><t>.
//     Les runs phonétiques (<rPh>) sont des annotations et ne font jamais partie de la valeur.
std::string stringItemText(const xmlNode* item) {
    std::string text;
    for (const xmlNode* child = item->children; child; child = child->next) {
        if (isElement(child, "t")) {
            text += textContent(child);
        } else if (isElement(child, "r")) {
            for (const xmlNode* run_text : childElements(child, "t")) {
                text += textContent(run_text);
            }
        }
    }
    return text;
}

} // namespace

// ZipArchive

ZipArchive::ZipArchive(const std::vector<uint8_t>& bytes) : bytes_(bytes) {
    if (bytes_.size() < kEndOfCentralDirSize) {
        corrupt("Archive is too small");
    }

    // EN: The end-of-central-directory record sits in the last 22 bytes plus an optional comment.
    // FR: L'enregistrement de fin de répertoire occupe les 22 derniers octets plus un commentaire optionnel.
    size_t eocd = std::string::npos;
    size_t lowest = bytes_.size() > kEndOfCentralDirSize + 0xFFFF ?
        bytes_.size() - kEndOfCentralDirSize - 0xFFFF : 0;
    for (size_t pos = bytes_.size() - kEndOfCentralDirSize + 1; pos-- > lowest;) {
        if (readU32(bytes_, pos) == kEndOfCentralDirSignature) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos) {
        corrupt("End of central directory not found");
    }

    uint16_t entry_count = readU16(bytes_, eocd + 10);
    uint32_t directory_offset = readU32(bytes_, eocd + 16);

    size_t pos = directory_offset;
    for (uint16_t i = 0; i < entry_count; ++i) {
        if (readU32(bytes_, pos) != kCentralHeaderSignature) {
            corrupt("Central directory entry is malformed");
        }
        Entry entry;
        entry.method = readU16(bytes_, pos + 10);
        entry.crc = readU32(bytes_, pos + 16);
        entry.compressed_size = readU32(bytes_, pos + 20);
        entry.uncompressed_size = readU32(bytes_, pos + 24);
        uint16_t name_length = readU16(bytes_, pos + 28);
        uint16_t extra_length = readU16(bytes_, pos + 30);
        uint16_t comment_length = readU16(bytes_, pos + 32);
        entry.local_header_offset = readU32(bytes_, pos + 42);

        size_t name_start = pos + 46;
        if (name_start + name_length > bytes_.size()) {
            corrupt("Central directory entry name is truncated");
        }
        std::string name(reinterpret_cast<const char*>(&bytes_[name_start]), name_length);
        entries_[name] = entry;

        pos = name_start + name_length + extra_length + comment_length;
    }
}

bool ZipArchive::contains(const std::string& name) const {
    return entries_.find(name) != entries_.end();
}

std::vector<std::string> ZipArchive::entryNames() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : entries_) {
        names.push_back(name);
    }
    return names;
}

std::string ZipArchive::read(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        corrupt("Archive entry missing: " + name);
    }
    const Entry& entry = it->second;

    if (entry.uncompressed_size > kMaxEntrySize) {
        corrupt("Archive entry too large: " + name);
    }

    size_t header = entry.local_header_offset;
    if (readU32(bytes_, header) != kLocalHeaderSignature) {
        corrupt("Local header is malformed: " + name);
    }
    uint16_t name_length = readU16(bytes_, header + 26);
    uint16_t extra_length = readU16(bytes_, header + 28);
    size_t data_start = header + 30 + name_length + extra_length;
    if (data_start + entry.compressed_size > bytes_.size()) {
        corrupt("Archive entry is truncated: " + name);
    }
    const uint8_t* data = bytes_.data() + data_start;

    std::string content;
    if (entry.method == 0) {
        if (entry.compressed_size != entry.uncompressed_size) {
            corrupt("Stored entry sizes differ: " + name);
        }
        content.assign(reinterpret_cast<const char*>(data), entry.compressed_size);
    } else if (entry.method == 8) {
        content = inflateRaw(data, entry.compressed_size, entry.uncompressed_size);
    } else {
        throw DecodeError(DecodeErrorCode::UNSUPPORTED_FORMAT,
                          "Unsupported compression method " + std::to_string(entry.method) + " for " + name);
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size()));
    if (static_cast<uint32_t>(crc) != entry.crc) {
        corrupt("CRC mismatch for " + name);
    }
    return content;
}

// XlsxGridDecoder

CellGrid XlsxGridDecoder::decode(const std::vector<uint8_t>& bytes,
                                 const std::optional<std::string>& password) const {
    switch (detectContainer(bytes)) {
        case ContainerFormat::COMPOUND_DOCUMENT:
            if (!password || password->empty()) {
                throw DecodeError(DecodeErrorCode::PASSWORD_REQUIRED,
                                  "This file is password protected. Please provide the password.");
            }
            throw DecodeError(DecodeErrorCode::UNSUPPORTED_FORMAT,
                              "Password-protected files are not supported. Remove the password in Excel "
                              "and export the statement again.");
        case ContainerFormat::UNKNOWN:
            throw DecodeError(DecodeErrorCode::CORRUPT_CONTAINER,
                              "Failed to read Excel file. File may be corrupted or invalid.");
        case ContainerFormat::ZIP:
            break;
    }

    ZipArchive archive(bytes);

    std::vector<std::string> shared_strings;
    if (archive.contains("xl/sharedStrings.xml")) {
        shared_strings = parseSharedStrings(archive.read("xl/sharedStrings.xml"));
    }

    std::string sheet_path = firstWorksheetPath(archive);
    CellGrid grid = parseWorksheet(archive.read(sheet_path), shared_strings);

    LOG_DEBUG("xlsx", "Decoded " + sheet_path + ": " + std::to_string(grid.size()) + " rows, " +
              std::to_string(shared_strings.size()) + " shared strings");
    return grid;
}

std::string XlsxGridDecoder::firstWorksheetPath(const ZipArchive& archive) {
    const std::string fallback = "xl/worksheets/sheet1.xml";

    if (archive.contains("xl/workbook.xml") && archive.contains("xl/_rels/workbook.xml.rels")) {
        XmlDocPtr workbook = parseXml(archive.read("xl/workbook.xml"), "xl/workbook.xml");
        const xmlNode* sheets = firstChild(xmlDocGetRootElement(workbook.get()), "sheets");
        const xmlNode* first_sheet = firstChild(sheets, "sheet");

        if (first_sheet != nullptr) {
            const std::string rel_id = attribute(first_sheet, "id");
            XmlDocPtr rels = parseXml(archive.read("xl/_rels/workbook.xml.rels"), "xl/_rels/workbook.xml.rels");

            // EN: Resolve the sheet's relationship id to its part path.
            // FR: Résout l'id de relation de la feuille vers le chemin de sa partie.
            for (const xmlNode* rel : childElements(xmlDocGetRootElement(rels.get()), "Relationship")) {
                if (attribute(rel, "Id") != rel_id) {
                    continue;
                }
                std::string target = attribute(rel, "Target");
                std::string path = (!target.empty() && target[0] == '/') ? target.substr(1) : "xl/" + target;
                if (archive.contains(path)) {
                    return path;
                }
            }
        }
    }

    if (archive.contains(fallback)) {
        return fallback;
    }
    throw DecodeError(DecodeErrorCode::CORRUPT_CONTAINER, "No sheets found in the workbook");
}

std::vector<std::string> XlsxGridDecoder::parseSharedStrings(const std::string& xml) {
    XmlDocPtr doc = parseXml(xml, "xl/sharedStrings.xml");
    std::vector<std::string> strings;
    for (const xmlNode* item : childElements(xmlDocGetRootElement(doc.get()), "si")) {
        strings.push_back(stringItemText(item));
    }
    return strings;
}

int XlsxGridDecoder::columnIndexFromReference(const std::string& cell_reference) {
    int column = 0;
    size_t letters = 0;
    for (char c : cell_reference) {
        if (c >= 'A' && c <= 'Z') {
            column = column * 26 + (c - 'A' + 1);
        } else if (c >= 'a' && c <= 'z') {
            column = column * 26 + (c - 'a' + 1);
        } else {
            break;
        }
        ++letters;
    }
    return letters == 0 ? -1 : column - 1;
}

CellGrid XlsxGridDecoder::parseWorksheet(const std::string& xml, const std::vector<std::string>& shared_strings) {
    CellGrid grid;
    XmlDocPtr doc = parseXml(xml, "worksheet");

    const xmlNode* sheet_data = firstChild(xmlDocGetRootElement(doc.get()), "sheetData");
    if (sheet_data == nullptr) {
        return grid;
    }

    for (const xmlNode* row_node : childElements(sheet_data, "row")) {
        // EN: Rows carry their 1-based index; gaps become blank rows.
        // FR: Les lignes portent leur index à partir de 1 ; les trous deviennent des lignes vides.
        size_t row_index = grid.size();
        std::string row_ref = attribute(row_node, "r");
        if (!row_ref.empty()) {
            long parsed = std::strtol(row_ref.c_str(), nullptr, 10);
            if (parsed >= 1 && static_cast<size_t>(parsed) - 1 >= grid.size()) {
                row_index = static_cast<size_t>(parsed) - 1;
            }
        }
        if (grid.size() <= row_index) {
            grid.resize(row_index + 1);
        }
        CellRow& row = grid[row_index];

        for (const xmlNode* cell_node : childElements(row_node, "c")) {
            int column = columnIndexFromReference(attribute(cell_node, "r"));
            if (column < 0) {
                column = static_cast<int>(row.size());
            }

            const std::string type = attribute(cell_node, "t");
            const xmlNode* value_node = firstChild(cell_node, "v");
            const std::string raw = value_node ? textContent(value_node) : std::string();

            // EN: Cell type: shared string, inline string, formula string, boolean, or number.
            // FR: Type de cellule : chaîne partagée, chaîne en ligne, chaîne de formule, booléen ou nombre.
            Cell cell;
            if (type == "s") {
                char* end = nullptr;
                unsigned long index = std::strtoul(raw.c_str(), &end, 10);
                if (raw.empty() || *end != '\0' || index >= shared_strings.size()) {
                    throw DecodeError(DecodeErrorCode::CORRUPT_CONTAINER, "Shared string index out of range");
                }
                cell = shared_strings[index];
            } else if (type == "inlineStr") {
                const xmlNode* inline_string = firstChild(cell_node, "is");
                cell = inline_string ? stringItemText(inline_string) : std::string();
            } else if (type == "str" || type == "e") {
                cell = raw;
            } else if (type == "b") {
                cell = (raw == "1");
            } else if (!raw.empty()) {
                char* end = nullptr;
                double number = std::strtod(raw.c_str(), &end);
                if (end != nullptr && *end == '\0') {
                    cell = number;
                } else {
                    cell = raw;
                }
            }

            if (row.size() <= static_cast<size_t>(column)) {
                row.resize(static_cast<size_t>(column) + 1);
            }
            row[static_cast<size_t>(column)] = cell;
        }
    }

    return grid;
}

} // namespace Ingest
} // namespace FIN
