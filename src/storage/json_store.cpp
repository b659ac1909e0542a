#include "storage/json_store.hpp"
#include "infrastructure/logging/logger.hpp"
#include "model/json_codec.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace FIN {
namespace Storage {

std::string storeErrorToString(StoreError error) {
    switch (error) {
        case StoreError::NONE: return "none";
        case StoreError::NOT_OPEN: return "not_open";
        case StoreError::IO_ERROR: return "io_error";
        case StoreError::PARSE_ERROR: return "parse_error";
        case StoreError::SCHEMA_ERROR: return "schema_error";
        case StoreError::NOT_FOUND: return "not_found";
    }
    return "unknown";
}

JsonStore::JsonStore(std::string directory) : directory_(std::move(directory)) {}

const std::vector<JsonStore::Migration>& JsonStore::migrations() {
    static const std::vector<Migration> list = {
        {1, "create collections", &JsonStore::createCollections},
        {2, "back-fill customTags, isReviewed, notes and parentTagId", &JsonStore::backfillReviewFields}
    };
    return list;
}

std::string JsonStore::pathFor(const std::string& file_name) const {
    return (fs::path(directory_) / file_name).string();
}

StoreError JsonStore::readDocument(const std::string& file_name, nlohmann::json& out) const {
    std::ifstream file(pathFor(file_name));
    if (!file.is_open()) {
        LOG_ERROR("store", "Failed to open " + pathFor(file_name));
        return StoreError::IO_ERROR;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        out = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("store", "Malformed JSON in " + file_name + ": " + e.what());
        return StoreError::PARSE_ERROR;
    }
    return StoreError::NONE;
}

StoreError JsonStore::writeDocument(const std::string& file_name, const nlohmann::json& document) const {
    const std::string target = pathFor(file_name);
    const std::string temp = target + ".tmp";

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("store", "Failed to create " + temp);
            return StoreError::IO_ERROR;
        }
        file << document.dump(2);
        file.flush();
        if (!file.good()) {
            LOG_ERROR("store", "Failed to write " + temp);
            return StoreError::IO_ERROR;
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        LOG_ERROR("store", "Failed to replace " + target + ": " + ec.message());
        fs::remove(temp, ec);
        return StoreError::IO_ERROR;
    }
    return StoreError::NONE;
}

StoreError JsonStore::readSchemaVersion(int& version) const {
    std::error_code ec;
    if (!fs::exists(pathFor(kMetaFile), ec)) {
        version = 0;
        return StoreError::NONE;
    }

    nlohmann::json meta;
    StoreError error = readDocument(kMetaFile, meta);
    if (error != StoreError::NONE) {
        return error;
    }
    if (!meta.is_object() || !meta.contains("schema_version") || !meta["schema_version"].is_number_integer()) {
        LOG_ERROR("store", "meta.json has no integer schema_version");
        return StoreError::SCHEMA_ERROR;
    }
    version = meta["schema_version"].get<int>();
    return StoreError::NONE;
}

StoreError JsonStore::writeSchemaVersion(int version) {
    return writeDocument(kMetaFile, nlohmann::json{{"schema_version", version}});
}

StoreError JsonStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        LOG_ERROR("store", "Failed to create store directory " + directory_ + ": " + ec.message());
        return StoreError::IO_ERROR;
    }

    int version = 0;
    StoreError error = readSchemaVersion(version);
    if (error != StoreError::NONE) {
        return error;
    }
    if (version > kCurrentSchemaVersion) {
        LOG_ERROR_META("store", "Store was written by a newer schema", (Logger::Metadata{
            {"stored_version", std::to_string(version)},
            {"supported_version", std::to_string(kCurrentSchemaVersion)}
        }));
        return StoreError::SCHEMA_ERROR;
    }

    for (const auto& migration : migrations()) {
        if (migration.version <= version) {
            continue;
        }
        error = migration.apply(*this);
        if (error != StoreError::NONE) {
            LOG_ERROR("store", "Migration to v" + std::to_string(migration.version) + " failed: " +
                      storeErrorToString(error));
            return error;
        }
        error = writeSchemaVersion(migration.version);
        if (error != StoreError::NONE) {
            return error;
        }
        version = migration.version;
        LOG_INFO("store", "Applied migration v" + std::to_string(migration.version) + " (" +
                 migration.description + ")");
    }

    schema_version_ = version;
    open_ = true;
    LOG_DEBUG("store", "Store opened at " + directory_ + " (schema v" + std::to_string(version) + ")");
    return StoreError::NONE;
}

StoreError JsonStore::createCollections(JsonStore& store) {
    for (const char* file_name : {kTransactionsFile, kTagsFile, kBudgetsFile, kFilesFile}) {
        std::error_code ec;
        if (fs::exists(store.pathFor(file_name), ec)) {
            continue;
        }
        StoreError error = store.writeDocument(file_name, nlohmann::json::array());
        if (error != StoreError::NONE) {
            return error;
        }
    }
    return StoreError::NONE;
}

StoreError JsonStore::backfillReviewFields(JsonStore& store) {
    nlohmann::json transactions;
    StoreError error = store.readDocument(kTransactionsFile, transactions);
    if (error != StoreError::NONE) {
        return error;
    }
    if (!transactions.is_array()) {
        return StoreError::SCHEMA_ERROR;
    }
    for (auto& txn : transactions) {
        if (!txn.contains("customTags")) txn["customTags"] = nlohmann::json::array();
        if (!txn.contains("isReviewed")) txn["isReviewed"] = false;
        if (!txn.contains("notes")) txn["notes"] = nullptr;
    }

    nlohmann::json tags;
    error = store.readDocument(kTagsFile, tags);
    if (error != StoreError::NONE) {
        return error;
    }
    if (!tags.is_array()) {
        return StoreError::SCHEMA_ERROR;
    }
    for (auto& tag : tags) {
        if (!tag.contains("parentTagId")) tag["parentTagId"] = nullptr;
    }

    error = store.writeDocument(kTransactionsFile, transactions);
    if (error != StoreError::NONE) {
        return error;
    }
    return store.writeDocument(kTagsFile, tags);
}

template<typename T>
StoreError JsonStore::loadCollection(const std::string& file_name, std::vector<T>& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return StoreError::NOT_OPEN;
    }

    nlohmann::json document;
    StoreError error = readDocument(file_name, document);
    if (error != StoreError::NONE) {
        return error;
    }
    if (!document.is_array()) {
        LOG_ERROR("store", file_name + " is not a JSON array");
        return StoreError::SCHEMA_ERROR;
    }

    std::vector<T> items;
    items.reserve(document.size());
    try {
        for (const auto& entry : document) {
            items.push_back(entry.get<T>());
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("store", "Invalid record in " + file_name + ": " + e.what());
        return StoreError::SCHEMA_ERROR;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("store", "Invalid record in " + file_name + ": " + e.what());
        return StoreError::SCHEMA_ERROR;
    }

    out = std::move(items);
    return StoreError::NONE;
}

template<typename T>
StoreError JsonStore::saveCollection(const std::string& file_name, const std::vector<T>& items) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return StoreError::NOT_OPEN;
    }

    nlohmann::json document = nlohmann::json::array();
    for (const auto& item : items) {
        document.push_back(item);
    }
    StoreError error = writeDocument(file_name, document);
    if (error == StoreError::NONE) {
        LOG_DEBUG("store", "Saved " + std::to_string(items.size()) + " records to " + file_name);
    }
    return error;
}

StoreError JsonStore::deleteWhere(const std::string& file_name, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return StoreError::NOT_OPEN;
    }

    nlohmann::json document;
    StoreError error = readDocument(file_name, document);
    if (error != StoreError::NONE) {
        return error;
    }
    if (!document.is_array()) {
        return StoreError::SCHEMA_ERROR;
    }

    const size_t before = document.size();
    nlohmann::json kept = nlohmann::json::array();
    for (const auto& entry : document) {
        auto it = entry.find(key);
        if (it != entry.end() && it->is_string() && it->get<std::string>() == value) {
            continue;
        }
        kept.push_back(entry);
    }
    if (kept.size() == before) {
        return StoreError::NOT_FOUND;
    }
    return writeDocument(file_name, kept);
}

StoreError JsonStore::loadTransactions(std::vector<Transaction>& out) const {
    return loadCollection(kTransactionsFile, out);
}

StoreError JsonStore::saveTransactions(const std::vector<Transaction>& transactions) {
    return saveCollection(kTransactionsFile, transactions);
}

StoreError JsonStore::deleteTransaction(const std::string& id) {
    return deleteWhere(kTransactionsFile, "id", id);
}

StoreError JsonStore::loadTags(std::vector<Tag>& out) const {
    return loadCollection(kTagsFile, out);
}

StoreError JsonStore::saveTags(const std::vector<Tag>& tags) {
    return saveCollection(kTagsFile, tags);
}

StoreError JsonStore::deleteTag(const std::string& id) {
    return deleteWhere(kTagsFile, "id", id);
}

StoreError JsonStore::loadBudgets(std::vector<Budget>& out) const {
    return loadCollection(kBudgetsFile, out);
}

StoreError JsonStore::saveBudgets(const std::vector<Budget>& budgets) {
    return saveCollection(kBudgetsFile, budgets);
}

StoreError JsonStore::deleteBudget(const std::string& id) {
    return deleteWhere(kBudgetsFile, "id", id);
}

StoreError JsonStore::loadFiles(std::vector<UploadedFileRecord>& out) const {
    return loadCollection(kFilesFile, out);
}

StoreError JsonStore::saveFiles(const std::vector<UploadedFileRecord>& files) {
    return saveCollection(kFilesFile, files);
}

StoreError JsonStore::deleteFile(const std::string& file_name) {
    return deleteWhere(kFilesFile, "fileName", file_name);
}

} // namespace Storage
} // namespace FIN
