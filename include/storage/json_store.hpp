// EN: Directory-backed store: one JSON array per collection plus meta.json holding the schema version.
// FR: Store sur répertoire : un tableau JSON par collection plus meta.json avec la version du schéma.

#pragma once

#include "storage/transaction_store.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace FIN {
namespace Storage {

class JsonStore : public TransactionStore {
public:
    static constexpr int kCurrentSchemaVersion = 2;

    // EN: A migration upgrades the raw documents from version - 1 to version.
    // FR: Une migration fait passer les documents bruts de version - 1 à version.
    struct Migration {
        int version;
        std::string description;
        std::function<StoreError(JsonStore&)> apply;
    };

    explicit JsonStore(std::string directory);

    // EN: Create the directory if needed, then run every pending migration in order.
    // FR: Crée le répertoire si besoin puis applique les migrations en attente dans l'ordre.
    StoreError open() override;

    bool isOpen() const { return open_; }
    int schemaVersion() const { return schema_version_; }
    const std::string& directory() const { return directory_; }

    StoreError loadTransactions(std::vector<Transaction>& out) const override;
    StoreError saveTransactions(const std::vector<Transaction>& transactions) override;
    StoreError deleteTransaction(const std::string& id) override;

    StoreError loadTags(std::vector<Tag>& out) const override;
    StoreError saveTags(const std::vector<Tag>& tags) override;
    StoreError deleteTag(const std::string& id) override;

    StoreError loadBudgets(std::vector<Budget>& out) const override;
    StoreError saveBudgets(const std::vector<Budget>& budgets) override;
    StoreError deleteBudget(const std::string& id) override;

    StoreError loadFiles(std::vector<UploadedFileRecord>& out) const override;
    StoreError saveFiles(const std::vector<UploadedFileRecord>& files) override;
    StoreError deleteFile(const std::string& file_name) override;

    static const std::vector<Migration>& migrations();

    static constexpr const char* kTransactionsFile = "transactions.json";
    static constexpr const char* kTagsFile = "tags.json";
    static constexpr const char* kBudgetsFile = "budgets.json";
    static constexpr const char* kFilesFile = "files.json";
    static constexpr const char* kMetaFile = "meta.json";

private:
    std::string pathFor(const std::string& file_name) const;

    StoreError readDocument(const std::string& file_name, nlohmann::json& out) const;
    // EN: Write to <file>.tmp then rename over the target.
    // FR: Écrit dans <fichier>.tmp puis renomme sur la cible.
    StoreError writeDocument(const std::string& file_name, const nlohmann::json& document) const;

    StoreError readSchemaVersion(int& version) const;
    StoreError writeSchemaVersion(int version);

    template<typename T>
    StoreError loadCollection(const std::string& file_name, std::vector<T>& out) const;
    template<typename T>
    StoreError saveCollection(const std::string& file_name, const std::vector<T>& items);
    StoreError deleteWhere(const std::string& file_name, const std::string& key, const std::string& value);

    static StoreError createCollections(JsonStore& store);
    static StoreError backfillReviewFields(JsonStore& store);

    std::string directory_;
    bool open_ = false;
    int schema_version_ = 0;
    mutable std::mutex mutex_;
};

} // namespace Storage
} // namespace FIN
