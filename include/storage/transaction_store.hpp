// EN: Persistence contract for transactions, tags, budgets and uploaded-file records.
// FR: Contrat de persistance pour transactions, tags, budgets et fichiers importés.

#pragma once

#include "model/transaction.hpp"

#include <string>
#include <vector>

namespace FIN {
namespace Storage {

enum class StoreError {
    NONE,
    NOT_OPEN,
    IO_ERROR,
    PARSE_ERROR,
    SCHEMA_ERROR,
    NOT_FOUND
};

std::string storeErrorToString(StoreError error);

// EN: Load-all / save-all / delete-by-id per collection. Save-all replaces the whole collection.
// FR: Tout charger / tout sauver / supprimer par id pour chaque collection. Save-all remplace la collection.
class TransactionStore {
public:
    virtual ~TransactionStore() = default;

    virtual StoreError open() = 0;

    virtual StoreError loadTransactions(std::vector<Transaction>& out) const = 0;
    virtual StoreError saveTransactions(const std::vector<Transaction>& transactions) = 0;
    virtual StoreError deleteTransaction(const std::string& id) = 0;

    virtual StoreError loadTags(std::vector<Tag>& out) const = 0;
    virtual StoreError saveTags(const std::vector<Tag>& tags) = 0;
    virtual StoreError deleteTag(const std::string& id) = 0;

    virtual StoreError loadBudgets(std::vector<Budget>& out) const = 0;
    virtual StoreError saveBudgets(const std::vector<Budget>& budgets) = 0;
    virtual StoreError deleteBudget(const std::string& id) = 0;

    // EN: Uploaded files are keyed by file name.
    // FR: Les fichiers importés sont identifiés par leur nom.
    virtual StoreError loadFiles(std::vector<UploadedFileRecord>& out) const = 0;
    virtual StoreError saveFiles(const std::vector<UploadedFileRecord>& files) = 0;
    virtual StoreError deleteFile(const std::string& file_name) = 0;
};

} // namespace Storage
} // namespace FIN
