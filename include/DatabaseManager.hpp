#pragma once
#include "PromptTypes.hpp"

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

// Forward-declare sqlite3 so consumers of this header don't need sqlite3.h
struct sqlite3;
struct sqlite3_stmt;
class VaultStore;

// SQLite write-through store for the live vault.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& dbPath);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Create tables if not present
    void init();

    // ---- Single mutations (caller wraps them in a transaction)
    void insertPrompt(const Prompt& prompt);          // prompt row + all versions + tags
    void insertVersion(const std::string& key, const Version& version);
    void upsertTag(const std::string& key, const std::string& name, std::uint32_t version);

    // ---- Whole-vault operations
    // Rows pass through VaultStore::fromPrompts; throws CorruptDataError.
    VaultStore loadVault() const;
    // Deletes every row and writes the store back, in one transaction.
    void replaceVault(const VaultStore& store);

    // ---- Transactions
    void beginTransaction();
    void commit();
    void rollback();

    const std::string& path() const { return m_dbPath; }

private:
    struct StmtCloser {
        void operator()(sqlite3_stmt* stmt) const;
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StmtCloser>;

    Statement prepare(const char* sql, const char* what) const;
    void stepDone(sqlite3_stmt* stmt, const char* what) const;

    std::string m_dbPath;
    sqlite3*    m_db = nullptr; // persistent DB connection

    // helper to run raw SQL without parameters on m_db
    void exec(const std::string& sql) const;
};
