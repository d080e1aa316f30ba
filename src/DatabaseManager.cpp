// src/DatabaseManager.cpp
#include "DatabaseManager.hpp"
#include "VaultStore.hpp"

#include <sqlite3.h>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace {
    int checked_length(const std::string& s) {
        if (s.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            throw std::length_error("value too large for sqlite");
        }
        return static_cast<int>(s.size());
    }

    // Content may hold arbitrary bytes (including NUL), so it round-trips as a BLOB.
    int bind_bytes(sqlite3_stmt* st, int col, const std::string& s) {
        return sqlite3_bind_blob(st, col, s.data(), checked_length(s), SQLITE_TRANSIENT);
    }

    std::string read_bytes(sqlite3_stmt* st, int col) {
        const void* p = sqlite3_column_blob(st, col);
        const int n = sqlite3_column_bytes(st, col);
        return (p && n > 0) ? std::string(static_cast<const char*>(p), static_cast<std::size_t>(n))
                            : std::string{};
    }

    // Keys and tag names are TEXT but bound with an explicit length so an
    // embedded NUL is stored, compared and read back intact.
    int bind_text(sqlite3_stmt* st, int col, const std::string& s) {
        return sqlite3_bind_text(st, col, s.data(), checked_length(s), SQLITE_TRANSIENT);
    }

    // Null-safe read of TEXT columns
    std::string read_text_nullable(sqlite3_stmt* st, int col) {
        const unsigned char* p = sqlite3_column_text(st, col);
        const int n = sqlite3_column_bytes(st, col);
        return (p && n > 0) ? std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(n))
                            : std::string{};
    }

    std::uint32_t read_version_number(sqlite3_stmt* st, int col) {
        const sqlite3_int64 v = sqlite3_column_int64(st, col);
        if (v < 0 || v > std::numeric_limits<std::uint32_t>::max()) {
            return 0;  // rejected by VaultStore::validatePrompt
        }
        return static_cast<std::uint32_t>(v);
    }
}

void DatabaseManager::StmtCloser::operator()(sqlite3_stmt* stmt) const {
    if (stmt) sqlite3_finalize(stmt);
}

// ---- Persistent-connection ctor/dtor ----
DatabaseManager::DatabaseManager(const std::string& dbPath)
    : m_dbPath(dbPath), m_db(nullptr)
{
    int rc = sqlite3_open_v2(
        m_dbPath.c_str(),
        &m_db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
        nullptr
    );
    if (rc != SQLITE_OK || !m_db) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "unknown";
        if (m_db) sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("sqlite3_open_v2 failed: " + msg);
    }

    exec("PRAGMA foreign_keys = ON;");
}

DatabaseManager::~DatabaseManager() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

// Run raw SQL (no parameters) on the same connection
void DatabaseManager::exec(const std::string& sql) const {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown";
        sqlite3_free(errMsg);
        throw std::runtime_error("sqlite3_exec failed: " + msg);
    }
}

DatabaseManager::Statement DatabaseManager::prepare(const char* sql, const char* what) const {
    sqlite3_stmt* stmtRaw = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql, -1, &stmtRaw, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite3_prepare_v2(") + what + "): "
                                 + sqlite3_errmsg(m_db));
    }
    return Statement(stmtRaw);
}

void DatabaseManager::stepDone(sqlite3_stmt* stmt, const char* what) const {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("step ") + what + ": " + sqlite3_errmsg(m_db));
    }
}

void DatabaseManager::init() {
    static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS prompts (
  key TEXT PRIMARY KEY NOT NULL
);

CREATE TABLE IF NOT EXISTS versions (
  key        TEXT    NOT NULL REFERENCES prompts(key),
  number     INTEGER NOT NULL,
  content    BLOB    NOT NULL,
  created_at INTEGER NOT NULL,
  message    BLOB,
  PRIMARY KEY (key, number)
);

CREATE TABLE IF NOT EXISTS tags (
  key     TEXT    NOT NULL,
  name    TEXT    NOT NULL,
  version INTEGER NOT NULL,
  PRIMARY KEY (key, name),
  FOREIGN KEY (key, version) REFERENCES versions(key, number)
);
)SQL";

    exec(kSchema);
}

// ---- Single mutations

void DatabaseManager::insertPrompt(const Prompt& prompt) {
    auto stmt = prepare("INSERT INTO prompts(key) VALUES(?);", "insertPrompt");
    int rc = bind_text(stmt.get(), 1, prompt.key);
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind key: ") + sqlite3_errmsg(m_db));
    stepDone(stmt.get(), "insertPrompt");

    for (const auto& v : prompt.versions) insertVersion(prompt.key, v);
    for (const auto& [name, target] : prompt.tags) upsertTag(prompt.key, name, target);
}

void DatabaseManager::insertVersion(const std::string& key, const Version& version) {
    const char* sql = R"SQL(
        INSERT INTO versions(key, number, content, created_at, message)
        VALUES(?, ?, ?, ?, ?);
    )SQL";
    auto stmt = prepare(sql, "insertVersion");

    int rc = bind_text(stmt.get(), 1, key);
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind key: ") + sqlite3_errmsg(m_db));

    rc = sqlite3_bind_int64(stmt.get(), 2, version.number);
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind number: ") + sqlite3_errmsg(m_db));

    rc = bind_bytes(stmt.get(), 3, version.content);
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind content: ") + sqlite3_errmsg(m_db));

    rc = sqlite3_bind_int64(stmt.get(), 4, version.createdAt);
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind created_at: ") + sqlite3_errmsg(m_db));

    rc = version.message ? bind_bytes(stmt.get(), 5, *version.message)
                         : sqlite3_bind_null(stmt.get(), 5);
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind message: ") + sqlite3_errmsg(m_db));

    stepDone(stmt.get(), "insertVersion");
}

void DatabaseManager::upsertTag(const std::string& key, const std::string& name, std::uint32_t version) {
    const char* sql =
        "INSERT INTO tags(key, name, version) VALUES(?, ?, ?) "
        "ON CONFLICT(key, name) DO UPDATE SET version=excluded.version;";
    auto stmt = prepare(sql, "upsertTag");

    int rc = bind_text(stmt.get(), 1, key);
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind key: ") + sqlite3_errmsg(m_db));

    rc = bind_text(stmt.get(), 2, name);
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind name: ") + sqlite3_errmsg(m_db));

    rc = sqlite3_bind_int64(stmt.get(), 3, version);
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind version: ") + sqlite3_errmsg(m_db));

    stepDone(stmt.get(), "upsertTag");
}

// ---- Whole-vault operations

VaultStore DatabaseManager::loadVault() const {
    std::map<std::string, Prompt> byKey;
    int rc = 0;

    {
        auto stmt = prepare("SELECT key FROM prompts ORDER BY key;", "loadVault prompts");
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            const std::string key = read_text_nullable(stmt.get(), 0);
            byKey[key].key = key;
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("step loadVault prompts: ") + sqlite3_errmsg(m_db));
        }
    }

    {
        const char* sql = R"SQL(
            SELECT key, number, content, created_at, message
            FROM versions
            ORDER BY key, number;
        )SQL";
        auto stmt = prepare(sql, "loadVault versions");
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            Prompt& p = byKey[read_text_nullable(stmt.get(), 0)];
            Version v;
            v.number    = read_version_number(stmt.get(), 1);
            v.content   = read_bytes(stmt.get(), 2);
            v.createdAt = sqlite3_column_int64(stmt.get(), 3);
            if (sqlite3_column_type(stmt.get(), 4) != SQLITE_NULL) {
                v.message = read_bytes(stmt.get(), 4);
            }
            p.versions.push_back(std::move(v));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("step loadVault versions: ") + sqlite3_errmsg(m_db));
        }
    }

    {
        auto stmt = prepare("SELECT key, name, version FROM tags;", "loadVault tags");
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            Prompt& p = byKey[read_text_nullable(stmt.get(), 0)];
            p.tags[read_text_nullable(stmt.get(), 1)] = read_version_number(stmt.get(), 2);
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("step loadVault tags: ") + sqlite3_errmsg(m_db));
        }
    }

    std::vector<Prompt> prompts;
    prompts.reserve(byKey.size());
    for (auto& entry : byKey) {
        entry.second.key = entry.first;
        prompts.push_back(std::move(entry.second));
    }
    return VaultStore::fromPrompts(std::move(prompts));
}

void DatabaseManager::replaceVault(const VaultStore& store) {
    beginTransaction();
    try {
        exec("DELETE FROM tags; DELETE FROM versions; DELETE FROM prompts;");
        for (const auto& entry : store.prompts()) insertPrompt(entry.second);
        commit();
    } catch (...) {
        rollback();
        throw;
    }
}

void DatabaseManager::beginTransaction() { exec("BEGIN IMMEDIATE;"); }
void DatabaseManager::commit()           { exec("COMMIT;"); }
void DatabaseManager::rollback()         { exec("ROLLBACK;"); }
