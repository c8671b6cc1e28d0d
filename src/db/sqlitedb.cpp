// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "db/sqlitedb.h"

#include "utilstrencodings.h"

#include <stdexcept>
#include <string.h>

//
// SQLiteDatabase
//

SQLiteDatabase::SQLiteDatabase(const fs::path& db_path, bool mock)
    : m_mock(mock)
{
    if (mock) {
        // In-memory database for testing
        int rc = sqlite3_open(":memory:", &m_db);
        if (rc != SQLITE_OK) {
            sqlite3_close(m_db);
            m_db = nullptr;
            throw std::runtime_error("SQLiteDatabase: Failed to open in-memory database");
        }
        if (!SetupSchema()) {
            sqlite3_close(m_db);
            m_db = nullptr;
            throw std::runtime_error("SQLiteDatabase: Failed to set up schema");
        }
        return;
    }

    if (fs::is_directory(db_path) || !db_path.has_extension()) {
        m_dir = db_path;
        m_path = db_path / DEFAULT_DB_FILENAME;
    } else {
        m_dir = db_path.parent_path();
        m_path = db_path;
    }

    if (!m_dir.empty()) {
        fsbridge::TryCreateDirectories(m_dir);
    }

    int rc = sqlite3_open(m_path.string().c_str(), &m_db);
    if (rc != SQLITE_OK) {
        std::string strErr = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error(strprintf("SQLiteDatabase: Failed to open database %s: %s", m_path.string(), strErr));
    }

    LogPrintf("Using SQLite leaderboard database: %s (SQLite %s)\n", m_path.string(), sqlite3_libversion());

    if (!SetupPragmas() || !SetupSchema()) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error(strprintf("SQLiteDatabase: Failed to initialise %s", m_path.string()));
    }
}

SQLiteDatabase::~SQLiteDatabase()
{
    Flush(true);
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

bool SQLiteDatabase::SetupPragmas()
{
    if (!m_db) return false;

    // WAL mode for concurrent reads + crash recovery
    const char* pragmas =
        "PRAGMA journal_mode = WAL;"
        "PRAGMA synchronous = FULL;"
        "PRAGMA busy_timeout = 5000;";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, pragmas, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteDatabase: pragma error: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SQLiteDatabase::SetupSchema()
{
    if (!m_db) return false;

    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS main (
            key BLOB PRIMARY KEY,
            value BLOB NOT NULL
        ) WITHOUT ROWID;
    )";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, schema, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteDatabase: schema error: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }

    return true;
}

bool SQLiteDatabase::Backup(const std::string& strDest)
{
    if (m_mock || !m_db) {
        return false;
    }

    // Flush before backup
    Flush(false);

    fs::path pathDest(strDest);
    if (fs::is_directory(pathDest)) {
        pathDest /= m_path.filename();
    }

    sqlite3* pBackup = nullptr;
    int rc = sqlite3_open(pathDest.string().c_str(), &pBackup);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteDatabase::Backup: Cannot create backup file %s\n", pathDest.string());
        sqlite3_close(pBackup);
        return false;
    }

    sqlite3_backup* backup = sqlite3_backup_init(pBackup, "main", m_db, "main");
    if (!backup) {
        LogPrintf("SQLiteDatabase::Backup: sqlite3_backup_init failed: %s\n", sqlite3_errmsg(pBackup));
        sqlite3_close(pBackup);
        return false;
    }

    rc = sqlite3_backup_step(backup, -1);  // Copy all pages
    sqlite3_backup_finish(backup);
    sqlite3_close(pBackup);

    if (rc != SQLITE_DONE) {
        LogPrintf("SQLiteDatabase::Backup: sqlite3_backup_step failed: %d\n", rc);
        return false;
    }

    LogPrintf("SQLiteDatabase::Backup: copied %s to %s\n", m_path.string(), pathDest.string());
    return true;
}

void SQLiteDatabase::Flush(bool shutdown)
{
    if (!m_db || m_mock) return;

    // SQLite with WAL mode auto-checkpoints, but we can force it
    int rc = sqlite3_wal_checkpoint_v2(m_db, nullptr, shutdown ? SQLITE_CHECKPOINT_TRUNCATE : SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LogPrint(FWLog::DB, "SQLiteDatabase::Flush: checkpoint returned %d\n", rc);
    }
}

bool SQLiteDatabase::VerifyDatabaseFile(const fs::path& file_path, std::string& warningStr, std::string& errorStr)
{
    fs::path dbFile = file_path;
    if (fs::is_directory(file_path)) {
        dbFile = file_path / DEFAULT_DB_FILENAME;
    }

    if (!fs::exists(dbFile)) {
        // File doesn't exist yet, that's fine
        return true;
    }

    // Try to open and verify
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(dbFile.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        errorStr = strprintf("Cannot open database file %s: %s", dbFile.string(), db ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close(db);
        return false;
    }

    // Run integrity check
    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db, "PRAGMA integrity_check", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        errorStr = strprintf("Cannot check database file %s: %s", dbFile.string(), sqlite3_errmsg(db));
        sqlite3_close(db);
        return false;
    }
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const char* result = (const char*)sqlite3_column_text(stmt, 0);
        if (result && strcmp(result, "ok") != 0) {
            warningStr = strprintf("Database file integrity check warning: %s", result);
        }
    }
    sqlite3_finalize(stmt);

    sqlite3_close(db);
    return true;
}

//
// SQLiteBatch
//

SQLiteBatch::SQLiteBatch(SQLiteDatabase& database, const char* pszMode)
    : m_db(nullptr), fReadOnly(false), m_database(&database)
{
    fReadOnly = (!strchr(pszMode, '+') && !strchr(pszMode, 'w'));

    m_db = database.GetDb();

    if (m_db && !SetupStatements()) {
        std::string strErr = sqlite3_errmsg(m_db);
        FinalizeStatements();
        throw std::runtime_error(strprintf("SQLiteBatch: Failed to prepare statements: %s", strErr));
    }
}

bool SQLiteBatch::SetupStatements()
{
    if (!m_db) return false;

    struct {
        sqlite3_stmt** stmt;
        const char* sql;
    } statements[] = {
        {&m_read_stmt, "SELECT value FROM main WHERE key = ?"},
        // INSERT, fails if exists
        {&m_write_stmt, "INSERT INTO main (key, value) VALUES (?, ?)"},
        {&m_overwrite_stmt, "INSERT OR REPLACE INTO main (key, value) VALUES (?, ?)"},
        {&m_delete_stmt, "DELETE FROM main WHERE key = ?"},
        {&m_exists_stmt, "SELECT COUNT(*) FROM main WHERE key = ?"},
        {&m_cursor_stmt, "SELECT key, value FROM main ORDER BY key"},
        {&m_prefix_cursor_stmt, "SELECT key, value FROM main WHERE substr(key, 1, ?2) = ?1 ORDER BY key"},
    };

    for (const auto& s : statements) {
        if (sqlite3_prepare_v2(m_db, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            LogPrintf("SQLiteBatch: prepare failed for \"%s\": %s\n", s.sql, sqlite3_errmsg(m_db));
            return false;
        }
    }
    return true;
}

void SQLiteBatch::FinalizeStatements()
{
    if (m_read_stmt) { sqlite3_finalize(m_read_stmt); m_read_stmt = nullptr; }
    if (m_write_stmt) { sqlite3_finalize(m_write_stmt); m_write_stmt = nullptr; }
    if (m_overwrite_stmt) { sqlite3_finalize(m_overwrite_stmt); m_overwrite_stmt = nullptr; }
    if (m_delete_stmt) { sqlite3_finalize(m_delete_stmt); m_delete_stmt = nullptr; }
    if (m_exists_stmt) { sqlite3_finalize(m_exists_stmt); m_exists_stmt = nullptr; }
    if (m_cursor_stmt) { sqlite3_finalize(m_cursor_stmt); m_cursor_stmt = nullptr; }
    if (m_prefix_cursor_stmt) { sqlite3_finalize(m_prefix_cursor_stmt); m_prefix_cursor_stmt = nullptr; }
    m_active_cursor = nullptr;
}

void SQLiteBatch::Flush()
{
    if (m_database) {
        m_database->Flush(false);
    }
}

void SQLiteBatch::Close()
{
    if (m_in_txn) {
        LogPrintf("SQLiteBatch::Close: rolling back unfinished transaction\n");
        TxnAbort();
    }

    FinalizeStatements();

    if (m_database) {
        Flush();
    }

    m_db = nullptr;
}

bool SQLiteBatch::StartCursor()
{
    if (!m_cursor_stmt) return false;
    sqlite3_reset(m_cursor_stmt);
    m_active_cursor = m_cursor_stmt;
    return true;
}

bool SQLiteBatch::StartPrefixCursor(const CDataStream& ssPrefix)
{
    if (!m_prefix_cursor_stmt) return false;
    m_cursor_prefix.assign(ssPrefix.begin(), ssPrefix.end());

    sqlite3_reset(m_prefix_cursor_stmt);
    sqlite3_bind_blob(m_prefix_cursor_stmt, 1, m_cursor_prefix.data(), m_cursor_prefix.size(), SQLITE_STATIC);
    sqlite3_bind_int(m_prefix_cursor_stmt, 2, (int)m_cursor_prefix.size());
    m_active_cursor = m_prefix_cursor_stmt;
    return true;
}

bool SQLiteBatch::ReadAtCursor(CDataStream& ssKey, CDataStream& ssValue, bool& complete)
{
    if (!m_active_cursor) {
        complete = true;
        return false;
    }

    int res = sqlite3_step(m_active_cursor);
    if (res == SQLITE_DONE) {
        complete = true;
        return false;
    }
    if (res != SQLITE_ROW) {
        LogPrintf("SQLiteBatch::ReadAtCursor: step failed: %s\n", sqlite3_errmsg(m_db));
        complete = true;
        return false;
    }

    // Get key
    const void* keyData = sqlite3_column_blob(m_active_cursor, 0);
    int keySize = sqlite3_column_bytes(m_active_cursor, 0);

    // Get value
    const void* valueData = sqlite3_column_blob(m_active_cursor, 1);
    int valueSize = sqlite3_column_bytes(m_active_cursor, 1);

    if (!keyData || !valueData) {
        complete = true;
        return false;
    }

    ssKey.SetType(SER_DISK);
    ssKey.clear();
    ssKey.write((const char*)keyData, keySize);

    ssValue.SetType(SER_DISK);
    ssValue.clear();
    ssValue.write((const char*)valueData, valueSize);

    complete = false;
    return true;
}

void SQLiteBatch::CloseCursor()
{
    if (m_active_cursor) {
        sqlite3_reset(m_active_cursor);
    }
    m_active_cursor = nullptr;
}

bool SQLiteBatch::ExecStatement(const char* pszSql)
{
    if (!m_db) return false;
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, pszSql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteBatch: %s failed: %s\n", pszSql, errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SQLiteBatch::TxnBegin()
{
    if (m_in_txn) return false;
    if (!ExecStatement("BEGIN TRANSACTION")) return false;
    m_in_txn = true;
    return true;
}

bool SQLiteBatch::TxnCommit()
{
    if (!m_in_txn) return false;
    if (!ExecStatement("COMMIT")) return false;
    m_in_txn = false;
    return true;
}

bool SQLiteBatch::TxnAbort()
{
    if (!m_in_txn) return false;
    m_in_txn = false;
    return ExecStatement("ROLLBACK");
}
